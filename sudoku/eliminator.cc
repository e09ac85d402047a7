#include "eliminator.h"

#include "error.h"
#include "logging.h"


namespace sudoku {


void throw_duplicate(num_t n, idx_t cell, idx_t peer)
{
	throw solve_error_t(
		error_kind_t::duplicate,
		"duplicate value " + std::to_string(n) + ": " + cell_name(cell) + " conflicts with " + cell_name(peer)
	);
}


// exclude the value of every solved cell from its peers
// returns true if all cells are solved
bool solve_exclusions(board_t& board)
{
	bool all_solved = true;
	for (idx_t idx = 0; idx < cells_count; ++idx) {
		auto const sv = board.at(idx).is_solved();
		if (!sv) {
			all_solved = false;
			continue;
		}
		for_each_peer(idx, [&](idx_t peer) {
			if (peer == idx) {
				return;
			}
			auto& cell = board.at(peer);
			if (auto const peer_sv = cell.is_solved()) {
				if (*peer_sv == *sv) {
					throw_duplicate(*sv, peer, idx);
				}
			} else {
				cell.candidates().try_exclude(*sv);
			}
		});
	}
	return all_solved;
}


// promote every single-candidate cell
// returns true if at least one cell was promoted
bool solve_singles(board_t& board)
{
	bool progress = false;
	for (idx_t idx = 0; idx < cells_count; ++idx) {
		auto& cell = board.at(idx);
		if (cell.is_solved()) {
			continue;
		}
		const auto& cands = cell.candidates();
		if (cands.empty()) {
			throw solve_error_t(error_kind_t::unsolvable, "unsolvable " + cell_name(idx));
		}
		auto const single = cands.single();
		if (!single) {
			continue;
		}

		for_each_peer(idx, [&](idx_t peer) {
			auto const peer_sv = board.at(peer).is_solved();
			if (peer_sv && *peer_sv == *single) {
				throw_duplicate(*single, idx, peer);
			}
		});

		cell = cell_t::make_solved(*single);
		progress = true;
	}
	return progress;
}


bool eliminate(board_t& board, unsigned depth)
{
	for (size_t iter = 1; ; ++iter) {
		if (solve_exclusions(board)) {
			SUDOKU_LOG(debug) << "[" << depth << "] all cells solved, passes: " << iter;
			return true;
		}
		if (!solve_singles(board)) {
			SUDOKU_LOG(debug) << "[" << depth << "] no cell could be solved, passes: " << iter;
			return false;
		}
	}
}


} // namespace sudoku
