#include "searcher.h"

#include "error.h"
#include "logging.h"

#include <utility>


namespace sudoku {


std::optional<idx_t> pick_cell(const board_t& board)
{
	std::optional<idx_t> best;
	size_t best_count = N + 1;
	for (idx_t idx = 0; idx < cells_count; ++idx) {
		const auto& cell = board.at(idx);
		if (cell.is_solved()) {
			continue;
		}
		auto const count = cell.candidates().count();
		if (count < best_count) {
			best = idx;
			best_count = count;
		}
	}
	return best;
}


board_t search(const board_t& board, unsigned depth, const solve_fn_t& solve)
{
	auto const idx = pick_cell(board);
	if (!idx) {
		SUDOKU_LOG(debug) << "[" << depth << "] already solved";
		return board;
	}

	std::optional<board_t> result;
	board.at(*idx).candidates().for_each([&](num_t n) {
		if (result) {
			return;
		}
		board_t assumed(board);
		assumed.at(*idx) = cell_t::make_solved(n);
		SUDOKU_LOG(debug) << "[" << depth << "] assuming " << cell_name(*idx) << " = " << static_cast<unsigned>(n);
		try {
			result = solve(std::move(assumed), depth + 1);
		} catch (const solve_error_t& e) {
			SUDOKU_LOG(debug) << "[" << depth << "] could not solve: " << e.what();
		}
	});

	if (!result) {
		throw solve_error_t(error_kind_t::exhausted, "all assumptions contradicted at " + cell_name(*idx));
	}
	return *result;
}


} // namespace sudoku
