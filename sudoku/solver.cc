#include "solver.h"

#include "eliminator.h"
#include "error.h"
#include "logging.h"
#include "searcher.h"

#include <sstream>


namespace sudoku {


board_t solve(board_t board, unsigned depth)
{
	SUDOKU_LOG(debug) << "[" << depth << "] trying elimination";
	try {
		if (eliminate(board, depth)) {
			return board;
		}
	} catch (const solve_error_t& e) {
		SUDOKU_LOG(debug) << "[" << depth << "] elimination failed: " << e.what();
		throw;
	}

	SUDOKU_LOG(trace) << "[" << depth << "] elimination stalled:\n" << [&] {
		std::ostringstream os;
		board.print_detailed(os);
		return os.str();
	}();

	SUDOKU_LOG(debug) << "[" << depth << "] trying depth first search";
	try {
		return search(board, depth, solve);
	} catch (const solve_error_t& e) {
		SUDOKU_LOG(debug) << "[" << depth << "] depth first search failed: " << e.what();
		throw;
	}
}


} // namespace sudoku
