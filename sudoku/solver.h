#ifndef _sudoku_solver_h_included_
#define _sudoku_solver_h_included_

#include "board.h"


namespace sudoku {


// Propagation first, depth-first search (recursing back here) when propagation
// stalls. Returns the first solution found, throws solve_error_t otherwise.
board_t solve(board_t board, unsigned depth = 0);


} // namespace sudoku

#endif
