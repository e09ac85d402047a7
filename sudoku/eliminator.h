#ifndef _sudoku_eliminator_h_included_
#define _sudoku_eliminator_h_included_

#include "board.h"


namespace sudoku {


// Naked-single propagation, repeated until nothing more can be derived.
// Returns true when every cell is solved, false when propagation stalls.
// Throws solve_error_t (unsolvable, duplicate) on contradiction.
// "depth" is log context only.
bool eliminate(board_t& board, unsigned depth);


} // namespace sudoku

#endif
