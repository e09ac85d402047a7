#ifndef _sudoku_searcher_h_included_
#define _sudoku_searcher_h_included_

#include "board.h"

#include <functional>
#include <optional>


namespace sudoku {


using solve_fn_t = std::function<board_t(board_t, unsigned)>;

// Undetermined cell with the fewest candidates, lowest index on ties.
// std::nullopt if every cell is solved.
std::optional<idx_t> pick_cell(const board_t&);

// Depth-first search: assumes each candidate of pick_cell() in ascending order
// and hands a copy of the board to "solve". The first board "solve" returns is
// the result; solve_error_t from "solve" moves on to the next candidate.
// Throws solve_error_t(exhausted) when no candidate works.
board_t search(const board_t& board, unsigned depth, const solve_fn_t& solve);


} // namespace sudoku

#endif
