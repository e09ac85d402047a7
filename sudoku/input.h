#ifndef _sudoku_input_h_included_
#define _sudoku_input_h_included_

#include "board.h"

#include <iosfwd>
#include <string>


namespace sudoku {


// Keeps '0'..'9' and skips every other byte. Exactly 81 digits are expected,
// otherwise solve_error_t(input_shape) is thrown.
board_t read_board(std::istream&);

board_t load_board(const std::string& path);


} // namespace sudoku

#endif
