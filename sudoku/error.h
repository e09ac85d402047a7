#ifndef _sudoku_error_h_included_
#define _sudoku_error_h_included_

#include <iosfwd>
#include <stdexcept>
#include <string>


namespace sudoku {


enum class error_kind_t {
	input_shape, // wrong number of digits in the input
	unsolvable, // a cell ran out of candidates
	duplicate, // a value would appear twice in a row, column or square
	exhausted // every candidate of the branching cell failed
};

const char* error_kind_name(error_kind_t kind);
std::ostream& operator<<(std::ostream&, error_kind_t);


class solve_error_t : public std::runtime_error {
	error_kind_t const kind_;
public:
	solve_error_t(error_kind_t kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
	error_kind_t kind() const { return kind_; }
};


} // namespace sudoku

#endif
