#include "error.h"

#include <ostream>


namespace sudoku {


const char* error_kind_name(error_kind_t kind)
{
	switch (kind) {
		case error_kind_t::input_shape:
			return "input_shape";
		case error_kind_t::unsolvable:
			return "unsolvable";
		case error_kind_t::duplicate:
			return "duplicate";
		case error_kind_t::exhausted:
			return "exhausted";
	}
	throw std::logic_error("Unknown error kind");
}


std::ostream& operator<<(std::ostream& os, error_kind_t kind)
{
	return os << error_kind_name(kind);
}


} // namespace sudoku
