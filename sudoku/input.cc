#include "input.h"

#include "error.h"
#include "logging.h"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>


namespace sudoku {


board_t read_board(std::istream& is)
{
	std::vector<uint8_t> digits;
	digits.reserve(cells_count);
	for (auto iter = std::istreambuf_iterator<char>(is); iter != std::istreambuf_iterator<char>(); ++iter) {
		char const c = *iter;
		if (c >= '0' && c <= '9') {
			digits.push_back(c - '0');
		}
	}

	if (digits.size() != cells_count) {
		throw solve_error_t(
			error_kind_t::input_shape,
			"invalid data: expected " + std::to_string(cells_count) + " digits, got " + std::to_string(digits.size())
		);
	}

	board_t::data_t data;
	for (idx_t idx = 0; idx < cells_count; ++idx) {
		data.at(idx) = cell_t::from_digit(digits.at(idx));
	}
	return board_t(data);
}


board_t load_board(const std::string& path)
{
	std::ifstream in(path, std::ios::binary);
	if (!in)
		throw std::runtime_error("cannot open input file: " + path);
	SUDOKU_LOG(debug) << "reading " << path;
	return read_board(in);
}


} // namespace sudoku
