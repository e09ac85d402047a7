#include "board.h"

#include <iostream>
#include <sstream>
#include <stdexcept>


namespace sudoku {


std::string cell_name(idx_t idx)
{
	std::ostringstream os;
	os << "cell " << idx << " (row " << idx_row(idx) << ", col " << idx_col(idx) << ")";
	return os.str();
}


numset_t::numset_t(std::initializer_list<num_t> nums)
{
	for (const num_t n : nums) {
		if (n < 1 || n > N)
			throw std::logic_error("Num out of range");
		bits_.set(n - 1);
	}
}


std::optional<num_t> numset_t::single() const
{
	if (bits_.count() != 1) {
		return std::nullopt;
	}
	for (num_t n = 1; n <= N; ++n) {
		if (bits_.test(n - 1)) {
			return n;
		}
	}
	assert(!"unreachable code");
	return std::nullopt;
}


cell_t cell_t::make_solved(num_t n)
{
	if (n < 1 || n > N)
		throw std::logic_error("Solved value out of range");
	cell_t r;
	r.value_ = n;
	r.cands_ = numset_t();
	return r;
}


cell_t cell_t::make_undetermined(const numset_t& cands)
{
	cell_t r;
	r.cands_ = cands;
	return r;
}


cell_t cell_t::from_digit(uint8_t d)
{
	if (d == 0)
		return make_undetermined();
	if (d <= N)
		return make_solved(d);
	// the input filter lets only '0'..'9' through
	throw std::logic_error("Cell digit out of range");
}


bool cell_t::operator==(const cell_t& other) const
{
	if (value_ || other.value_) {
		return value_ == other.value_;
	}
	return cands_ == other.cands_;
}


void board_t::print(std::ostream& os) const
{
	for (size_t row = 0; row < N; ++row) {
		for (size_t col = 0; col < N; ++col) {
			os << at(make_idx(row, col)).print();
		}
		os << '\n';
	}
}


void board_t::print_detailed(std::ostream& os) const
{
	std::array<std::array<char, N*3>, N*3> data_sets; // TODO without additional storage
	for (size_t r=0; r<N; ++r) {
		for (size_t c=0; c<N; ++c) {
			const auto& cell = at(make_idx(r, c));
			auto const sv = cell.is_solved();
			for (num_t n=1; n<=N; ++n) {
				bool const show = sv ? (*sv == n) : cell.candidates().has(n);
				data_sets.at(r*3 + (n-1)/3).at(c*3 + (n-1)%3) = (show ? '0'+n : ' ');
			}
		}
	}
	for (size_t r=0; r<data_sets.size(); ++r) {
		const auto& row = data_sets.at(r);
		os << " ";
		for (size_t c=0; c<row.size(); ++c) {
			os << row.at(c);
			if (c%9 == 8) {
				if (c < N*3-1) {
					os << "  |||  ";
				}
			} else if (c%3 == 2) {
				os << " | ";
			}
		}
		os << "\n";
		constexpr size_t div_len = 61;
		if (r%9 == 8) {
			if (r < N*3-1) {
				os << "\n";
				for (size_t i=0; i<div_len; ++i) os << "=";
				os << "\n\n";
			}
		} else if (r%3 == 2) {
			for (size_t i=0; i<div_len; ++i) os << "-";
			os << "\n";
		}
	}
}


std::ostream& operator<<(std::ostream& os, const board_t& board)
{
	board.print(os);
	return os;
}


template <typename Iter>
bool verify_impl(const board_t& board, Iter iter)
{
	numset_t seen;
	for (; iter.is_valid(); iter.next()) {
		auto const sv = board.at(iter.idx()).is_solved();
		if (!sv || seen.has(*sv)) {
			return false;
		}
		seen.insert(*sv);
	}
	return seen == numset_t::make_full();
}


bool verify(const board_t& board)
{
	bool verified = true;
	for (size_t i=0; i<N; ++i) {
		verified = verify_impl(board, iterator_over_row_t(make_idx(i, 0))) && verified;
		verified = verify_impl(board, iterator_over_column_t(make_idx(0, i))) && verified;
		verified = verify_impl(board, iterator_over_sq_t(make_idx(i / 3 * 3, i % 3 * 3))) && verified;
	}
	return verified;
}


} // namespace sudoku
