#ifndef _sudoku_board_h_included_
#define _sudoku_board_h_included_

#include <array>
#include <bitset>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>

#include <assert.h>


namespace sudoku {


constexpr size_t N = 9;
constexpr size_t cells_count = N * N;

using num_t = uint8_t; // 1..9
using idx_t = size_t; // 0..80, row-major

inline size_t idx_row(idx_t idx) { return idx / N; }
inline size_t idx_col(idx_t idx) { return idx % N; }
inline idx_t make_idx(size_t row, size_t col) { return row * N + col; }

// "cell 12 (row 1, col 3)", the only cell notation used in diagnostics
std::string cell_name(idx_t idx);


using bitset_t = std::bitset<N>;

class numset_t {
	bitset_t bits_; // bit (n-1) stands for digit n
public:
	numset_t() : bits_() {}
	numset_t(std::initializer_list<num_t> nums);

	static numset_t make_full()
	{
		numset_t r;
		r.bits_.set();
		return r;
	}

	size_t count() const { return bits_.count(); }
	bool empty() const { return bits_.none(); }

	bool has(num_t n) const
	{
		assert(n >= 1 && n <= N);
		return bits_.test(n - 1);
	}

	void insert(num_t n)
	{
		assert(n >= 1 && n <= N);
		bits_.set(n - 1);
	}

	bool try_exclude(num_t n)
	{
		assert(n >= 1 && n <= N);
		if (bits_.test(n - 1)) {
			bits_.reset(n - 1);
			return true;
		}
		return false;
	}

	std::optional<num_t> single() const;

	// ascending order
	template <typename F>
	void for_each(F&& f) const
	{
		for (num_t n = 1; n <= N; ++n) {
			if (bits_.test(n - 1)) {
				f(n);
			}
		}
	}

	bool operator==(const numset_t& other) const { return bits_ == other.bits_; }
	bool operator!=(const numset_t& other) const { return !(*this == other); }
};


class cell_t {
	std::optional<num_t> value_;
	numset_t cands_; // meaningful only while value_ is empty
public:
	// undetermined, all nine candidates
	cell_t() : cands_(numset_t::make_full()) {}

	static cell_t make_solved(num_t n);
	static cell_t make_undetermined() { return cell_t(); }
	static cell_t make_undetermined(const numset_t& cands);

	// 0 -> undetermined, 1..9 -> solved
	static cell_t from_digit(uint8_t d);

	std::optional<num_t> is_solved() const { return value_; }

	const numset_t& candidates() const
	{
		assert(!value_);
		return cands_;
	}
	numset_t& candidates()
	{
		assert(!value_);
		return cands_;
	}

	char print() const { return value_ ? static_cast<char>('0' + *value_) : ' '; }

	bool operator==(const cell_t& other) const;
	bool operator!=(const cell_t& other) const { return !(*this == other); }
};


class board_t {
public:
	using data_t = std::array<cell_t, cells_count>;

	board_t() = default;
	explicit board_t(const data_t& data) : data_(data) {}

	cell_t& at(idx_t idx) { return data_.at(idx); }
	const cell_t& at(idx_t idx) const { return data_.at(idx); }

	void print(std::ostream&) const;
	void print_detailed(std::ostream&) const;

	bool operator==(const board_t& other) const { return data_ == other.data_; }
	bool operator!=(const board_t& other) const { return !(*this == other); }
private:
	data_t data_;
};

std::ostream& operator<<(std::ostream&, const board_t&);


// every cell solved, every row, column and square holds 1..9 once
bool verify(const board_t&);


struct iterator_base_t {
	bool is_valid() const { return mutable_idx_ < N; }
	void next() { ++mutable_idx_; }
protected:
	explicit iterator_base_t(size_t fixed) : fixed_idx_(fixed) {}
	size_t const fixed_idx_;
	size_t mutable_idx_ = 0;
};

struct iterator_over_row_t : public iterator_base_t {
	explicit iterator_over_row_t(idx_t cell) : iterator_base_t(idx_row(cell)) {}
	idx_t idx() const { return make_idx(fixed_idx_, mutable_idx_); } // row is fixed
};

struct iterator_over_column_t : public iterator_base_t {
	explicit iterator_over_column_t(idx_t cell) : iterator_base_t(idx_col(cell)) {}
	idx_t idx() const { return make_idx(mutable_idx_, fixed_idx_); }
};

struct iterator_over_sq_t {
	explicit iterator_over_sq_t(idx_t cell)
		: fixed_row_(idx_row(cell) / 3 * 3)
		, fixed_col_(idx_col(cell) / 3 * 3)
		, r_(fixed_row_)
		, c_(fixed_col_)
		{}
	idx_t idx() const { return make_idx(r_, c_); }
	bool is_valid() const { return (c_ < fixed_col_ + 3) && (r_ < fixed_row_ + 3); }
	void next()
	{
		++c_;
		if (c_ >= fixed_col_ + 3) {
			c_ = fixed_col_;
			++r_;
		}
	}
private:
	size_t const fixed_row_;
	size_t const fixed_col_;
	size_t r_;
	size_t c_;
};


// visits row, column and square of "cell"; "cell" itself is visited three times
template <typename F>
void for_each_peer(idx_t cell, F&& f)
{
	for (auto iter = iterator_over_row_t(cell); iter.is_valid(); iter.next()) {
		f(iter.idx());
	}
	for (auto iter = iterator_over_column_t(cell); iter.is_valid(); iter.next()) {
		f(iter.idx());
	}
	for (auto iter = iterator_over_sq_t(cell); iter.is_valid(); iter.next()) {
		f(iter.idx());
	}
}


} // namespace sudoku

#endif
