#define BOOST_TEST_MODULE solver_tests
#include <boost/test/included/unit_test.hpp>

#include "error.h"
#include "input.h"
#include "solver.h"

#include <array>
#include <sstream>
#include <string>

using namespace sudoku;

board_t parse(const std::string& s)
{
	std::istringstream is(s);
	return read_board(is);
}

// every given of "puzzle" is kept in "solution"
bool keeps_givens(const board_t& puzzle, const board_t& solution)
{
	for (idx_t idx = 0; idx < cells_count; ++idx) {
		auto const given = puzzle.at(idx).is_solved();
		if (given && solution.at(idx).is_solved() != given) {
			return false;
		}
	}
	return true;
}

const std::array<std::string, 4> sudoku_samples{
	// easy 299
	"008036200\n"
	"000002900\n"
	"020718050\n"
	"009204035\n"
	"030070009\n"
	"000000600\n"
	"000000840\n"
	"005109370\n"
	"640007501\n",

	// moderate 108237
	"000000000\n"
	"065000741\n"
	"300008000\n"
	"004600000\n"
	"006700420\n"
	"002050036\n"
	"000000150\n"
	"000000003\n"
	"591070000\n",

	// moderate 119032
	"100000500\n"
	"057000000\n"
	"000308004\n"
	"045000000\n"
	"000000000\n"
	"006007089\n"
	"000090842\n"
	"000002090\n"
	"690030001\n",

	// needs search
	"800000000\n"
	"003600000\n"
	"070090200\n"
	"050007000\n"
	"000045700\n"
	"000100030\n"
	"001000068\n"
	"008500010\n"
	"090000400\n"
};

BOOST_AUTO_TEST_CASE(test_solve_classic)
{
	auto const solved = solve(parse(
		"530070000600195000098000060800060003400803001700020006060000280000419005000080079"
	));
	std::ostringstream os;
	solved.print(os);
	BOOST_TEST(os.str() ==
		"534678912\n"
		"672195348\n"
		"198342567\n"
		"859761423\n"
		"426853791\n"
		"713924856\n"
		"961537284\n"
		"287419635\n"
		"345286179\n"
	);
}

BOOST_AUTO_TEST_CASE(test_solve_full_samples)
{
	for (const auto& str : sudoku_samples) {
		auto const puzzle = parse(str);
		auto const solved = solve(puzzle);
		BOOST_TEST(verify(solved));
		BOOST_TEST(keeps_givens(puzzle, solved));
	}
}

BOOST_AUTO_TEST_CASE(test_solve_with_search)
{
	auto const solved = solve(parse(sudoku_samples.at(3)));
	BOOST_TEST((solved == parse(
		"812753649"
		"943682175"
		"675491283"
		"154237896"
		"369845721"
		"287169534"
		"521974368"
		"438526917"
		"796318452"
	)));
}

BOOST_AUTO_TEST_CASE(test_solve_idempotent)
{
	for (const auto& str : sudoku_samples) {
		auto const once = solve(parse(str));
		auto const twice = solve(once);
		BOOST_TEST((once == twice));
	}
}

BOOST_AUTO_TEST_CASE(test_solve_empty_board)
{
	auto const solved = solve(board_t());
	BOOST_TEST(verify(solved));
}

BOOST_AUTO_TEST_CASE(test_solve_duplicate_given)
{
	try {
		solve(parse("500000000\n000000000\n000000000\n500000000\n" + std::string(45, '0')));
		BOOST_FAIL("solved a contradictory puzzle");
	} catch (const solve_error_t& e) {
		BOOST_TEST(e.kind() == error_kind_t::duplicate);
	}
}

BOOST_AUTO_TEST_CASE(test_solve_unsolvable_cell)
{
	try {
		solve(parse("012345678000000000000000000000000000900000000" + std::string(36, '0')));
		BOOST_FAIL("solved a contradictory puzzle");
	} catch (const solve_error_t& e) {
		BOOST_TEST(e.kind() == error_kind_t::unsolvable);
		BOOST_TEST(std::string(e.what()) == "unsolvable cell 0 (row 0, col 0)");
	}
}

BOOST_AUTO_TEST_CASE(test_solve_no_solution)
{
	// the search puzzle with a wrong, but not directly conflicting, value at cell 1
	try {
		solve(parse("820000000003600000070090200050007000000045700000100030001000068008500010090000400"));
		BOOST_FAIL("solved a puzzle without solution");
	} catch (const solve_error_t& e) {
		BOOST_TEST(e.kind() == error_kind_t::exhausted);
	}
}
