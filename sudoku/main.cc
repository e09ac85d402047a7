#include "error.h"
#include "input.h"
#include "logging.h"
#include "options.h"
#include "solver.h"

#include <exception>
#include <iostream>

#ifndef SUDOKU_VERSION
#define SUDOKU_VERSION "unknown"
#endif

int main(int argc, char* argv[])
{
	try {
		auto const opts = sudoku::parse_options(argc, argv);
		if (opts.show_help) {
			sudoku::print_usage(std::cout);
			return 0;
		}
		if (opts.show_version) {
			std::cout << "sudoku " << SUDOKU_VERSION << "\n";
			return 0;
		}

		sudoku::logging::init(opts.log_level);

		auto const board = sudoku::solve(sudoku::load_board(opts.input_path));
		board.print(std::cout);
		return 0;

	} catch (const sudoku::solve_error_t& e) {
		std::cerr << "Error (" << e.kind() << "): " << e.what() << "\n";
		return 1;
	} catch (const std::exception& e) {
		std::cerr << "Error: " << e.what() << "\n";
		return 1;
	}
}
