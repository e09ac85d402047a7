#ifndef _sudoku_options_h_included_
#define _sudoku_options_h_included_

#include "logging.h"

#include <iosfwd>
#include <string>


namespace sudoku {


struct options_t {
	std::string input_path;
	logging::severity_t log_level = logging::default_severity;
	bool show_help = false;
	bool show_version = false;
};

// Command line first, then SUDOKU_LOG_LEVEL from the environment.
// Throws boost::program_options::error on bad input.
options_t parse_options(int argc, const char* const argv[]);

void print_usage(std::ostream&);


} // namespace sudoku

#endif
