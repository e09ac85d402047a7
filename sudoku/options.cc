#include "options.h"

#include <boost/program_options.hpp>

#include <ostream>


namespace sudoku {


namespace po = boost::program_options;


po::options_description make_description()
{
	po::options_description desc("Options");
	desc.add_options()
		("help,h", "print this message")
		("version,V", "print version")
		("log-level,l", po::value<logging::severity_t>(), "trace, debug, info, warning, error or fatal (env: SUDOKU_LOG_LEVEL)")
		("input", po::value<std::string>(), "file with the 81 cell values, 0 for unknown")
	;
	return desc;
}


options_t parse_options(int argc, const char* const argv[])
{
	auto const desc = make_description();
	po::positional_options_description pos;
	pos.add("input", 1);

	po::variables_map vm;
	po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
	po::store(
		po::parse_environment(desc, [](const std::string& var) -> std::string {
			return var == "SUDOKU_LOG_LEVEL" ? "log-level" : "";
		}),
		vm
	);
	po::notify(vm);

	options_t opts;
	opts.show_help = vm.count("help") > 0;
	opts.show_version = vm.count("version") > 0;
	if (vm.count("log-level")) {
		opts.log_level = vm["log-level"].as<logging::severity_t>();
	}
	if (vm.count("input")) {
		opts.input_path = vm["input"].as<std::string>();
	} else if (!opts.show_help && !opts.show_version) {
		throw po::required_option("input");
	}
	return opts;
}


void print_usage(std::ostream& os)
{
	os << "Usage: sudoku [options] <input>\n\n" << make_description();
}


} // namespace sudoku
