#include "logging.h"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iostream>


namespace sudoku {
namespace logging {


void init(severity_t min_severity)
{
	namespace bl = boost::log;

	auto core = bl::core::get();
	core->remove_all_sinks();
	bl::add_console_log(
		std::clog,
		bl::keywords::format = (
			bl::expressions::stream << "[" << bl::trivial::severity << "] " << bl::expressions::smessage
		)
	);
	core->set_filter(bl::trivial::severity >= min_severity);
}


} // namespace logging
} // namespace sudoku
