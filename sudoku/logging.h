#ifndef _sudoku_logging_h_included_
#define _sudoku_logging_h_included_

#include <boost/log/trivial.hpp>


namespace sudoku {
namespace logging {


using severity_t = boost::log::trivial::severity_level;

constexpr severity_t default_severity = boost::log::trivial::warning;

// One console sink on std::clog, messages below "min_severity" are dropped.
// Safe to call more than once, the previous sink is replaced.
void init(severity_t min_severity);


} // namespace logging
} // namespace sudoku

#define SUDOKU_LOG(sev) BOOST_LOG_TRIVIAL(sev)

#endif
