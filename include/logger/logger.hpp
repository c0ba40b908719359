#ifndef NETFILE_LOGGER_HPP
#define NETFILE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace netfile {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces every sink with a file sink, timestamped with severity
void init_logging(const std::string& log_file = "netfile.log",
                  severity_level min_level = severity_level::info);

// Replaces every sink with a console sink on std::clog
void init_console_logging(severity_level min_level = severity_level::info);

void set_log_level(severity_level min_level);

// Drops every record, components keep logging without effect
void disable_logging();

// Accepts trace, debug, info, warning, error and fatal in any case.
// Throws CONFIG_ERROR for anything else.
severity_level parse_log_level(const std::string& text);

} // namespace logging
} // namespace netfile

#endif // NETFILE_LOGGER_HPP
