#ifndef CHAINVAULT_LOGGER_HPP
#define CHAINVAULT_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace chainvault::logger {

// Installs a synchronous text file sink (and optionally a console sink)
// and filters out records below min_level. Replaces any existing sinks.
void init_logging(const std::string& log_file,
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info,
                  bool console = false);

// Flushes and removes every sink
void shutdown_logging();

} // namespace chainvault::logger

#endif // CHAINVAULT_LOGGER_HPP
