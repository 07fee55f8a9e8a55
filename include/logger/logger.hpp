#ifndef RSBACKUP_LOGGER_HPP
#define RSBACKUP_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace rsbackup::logging {

struct LogOptions {
  // Lowers the threshold from info to debug
  bool debug = false;
  // Prefixes every line with the local date and time
  bool timestamps = false;
  // Mirrors the console output into this file when set
  std::string log_file;
};

boost::log::trivial::severity_level min_severity(const LogOptions& options);

// Replaces any installed sinks with a console sink and an optional file sink.
void init_logging(const LogOptions& options);

} // namespace rsbackup::logging

#endif // RSBACKUP_LOGGER_HPP
