#include "logger/logger.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

namespace rsbackup::logging {

namespace {

namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;

template <typename Sink>
void set_format(Sink& sink, bool timestamps) {
  if (timestamps) {
    sink.set_formatter(
        expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S")
            << " [" << boost::log::trivial::severity << "] "
            << expr::smessage);
  } else {
    sink.set_formatter(
        expr::stream
            << "[" << boost::log::trivial::severity << "] "
            << expr::smessage);
  }
}

} // namespace

boost::log::trivial::severity_level min_severity(const LogOptions& options) {
  return options.debug ? boost::log::trivial::debug : boost::log::trivial::info;
}

void init_logging(const LogOptions& options) {
  auto core = boost::log::core::get();
  core->remove_all_sinks();
  boost::log::add_common_attributes();

  // Console sink
  using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
  auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
  console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  console_backend->auto_flush(true);
  auto console = boost::make_shared<console_sink>(console_backend);
  set_format(*console, options.timestamps);
  core->add_sink(console);

  // File sink, appended so restarts keep history
  if (!options.log_file.empty()) {
    std::filesystem::path log_path = std::filesystem::absolute(options.log_file);
    auto file_backend = boost::make_shared<sinks::text_file_backend>();
    file_backend->set_file_name_pattern(log_path.string());
    file_backend->set_open_mode(std::ios::out | std::ios::app);
    file_backend->auto_flush(true);

    using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
    auto file = boost::make_shared<file_sink>(file_backend);
    set_format(*file, options.timestamps);
    core->add_sink(file);
  }

  core->set_filter(boost::log::trivial::severity >= min_severity(options));
  core->set_logging_enabled(true);

  BOOST_LOG_TRIVIAL(debug) << "Logger: Initialized"
                           << (options.log_file.empty() ? "" : " with file " + options.log_file);
}

} // namespace rsbackup::logging
