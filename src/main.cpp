#include "backup/backup_manager.hpp"
#include "cli/options.hpp"
#include "http/backup_api.hpp"
#include "http/router.hpp"
#include "logger/logger.hpp"
#include "network/http_server.hpp"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>

namespace {

bool run_server(const rsbackup::cli::ProgramOptions& options) {
  std::error_code ec;
  if (!std::filesystem::is_directory(options.backup_root, ec)) {
    BOOST_LOG_TRIVIAL(fatal) << "Backup root " << options.backup_root << " is not a directory";
    return false;
  }

  try {
    rsbackup::backup::BackupConfig config;
    config.backup_root = options.backup_root;
    config.data_shards = options.data_shards;
    config.parity_shards = options.parity_shards;
    rsbackup::backup::BackupManager manager(config);

    rsbackup::http::Router router;
    rsbackup::http::BackupApi api(manager);
    api.register_routes(router);

    rsbackup::network::HttpServer server(options.ip, options.port, router, options.threads);
    if (options.use_tls() && !server.enable_tls(options.cert_path, options.key_path)) {
      return false;
    }
    if (!options.use_tls()) {
      BOOST_LOG_TRIVIAL(warning) << "No certificate given, serving plain HTTP";
    }
    if (!server.start_listener()) {
      return false;
    }

    // Block until asked to stop
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& error, int signal) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Received signal " << signal << ", shutting down";
      }
    });
    signals_context.run();

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Failed to start backup service: " << e.what();
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = rsbackup::cli::parse_command_line(argc, argv);
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    rsbackup::cli::print_usage(std::cerr, argv[0]);
    return 1;
  }
  if (options.help) {
    rsbackup::cli::print_usage(std::cout, argv[0]);
    return 0;
  }

  rsbackup::logging::LogOptions log_options;
  log_options.debug = options.debug;
  log_options.timestamps = options.timestamp_logging;
  log_options.log_file = options.log_file;
  rsbackup::logging::init_logging(log_options);

  BOOST_LOG_TRIVIAL(info) << "Starting backup service on " << options.ip << ":" << options.port
                          << " with " << options.data_shards << "+" << options.parity_shards << " shards";
  return run_server(options) ? 0 : 1;
}
