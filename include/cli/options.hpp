#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace rsbackup {
namespace cli {

struct ProgramOptions {
  // ---- SERVER ----
  std::string ip = "127.0.0.1";
  uint16_t port = 44987;
  // 0 until parsed, then at least 1
  size_t threads = 0;
  std::string cert_path;
  std::string key_path;

  // ---- STORAGE ----
  std::string backup_root = ".";
  size_t data_shards = 10;
  size_t parity_shards = 3;

  // ---- LOGGING ----
  std::string log_file;
  bool debug = false;
  bool timestamp_logging = false;

  bool help = false;
  bool valid = false;
  // Set when valid is false
  std::string error;

  bool use_tls() const { return !cert_path.empty() && !key_path.empty(); }
};

// Parses "--flag value" pairs and bare switches. Never throws; problems are
// reported through valid and error.
ProgramOptions parse_command_line(int argc, const char* const argv[]);

void print_usage(std::ostream& out, const std::string& program_name);

} // namespace cli
} // namespace rsbackup
