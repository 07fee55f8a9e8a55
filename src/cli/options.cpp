#include "cli/options.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace rsbackup {
namespace cli {

namespace {

constexpr size_t MAX_TOTAL_SHARDS = 256;

bool parse_number(const std::string& text, unsigned long long max, unsigned long long& out) {
  if (text.empty() || text.front() == '-' || text.front() == '+') {
    return false;
  }
  try {
    size_t consumed = 0;
    unsigned long long value = std::stoull(text, &consumed);
    if (consumed != text.size() || value > max) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

ProgramOptions fail(ProgramOptions options, const std::string& error) {
  options.valid = false;
  options.error = error;
  return options;
}

} // namespace

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [options]\n"
      << "Server:\n"
      << "  --ip <address>          Listen address (default 127.0.0.1)\n"
      << "  --port <port>           Listen port (default 44987)\n"
      << "  --threads <n>           I/O threads (default: hardware concurrency)\n"
      << "  --cert-path <file>      TLS certificate chain, PEM\n"
      << "  --key-path <file>       TLS private key, PEM\n"
      << "Storage:\n"
      << "  --backup-root <dir>     Directory holding the records (default .)\n"
      << "  --data-shards <n>       Data shards per record (default 10)\n"
      << "  --parity-shards <n>     Parity shards per record (default 3)\n"
      << "Logging:\n"
      << "  --log-file <file>       Also write logs to this file\n"
      << "  --debug                 Log debug messages\n"
      << "  --timestamp-logging     Prefix log lines with the time\n"
      << "  -h, --help              Show this message\n"
      << "Example: " << program_name << " --port 8443 --cert-path cert.pem --key-path key.pem\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[]) {
  const std::unordered_set<std::string> switches = {
    "--debug", "--timestamp-logging", "-h", "--help"
  };
  const std::unordered_set<std::string> valued = {
    "--ip", "--port", "--threads", "--cert-path", "--key-path",
    "--backup-root", "--data-shards", "--parity-shards", "--log-file"
  };

  ProgramOptions options;
  std::unordered_map<std::string, std::string> values;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (switches.count(flag) != 0) {
      if (flag == "--debug") {
        options.debug = true;
      } else if (flag == "--timestamp-logging") {
        options.timestamp_logging = true;
      } else {
        options.help = true;
      }
      continue;
    }
    if (valued.count(flag) == 0) {
      return fail(options, "Unknown argument: " + flag);
    }
    if (i + 1 >= argc) {
      return fail(options, "Missing value for " + flag);
    }
    values[flag] = argv[++i];
  }

  if (options.help) {
    options.valid = true;
    return options;
  }

  unsigned long long number = 0;
  for (const auto& [flag, value] : values) {
    if (flag == "--ip") {
      options.ip = value;
    } else if (flag == "--cert-path") {
      options.cert_path = value;
    } else if (flag == "--key-path") {
      options.key_path = value;
    } else if (flag == "--backup-root") {
      options.backup_root = value;
    } else if (flag == "--log-file") {
      options.log_file = value;
    } else if (flag == "--port") {
      if (!parse_number(value, std::numeric_limits<uint16_t>::max(), number) || number == 0) {
        return fail(options, "Invalid port number: " + value);
      }
      options.port = static_cast<uint16_t>(number);
    } else if (flag == "--threads") {
      if (!parse_number(value, 1024, number) || number == 0) {
        return fail(options, "Invalid thread count: " + value);
      }
      options.threads = static_cast<size_t>(number);
    } else if (flag == "--data-shards") {
      if (!parse_number(value, MAX_TOTAL_SHARDS, number) || number == 0) {
        return fail(options, "Invalid data shard count: " + value);
      }
      options.data_shards = static_cast<size_t>(number);
    } else if (flag == "--parity-shards") {
      if (!parse_number(value, MAX_TOTAL_SHARDS, number)) {
        return fail(options, "Invalid parity shard count: " + value);
      }
      options.parity_shards = static_cast<size_t>(number);
    }
  }

  if (options.data_shards + options.parity_shards > MAX_TOTAL_SHARDS) {
    return fail(options, "At most " + std::to_string(MAX_TOTAL_SHARDS) + " shards in total are supported");
  }
  if (options.cert_path.empty() != options.key_path.empty()) {
    return fail(options, "TLS needs both --cert-path and --key-path");
  }
  if (options.ip.empty()) {
    return fail(options, "Listen address must not be empty");
  }
  if (options.threads == 0) {
    options.threads = std::max(1u, std::thread::hardware_concurrency());
  }

  options.valid = true;
  return options;
}

} // namespace cli
} // namespace rsbackup
