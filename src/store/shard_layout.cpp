#include "store/shard_layout.hpp"
#include <algorithm>
#include <regex>
#include <system_error>
#include <utility>
#include <boost/log/trivial.hpp>

namespace rsbackup {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

ShardLayout::ShardLayout(std::filesystem::path root) : root_(std::move(root)) {
  BOOST_LOG_TRIVIAL(debug) << "Shard layout: Using backup root " << root_.string();
}


//==============================================
// PATH COMPUTATION
//==============================================

std::filesystem::path ShardLayout::data_path(const std::string& name) const {
  return root_ / name;
}

std::filesystem::path ShardLayout::metadata_path(const std::string& name) const {
  return root_ / (name + METADATA_SUFFIX);
}

// Parity files are numbered from 1
std::filesystem::path ShardLayout::parity_path(const std::string& name, size_t index) const {
  if (index == 0) {
    throw std::out_of_range("Shard layout: Parity indices start at 1");
  }
  return root_ / (name + PARITY_INFIX + std::to_string(index));
}


//==============================================
// QUERY OPERATIONS
//==============================================

// Sorted file names under the root, parity files excluded
std::vector<std::string> ShardLayout::list() const {
  BOOST_LOG_TRIVIAL(debug) << "Shard layout: Listing files in " << root_.string();

  std::error_code ec;
  std::filesystem::directory_iterator it(root_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Shard layout: Cannot list " << root_.string() << ": " << ec.message();
    throw InternalError("Shard layout: Cannot list backup root: " + ec.message());
  }

  std::vector<std::string> names;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::string name = it->path().filename().string();
    if (!is_parity_file(name)) {
      names.push_back(std::move(name));
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Shard layout: Listing " << root_.string() << " failed: " << ec.message();
    throw InternalError("Shard layout: Listing backup root failed: " + ec.message());
  }

  std::sort(names.begin(), names.end());
  return names;
}


//==============================================
// NAME RULES
//==============================================

bool ShardLayout::is_parity_file(const std::string& filename) {
  static const std::regex parity_pattern(R"(parity\.\d+$)");
  return std::regex_search(filename, parity_pattern);
}

// Names must stay a single path component
void ShardLayout::validate_name(const std::string& name) {
  if (name.empty()) {
    throw BadRequestError("Shard layout: Empty record name");
  }
  if (name.find('/') != std::string::npos) {
    throw BadRequestError("Shard layout: Record name '" + name + "' contains '/'");
  }
  if (name.find('\0') != std::string::npos) {
    throw BadRequestError("Shard layout: Record name contains a NUL byte");
  }
  if (name == "." || name == "..") {
    throw BadRequestError("Shard layout: Record name '" + name + "' is reserved");
  }
}

} // namespace store
} // namespace rsbackup
