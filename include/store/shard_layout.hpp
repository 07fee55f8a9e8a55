#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "store/store_error.hpp"

namespace rsbackup {
namespace store {

// Naming scheme for the files of a backup record under the backup root:
//   <root>/<name>             primary data
//   <root>/<name>.md          metadata
//   <root>/<name>.parity.<i>  parity shard i, 1-based
class ShardLayout {
public:
  static constexpr const char* METADATA_SUFFIX = ".md";
  static constexpr const char* PARITY_INFIX = ".parity.";

  // ---- CONSTRUCTOR ----
  explicit ShardLayout(std::filesystem::path root);


  // ---- PATH COMPUTATION ----
  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path data_path(const std::string& name) const;
  std::filesystem::path metadata_path(const std::string& name) const;
  // Throws std::out_of_range for index 0
  std::filesystem::path parity_path(const std::string& name, size_t index) const;


  // ---- QUERY OPERATIONS ----
  // Record names in ascending order, parity files excluded.
  // Throws InternalError when the root cannot be read.
  std::vector<std::string> list() const;


  // ---- NAME RULES ----
  // True for names ending in "parity.<digits>"
  static bool is_parity_file(const std::string& filename);
  // Throws BadRequestError for empty names, "." and "..", or names containing '/'
  static void validate_name(const std::string& name);

private:
  std::filesystem::path root_;
};

} // namespace store
} // namespace rsbackup
