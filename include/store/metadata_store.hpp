#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "store/shard_layout.hpp"
#include "store/store_error.hpp"

namespace rsbackup {
namespace store {

// Binds a record to its shard counts, original size and reference hashes
struct Metadata {
  uint64_t size = 0;
  size_t data_shards = 0;
  size_t parity_shards = 0;
  // One hex SHA-256 per shard, data shards first
  std::vector<std::string> hashes;

  size_t total_shards() const { return data_shards + parity_shards; }
};

// Write-once JSON descriptors, one per record
class MetadataStore {
public:

  // ---- CONSTRUCTOR ----
  explicit MetadataStore(const ShardLayout& layout);


  // ---- CORE STORAGE OPERATIONS ----
  // Creates <name>.md exclusively; AlreadyExistsError when present
  void write(const std::string& name, const Metadata& metadata);
  // NotFoundError when absent, CorruptError when undecodable or inconsistent
  Metadata read(const std::string& name) const;


  // ---- QUERY OPERATIONS ----
  bool exists(const std::string& name) const;


  // ---- ENCODING ----
  static std::string encode(const Metadata& metadata);
  // Throws CorruptError
  static Metadata decode(const std::string& json);

private:
  const ShardLayout& layout_;
};

} // namespace store
} // namespace rsbackup
