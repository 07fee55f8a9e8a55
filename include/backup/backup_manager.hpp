#ifndef RSBACKUP_BACKUP_MANAGER_HPP
#define RSBACKUP_BACKUP_MANAGER_HPP

#include <cstdint>
#include <ctime>
#include <functional>
#include <filesystem>
#include <istream>
#include <ostream>
#include <set>
#include <string>
#include <vector>
#include "codec/erasure_codec.hpp"
#include "store/metadata_store.hpp"
#include "store/shard_layout.hpp"
#include "store/store_error.hpp"

namespace rsbackup::backup {

struct BackupConfig {
  std::filesystem::path backup_root = ".";
  size_t data_shards = 10;
  size_t parity_shards = 3;
  // Bytes per shard coded in one pass; bounds memory to stripe_size * shards
  size_t stripe_size = 64 * 1024;
};

// Lifecycle of a record as seen by the manager
enum class RecordState {
  Absent,
  Submitting,
  Complete,
  Healthy,
  Degraded,
  Repairing
};

const char* record_state_to_string(RecordState state);

struct SubmitResult {
  uint64_t size = 0;
  std::vector<std::string> hashes;
  size_t data_shards = 0;
  size_t parity_shards = 0;
};

struct CheckResult {
  std::string name;
  // Modification time of the data file, "YYYY-MM-DD HH:MM:SS" local time
  std::string last_modified;
  bool healthy = false;
  // Reference hashes from the metadata
  std::vector<std::string> hashes;
  std::set<size_t> corrupt_shards;
};

enum class RepairStatus {
  AlreadyHealthy,
  Repaired
};

struct RepairResult {
  std::string name;
  RepairStatus status = RepairStatus::AlreadyHealthy;
  std::set<size_t> repaired_shards;
};

struct RetrieveInfo {
  std::filesystem::path path;
  uint64_t size = 0;
  std::time_t modified_time = 0;
};

// Drives submit, check, repair, retrieve and list for records under one
// backup root. Holds no mutable state: concurrent callers coordinate through
// exclusive file creation only.
class BackupManager {
public:

  // ---- CONSTRUCTOR ----
  // Throws std::invalid_argument when the codec rejects the shard counts
  explicit BackupManager(BackupConfig config,
                         codec::CodecFactory codec_factory = codec::make_reed_solomon);


  // ---- RECORD OPERATIONS ----
  // Stores input as a new record: data file, parity files, then metadata.
  // Not transactional; a failure leaves the artifacts written so far.
  SubmitResult submit(const std::string& name, std::istream& input);
  // Compares every shard against its reference hash; never writes
  CheckResult check(const std::string& name) const;
  // Rebuilds corrupt shards in place; throws store::UnrecoverableError when
  // more shards are corrupt than there are parity shards
  RepairResult repair(const std::string& name);
  // Locates the data file; no integrity check
  RetrieveInfo retrieve(const std::string& name) const;
  // Streams the data file verbatim, returns bytes written
  uint64_t retrieve(const std::string& name, std::ostream& output) const;
  std::vector<std::string> list() const;


  // ---- GETTERS ----
  const BackupConfig& config() const { return config_; }
  const store::ShardLayout& layout() const { return layout_; }

private:
  struct ShardScan;

  BackupConfig config_;
  codec::CodecFactory codec_factory_;
  store::ShardLayout layout_;
  store::MetadataStore metadata_store_;

  // Fails with AlreadyExistsError if any artifact of name is present
  void ensure_name_free(const std::string& name) const;
  // Opens a record and classifies each shard as healthy or corrupt
  ShardScan scan_record(const std::string& name, bool writable) const;
  void hash_shards(ShardScan& scan) const;
  // Reconstructs the absent shards stripe by stripe and hands each rebuilt
  // block to sink as (shard index, offset in shard, block)
  void rebuild_shards(ShardScan& scan, const std::vector<bool>& present,
                      const std::function<void(size_t, uint64_t, const std::vector<uint8_t>&)>& sink) const;
  void log_transition(const std::string& name, RecordState from, RecordState to) const;
};

} // namespace rsbackup::backup

#endif // RSBACKUP_BACKUP_MANAGER_HPP
