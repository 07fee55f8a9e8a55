#include "backup/backup_manager.hpp"
#include "crypto/hasher.hpp"
#include "store/chunker.hpp"
#include "store/file_handle.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <boost/log/trivial.hpp>

namespace rsbackup::backup {

namespace {

// Local time as "YYYY-MM-DD HH:MM:SS"
std::string format_time(std::time_t time) {
  std::tm local{};
  localtime_r(&time, &local);
  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

// Human readable shard name for log lines, parity shards counted from 1
std::string shard_label(size_t index, size_t data_shards) {
  if (index < data_shards) {
    return "data shard " + std::to_string(index);
  }
  return "parity shard " + std::to_string(index - data_shards + 1);
}

} // namespace

const char* record_state_to_string(RecordState state) {
  switch (state) {
    case RecordState::Absent: return "Absent";
    case RecordState::Submitting: return "Submitting";
    case RecordState::Complete: return "Complete";
    case RecordState::Healthy: return "Healthy";
    case RecordState::Degraded: return "Degraded";
    case RecordState::Repairing: return "Repairing";
    default: return "Unknown";
  }
}

// Open files, shard windows and hash verdicts of one record
struct BackupManager::ShardScan {
  store::Metadata metadata;
  uint64_t shard_size = 0;
  std::unique_ptr<codec::ErasureCodec> codec;
  // Heap allocated so the windows can point at them
  std::unique_ptr<store::FileHandle> data_file;
  std::vector<std::unique_ptr<store::FileHandle>> parity_files;
  // Data windows then parity windows; empty for a missing parity file
  std::vector<std::optional<store::ShardWindow>> windows;
  std::vector<std::string> current_hashes;
  std::set<size_t> corrupt;
};


//==============================================
// CONSTRUCTOR
//==============================================

// Validate the configuration once so bad shard counts fail at startup
BackupManager::BackupManager(BackupConfig config, codec::CodecFactory codec_factory)
  : config_(std::move(config))
  , codec_factory_(std::move(codec_factory))
  , layout_(config_.backup_root)
  , metadata_store_(layout_) {

  if (config_.stripe_size == 0) {
    throw std::invalid_argument("Backup manager: Stripe size must be at least 1");
  }
  // Rejects shard counts the codec cannot serve before any record is touched
  codec_factory_(config_.data_shards, config_.parity_shards);

  std::error_code ec;
  if (!std::filesystem::is_directory(config_.backup_root, ec)) {
    BOOST_LOG_TRIVIAL(warning) << "Backup manager: Backup root " << config_.backup_root.string()
                               << " is not a directory";
  }
  BOOST_LOG_TRIVIAL(info) << "Backup manager: Initialized with " << config_.data_shards << " data and "
                          << config_.parity_shards << " parity shards at " << config_.backup_root.string();
}


//==============================================
// RECORD OPERATIONS
//==============================================

// Store a new record: data file, parity files, then metadata
SubmitResult BackupManager::submit(const std::string& name, std::istream& input) {
  store::ShardLayout::validate_name(name);
  ensure_name_free(name);
  log_transition(name, RecordState::Absent, RecordState::Submitting);

  // Copy the upload into the data file; exclusive creation doubles as the lock
  auto data_file = std::make_unique<store::FileHandle>(layout_.data_path(name),
                                                       store::FileHandle::Mode::CreateExclusive);
  std::vector<char> buffer(config_.stripe_size);
  uint64_t size = 0;
  while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
    const size_t count = static_cast<size_t>(input.gcount());
    data_file->write_at(size, reinterpret_cast<const uint8_t*>(buffer.data()), count);
    size += count;
  }
  if (input.bad()) {
    throw store::InternalError("Backup manager: Failed reading upload for '" + name + "'");
  }
  BOOST_LOG_TRIVIAL(debug) << "Backup manager: Stored " << size << " bytes for " << name;

  const size_t data_count = config_.data_shards;
  const size_t parity_count = config_.parity_shards;

  // Claim every parity file before any coding work
  std::vector<std::unique_ptr<store::FileHandle>> parity_files;
  for (size_t i = 1; i <= parity_count; ++i) {
    parity_files.push_back(std::make_unique<store::FileHandle>(layout_.parity_path(name, i),
                                                               store::FileHandle::Mode::CreateExclusive));
  }

  auto codec = codec_factory_(data_count, parity_count);
  const uint64_t shard_size = store::Chunker::shard_size(size, data_count);
  auto windows = store::Chunker::split(*data_file, size, data_count);

  std::vector<crypto::Sha256> hashers(data_count + parity_count);
  codec::ShardBlocks data_blocks(data_count);
  codec::ShardBlocks parity_blocks(parity_count);

  // Encode and hash one stripe of every shard at a time
  for (uint64_t offset = 0; offset < shard_size; offset += config_.stripe_size) {
    const size_t length = static_cast<size_t>(std::min<uint64_t>(config_.stripe_size, shard_size - offset));
    for (size_t i = 0; i < data_count; ++i) {
      data_blocks[i].resize(length);
      windows[i].read(offset, data_blocks[i].data(), length);
      hashers[i].update(data_blocks[i].data(), length);
    }
    for (auto& block : parity_blocks) {
      block.assign(length, 0);
    }
    codec->encode(data_blocks, parity_blocks);
    for (size_t i = 0; i < parity_count; ++i) {
      parity_files[i]->write_at(offset, parity_blocks[i].data(), length);
      hashers[data_count + i].update(parity_blocks[i].data(), length);
    }
  }

  store::Metadata metadata;
  metadata.size = size;
  metadata.data_shards = data_count;
  metadata.parity_shards = parity_count;
  for (auto& hasher : hashers) {
    metadata.hashes.push_back(hasher.hex_digest());
  }
  metadata_store_.write(name, metadata);
  log_transition(name, RecordState::Submitting, RecordState::Complete);

  SubmitResult result;
  result.size = size;
  result.hashes = metadata.hashes;
  result.data_shards = data_count;
  result.parity_shards = parity_count;
  return result;
}

// Compare every shard against its recorded hash without writing
CheckResult BackupManager::check(const std::string& name) const {
  ShardScan scan = scan_record(name, false);

  CheckResult result;
  result.name = name;
  result.last_modified = format_time(scan.data_file->modified_time());
  result.healthy = scan.corrupt.empty();
  result.hashes = scan.metadata.hashes;
  result.corrupt_shards = scan.corrupt;

  BOOST_LOG_TRIVIAL(info) << "Backup manager: Checked " << name << ": "
                          << record_state_to_string(result.healthy ? RecordState::Healthy : RecordState::Degraded)
                          << " (" << scan.corrupt.size() << " corrupt shards)";
  return result;
}

// Rebuild corrupt shards from the healthy ones
RepairResult BackupManager::repair(const std::string& name) {
  ShardScan scan = scan_record(name, true);
  const size_t data_count = scan.metadata.data_shards;
  const size_t parity_count = scan.metadata.parity_shards;
  const size_t total = scan.metadata.total_shards();

  RepairResult result;
  result.name = name;
  if (scan.corrupt.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Backup manager: " << name << " is already healthy";
    result.status = RepairStatus::AlreadyHealthy;
    return result;
  }
  if (scan.corrupt.size() > parity_count) {
    BOOST_LOG_TRIVIAL(error) << "Backup manager: " << name << " has " << scan.corrupt.size()
                             << " corrupt shards but only " << parity_count << " parity shards";
    throw store::UnrecoverableError(scan.corrupt.size(), parity_count);
  }
  log_transition(name, RecordState::Degraded, RecordState::Repairing);

  std::vector<bool> present(total, true);
  for (size_t index : scan.corrupt) {
    present[index] = false;
  }

  // First pass only hashes the rebuilt shards, so a bad rebuild leaves the files untouched
  std::map<size_t, crypto::Sha256> hashers;
  for (size_t index : scan.corrupt) {
    hashers.emplace(index, crypto::Sha256());
  }
  rebuild_shards(scan, present, [&hashers](size_t index, uint64_t, const std::vector<uint8_t>& block) {
    hashers.at(index).update(block.data(), block.size());
  });

  for (auto& [index, hasher] : hashers) {
    const std::string rebuilt = hasher.hex_digest();
    if (rebuilt != scan.metadata.hashes[index]) {
      BOOST_LOG_TRIVIAL(error) << "Backup manager: Rebuilt " << shard_label(index, data_count) << " of " << name
                               << " hashes to " << rebuilt << ", expected " << scan.metadata.hashes[index];
      throw store::InternalError("Backup manager: Reconstructed " + shard_label(index, data_count) +
                                 " of '" + name + "' does not match its recorded hash");
    }
  }

  // Corrupt parity files are rewritten whole at the expected length
  for (size_t index : scan.corrupt) {
    if (index < data_count) {
      continue;
    }
    const size_t parity_index = index - data_count;
    if (!scan.parity_files[parity_index]) {
      BOOST_LOG_TRIVIAL(debug) << "Backup manager: Recreating missing " << shard_label(index, data_count);
      scan.parity_files[parity_index] = std::make_unique<store::FileHandle>(
          layout_.parity_path(name, parity_index + 1), store::FileHandle::Mode::CreateOrOpen);
    }
    scan.parity_files[parity_index]->truncate(scan.shard_size);
    scan.windows[index].emplace(*scan.parity_files[parity_index], 0, scan.shard_size, scan.shard_size);
  }

  // Second pass writes the verified shards back
  rebuild_shards(scan, present, [&scan](size_t index, uint64_t offset, const std::vector<uint8_t>& block) {
    scan.windows[index]->write(offset, block.data(), block.size());
  });
  for (size_t index : scan.corrupt) {
    BOOST_LOG_TRIVIAL(info) << "Backup manager: Repaired " << shard_label(index, data_count) << " of " << name;
  }

  log_transition(name, RecordState::Repairing, RecordState::Healthy);
  result.status = RepairStatus::Repaired;
  result.repaired_shards = scan.corrupt;
  return result;
}

// Locate the data file for streaming by the caller
RetrieveInfo BackupManager::retrieve(const std::string& name) const {
  store::ShardLayout::validate_name(name);

  store::FileHandle file(layout_.data_path(name), store::FileHandle::Mode::Read);
  RetrieveInfo info;
  info.path = file.path();
  info.size = file.size();
  info.modified_time = file.modified_time();

  BOOST_LOG_TRIVIAL(debug) << "Backup manager: Located " << name << " (" << info.size << " bytes)";
  return info;
}

// Copy the data file verbatim, one stripe at a time
uint64_t BackupManager::retrieve(const std::string& name, std::ostream& output) const {
  store::ShardLayout::validate_name(name);

  store::FileHandle file(layout_.data_path(name), store::FileHandle::Mode::Read);
  std::vector<uint8_t> buffer(config_.stripe_size);
  uint64_t written = 0;
  while (true) {
    const size_t count = file.read_at(written, buffer.data(), buffer.size());
    if (count == 0) {
      break;
    }
    output.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(count));
    if (!output.good()) {
      throw store::InternalError("Backup manager: Failed writing '" + name + "' to the output stream");
    }
    written += count;
  }

  BOOST_LOG_TRIVIAL(info) << "Backup manager: Retrieved " << name << " (" << written << " bytes)";
  return written;
}

// Record names, parity files filtered out
std::vector<std::string> BackupManager::list() const {
  return layout_.list();
}


//==============================================
// RECORD INSPECTION
//==============================================

// Refuse a name while any artifact of it is on disk
void BackupManager::ensure_name_free(const std::string& name) const {
  if (metadata_store_.exists(name)) {
    BOOST_LOG_TRIVIAL(warning) << "Backup manager: Refusing to overwrite metadata of " << name;
    throw store::AlreadyExistsError("Backup manager: '" + name + "' already exists (" +
                                    layout_.metadata_path(name).filename().string() + ")");
  }

  std::vector<std::filesystem::path> artifacts{layout_.data_path(name)};
  for (size_t i = 1; i <= config_.parity_shards; ++i) {
    artifacts.push_back(layout_.parity_path(name, i));
  }

  for (const auto& path : artifacts) {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(path, ec);
    if (std::filesystem::exists(status)) {
      BOOST_LOG_TRIVIAL(warning) << "Backup manager: Refusing to overwrite " << path.string();
      throw store::AlreadyExistsError("Backup manager: '" + name + "' already exists (" +
                                      path.filename().string() + ")");
    }
  }
}

// Open every file of a record and classify each shard as healthy or corrupt
BackupManager::ShardScan BackupManager::scan_record(const std::string& name, bool writable) const {
  store::ShardLayout::validate_name(name);
  const auto mode = writable ? store::FileHandle::Mode::ReadWrite : store::FileHandle::Mode::Read;

  ShardScan scan;
  scan.data_file = std::make_unique<store::FileHandle>(layout_.data_path(name), mode);
  try {
    scan.metadata = metadata_store_.read(name);
  } catch (const store::NotFoundError&) {
    BOOST_LOG_TRIVIAL(error) << "Backup manager: Data file for " << name << " has no metadata";
    throw store::InternalError("Backup manager: Inconsistent record '" + name +
                               "': data file present but metadata missing");
  }

  const store::Metadata& metadata = scan.metadata;
  const size_t data_count = metadata.data_shards;
  const size_t parity_count = metadata.parity_shards;
  scan.codec = codec_factory_(data_count, parity_count);
  scan.shard_size = store::Chunker::shard_size(metadata.size, data_count);

  // A data file shorter than the recorded size cannot back its last shards.
  // Windows holding only padding have nothing on disk to lose.
  std::set<size_t> short_shards;
  const uint64_t physical_size = scan.data_file->size();
  for (auto& window : store::Chunker::split(*scan.data_file, metadata.size, data_count)) {
    if (window.data_length() > 0 && window.offset() + window.data_length() > physical_size) {
      short_shards.insert(scan.windows.size());
    }
    scan.windows.emplace_back(window);
  }

  // Missing or resized parity files are corrupt shards, not errors
  for (size_t i = 1; i <= parity_count; ++i) {
    const size_t index = data_count + i - 1;
    std::unique_ptr<store::FileHandle> file;
    try {
      file = std::make_unique<store::FileHandle>(layout_.parity_path(name, i), mode);
    } catch (const store::NotFoundError&) {
      BOOST_LOG_TRIVIAL(warning) << "Backup manager: Missing " << shard_label(index, data_count) << " of " << name;
    }

    if (file) {
      if (file->size() != scan.shard_size) {
        short_shards.insert(index);
      }
      scan.windows.emplace_back(std::in_place, *file, 0, scan.shard_size, scan.shard_size);
    } else {
      short_shards.insert(index);
      scan.windows.emplace_back(std::nullopt);
    }
    scan.parity_files.push_back(std::move(file));
  }

  hash_shards(scan);
  scan.corrupt = scan.codec->verify(scan.current_hashes, metadata.hashes);
  scan.corrupt.insert(short_shards.begin(), short_shards.end());

  for (size_t index : scan.corrupt) {
    BOOST_LOG_TRIVIAL(debug) << "Backup manager: " << shard_label(index, data_count) << " of " << name << " is corrupt";
  }
  return scan;
}

// Hash every readable shard stripe by stripe
void BackupManager::hash_shards(ShardScan& scan) const {
  const size_t total = scan.windows.size();
  std::vector<crypto::Sha256> hashers(total);
  std::vector<uint8_t> block(static_cast<size_t>(std::min<uint64_t>(config_.stripe_size, scan.shard_size)));

  for (uint64_t offset = 0; offset < scan.shard_size; offset += config_.stripe_size) {
    const size_t length = static_cast<size_t>(std::min<uint64_t>(config_.stripe_size, scan.shard_size - offset));
    for (size_t i = 0; i < total; ++i) {
      if (scan.windows[i]) {
        scan.windows[i]->read(offset, block.data(), length);
        hashers[i].update(block.data(), length);
      }
    }
  }

  scan.current_hashes.clear();
  for (size_t i = 0; i < total; ++i) {
    scan.current_hashes.push_back(scan.windows[i] ? hashers[i].hex_digest() : std::string());
  }
}

void BackupManager::rebuild_shards(ShardScan& scan, const std::vector<bool>& present,
                                   const std::function<void(size_t, uint64_t, const std::vector<uint8_t>&)>& sink) const {
  const size_t total = scan.windows.size();
  codec::ShardBlocks blocks(total);
  for (uint64_t offset = 0; offset < scan.shard_size; offset += config_.stripe_size) {
    const size_t length = static_cast<size_t>(std::min<uint64_t>(config_.stripe_size, scan.shard_size - offset));
    for (size_t i = 0; i < total; ++i) {
      blocks[i].assign(length, 0);
      if (present[i]) {
        scan.windows[i]->read(offset, blocks[i].data(), length);
      }
    }
    scan.codec->reconstruct(blocks, present);
    for (size_t i = 0; i < total; ++i) {
      if (!present[i]) {
        sink(i, offset, blocks[i]);
      }
    }
  }
}

void BackupManager::log_transition(const std::string& name, RecordState from, RecordState to) const {
  BOOST_LOG_TRIVIAL(debug) << "Backup manager: " << name << " " << record_state_to_string(from)
                           << " -> " << record_state_to_string(to);
}

} // namespace rsbackup::backup
