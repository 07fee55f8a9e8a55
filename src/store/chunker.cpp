#include "store/chunker.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace rsbackup::store {

//==============================================
// SHARD WINDOW
//==============================================

ShardWindow::ShardWindow(FileHandle& file, uint64_t offset, uint64_t shard_size, uint64_t total_length)
  : file_(&file)
  , offset_(offset)
  , shard_size_(shard_size)
  , total_length_(total_length) {}

// Bytes of this window backed by the file; the rest is padding
uint64_t ShardWindow::data_length() const {
  if (offset_ >= total_length_) {
    return 0;
  }
  return std::min(shard_size_, total_length_ - offset_);
}

void ShardWindow::check_range(uint64_t position, size_t length) const {
  if (position > shard_size_ || length > shard_size_ - position) {
    throw std::out_of_range("Chunker: Access past the end of the shard window");
  }
}

// Reads past the logical end come back as zeros
void ShardWindow::read(uint64_t position, uint8_t* buffer, size_t length) const {
  check_range(position, length);

  // Real bytes first, bounded by the logical length; a short physical file
  // leaves the remainder to the zero fill below.
  size_t filled = 0;
  uint64_t real = data_length();
  if (position < real) {
    size_t wanted = static_cast<size_t>(std::min<uint64_t>(length, real - position));
    filled = file_->read_at(offset_ + position, buffer, wanted);
  }
  if (filled < length) {
    std::memset(buffer + filled, 0, length - filled);
  }
}

// Padding is never written to the file
void ShardWindow::write(uint64_t position, const uint8_t* buffer, size_t length) {
  check_range(position, length);

  uint64_t real = data_length();
  if (position >= real) {
    return;
  }
  size_t writable = static_cast<size_t>(std::min<uint64_t>(length, real - position));
  file_->write_at(offset_ + position, buffer, writable);
}


//==============================================
// CHUNKER
//==============================================

// Ceiling division so the shards cover every byte
uint64_t Chunker::shard_size(uint64_t total_length, size_t shard_count) {
  if (shard_count == 0) {
    throw std::invalid_argument("Chunker: Shard count must be at least 1");
  }
  return (total_length + shard_count - 1) / shard_count;
}

// Equal windows over one file, the last one padded
std::vector<ShardWindow> Chunker::split(FileHandle& file, uint64_t total_length, size_t shard_count) {
  const uint64_t size = shard_size(total_length, shard_count);

  std::vector<ShardWindow> windows;
  windows.reserve(shard_count);
  for (size_t i = 0; i < shard_count; ++i) {
    windows.emplace_back(file, i * size, size, total_length);
  }
  return windows;
}

// Concatenate shards and cut the padding off the end
std::vector<uint8_t> Chunker::join(const std::vector<std::vector<uint8_t>>& shards, uint64_t total_length) {
  std::vector<uint8_t> joined;
  joined.reserve(static_cast<size_t>(total_length));
  for (const auto& shard : shards) {
    if (joined.size() >= total_length) {
      break;
    }
    size_t take = static_cast<size_t>(std::min<uint64_t>(shard.size(), total_length - joined.size()));
    joined.insert(joined.end(), shard.begin(), shard.begin() + take);
  }
  if (joined.size() < total_length) {
    throw std::invalid_argument("Chunker: Shards hold fewer bytes than the original length");
  }
  return joined;
}

} // namespace rsbackup::store
