#ifndef RSBACKUP_STORE_CHUNKER_HPP
#define RSBACKUP_STORE_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "store/file_handle.hpp"

namespace rsbackup::store {

// A fixed-size window over part of a file whose logical length may end inside
// (or before) the window. Bytes past the logical length read as zero padding
// and are never written back.
class ShardWindow {
public:
  ShardWindow(FileHandle& file, uint64_t offset, uint64_t shard_size, uint64_t total_length);

  uint64_t size() const { return shard_size_; }
  uint64_t offset() const { return offset_; }
  // Number of window bytes backed by real data, the rest is padding
  uint64_t data_length() const;

  // Fills buffer with window bytes [position, position + length)
  void read(uint64_t position, uint8_t* buffer, size_t length) const;
  // Writes window bytes [position, position + length), dropping padding
  void write(uint64_t position, const uint8_t* buffer, size_t length);

private:
  FileHandle* file_;
  uint64_t offset_;
  uint64_t shard_size_;
  uint64_t total_length_;

  void check_range(uint64_t position, size_t length) const;
};

class Chunker {
public:
  // ceil(total_length / shard_count)
  static uint64_t shard_size(uint64_t total_length, size_t shard_count);

  // Splits the first total_length bytes of file into shard_count padded windows.
  // The windows keep a pointer to file and must not outlive it.
  static std::vector<ShardWindow> split(FileHandle& file, uint64_t total_length, size_t shard_count);

  // Concatenates shard contents and drops the padding past total_length
  static std::vector<uint8_t> join(const std::vector<std::vector<uint8_t>>& shards, uint64_t total_length);
};

} // namespace rsbackup::store

#endif // RSBACKUP_STORE_CHUNKER_HPP
