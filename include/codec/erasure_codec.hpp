#ifndef RSBACKUP_CODEC_ERASURE_CODEC_HPP
#define RSBACKUP_CODEC_ERASURE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace rsbackup::codec {

// One equal-length block per shard, in shard index order
using ShardBlocks = std::vector<std::vector<uint8_t>>;

class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

// Fewer healthy shards remain than data shards are needed
class TooManyErasuresError : public CodecError {
public:
  TooManyErasuresError(size_t missing, size_t parity)
    : CodecError("Codec: " + std::to_string(missing) + " shards missing, only " +
                 std::to_string(parity) + " parity shards available")
    , missing_(missing)
    , parity_(parity) {}

  size_t missing() const { return missing_; }
  size_t parity() const { return parity_; }

private:
  size_t missing_;
  size_t parity_;
};

// Capability interface for the erasure code behind the backup manager
class ErasureCodec {
public:
  virtual ~ErasureCodec() = default;

  virtual size_t data_shard_count() const = 0;
  virtual size_t parity_shard_count() const = 0;
  size_t total_shard_count() const { return data_shard_count() + parity_shard_count(); }

  // Computes parity blocks from data blocks; every block has the same length
  virtual void encode(const ShardBlocks& data, ShardBlocks& parity) const = 0;

  // Rebuilds every block whose present flag is false from the present ones.
  // Throws TooManyErasuresError when fewer than data_shard_count() are present.
  virtual void reconstruct(ShardBlocks& shards, const std::vector<bool>& present) const = 0;

  // Indices whose current hash differs from the expected one
  std::set<size_t> verify(const std::vector<std::string>& current_hashes,
                          const std::vector<std::string>& expected_hashes) const;
};

using CodecFactory = std::function<std::unique_ptr<ErasureCodec>(size_t data_shards, size_t parity_shards)>;

// Default factory, builds a ReedSolomon codec
std::unique_ptr<ErasureCodec> make_reed_solomon(size_t data_shards, size_t parity_shards);

} // namespace rsbackup::codec

#endif // RSBACKUP_CODEC_ERASURE_CODEC_HPP
