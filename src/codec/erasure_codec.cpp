#include "codec/erasure_codec.hpp"
#include "codec/reed_solomon.hpp"

namespace rsbackup::codec {

std::set<size_t> ErasureCodec::verify(const std::vector<std::string>& current_hashes,
                                      const std::vector<std::string>& expected_hashes) const {
  if (current_hashes.size() != total_shard_count() ||
      expected_hashes.size() != total_shard_count()) {
    throw std::invalid_argument("Codec: Expected " + std::to_string(total_shard_count()) +
                                " shard hashes");
  }

  std::set<size_t> corrupt;
  for (size_t i = 0; i < current_hashes.size(); ++i) {
    if (current_hashes[i] != expected_hashes[i]) {
      corrupt.insert(i);
    }
  }
  return corrupt;
}

std::unique_ptr<ErasureCodec> make_reed_solomon(size_t data_shards, size_t parity_shards) {
  return std::make_unique<ReedSolomon>(data_shards, parity_shards);
}

} // namespace rsbackup::codec
