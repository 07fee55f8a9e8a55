#ifndef RSBACKUP_CODEC_REED_SOLOMON_HPP
#define RSBACKUP_CODEC_REED_SOLOMON_HPP

#include "codec/erasure_codec.hpp"
#include "codec/matrix.hpp"

namespace rsbackup::codec {

// Systematic Reed-Solomon code: the top of the coding matrix is the identity,
// so data shards are stored verbatim and only parity rows are computed.
class ReedSolomon : public ErasureCodec {
public:
  static constexpr size_t MAX_TOTAL_SHARDS = 256;

  // ---- CONSTRUCTOR ----
  // Throws std::invalid_argument unless 1 <= data and data + parity <= 256
  ReedSolomon(size_t data_shards, size_t parity_shards);


  // ---- ERASURE CODEC ----
  size_t data_shard_count() const override { return data_shards_; }
  size_t parity_shard_count() const override { return parity_shards_; }
  void encode(const ShardBlocks& data, ShardBlocks& parity) const override;
  void reconstruct(ShardBlocks& shards, const std::vector<bool>& present) const override;


  // ---- INSPECTION ----
  const Matrix& coding_matrix() const { return matrix_; }

private:
  size_t data_shards_;
  size_t parity_shards_;
  Matrix matrix_;

  static Matrix build_matrix(size_t data_shards, size_t total_shards);

  // outputs[i] = sum over j of rows[i][j] * inputs[j]
  static void code_some_shards(const std::vector<const uint8_t*>& matrix_rows,
                               const std::vector<const std::vector<uint8_t>*>& inputs,
                               const std::vector<std::vector<uint8_t>*>& outputs,
                               size_t byte_count);
};

} // namespace rsbackup::codec

#endif // RSBACKUP_CODEC_REED_SOLOMON_HPP
