#include "codec/reed_solomon.hpp"
#include "codec/galois.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace rsbackup::codec {

//==============================================
// CONSTRUCTOR
//==============================================

ReedSolomon::ReedSolomon(size_t data_shards, size_t parity_shards)
  : data_shards_(data_shards)
  , parity_shards_(parity_shards)
  , matrix_(build_matrix(data_shards, data_shards + parity_shards)) {
  BOOST_LOG_TRIVIAL(debug) << "Reed-Solomon: Codec ready with " << data_shards_
                           << " data and " << parity_shards_ << " parity shards";
}

Matrix ReedSolomon::build_matrix(size_t data_shards, size_t total_shards) {
  if (data_shards == 0) {
    throw std::invalid_argument("Reed-Solomon: At least one data shard is required");
  }
  if (total_shards > MAX_TOTAL_SHARDS) {
    throw std::invalid_argument("Reed-Solomon: Data and parity shards may not exceed " +
                                std::to_string(MAX_TOTAL_SHARDS));
  }
  // Any data_shards rows of a Vandermonde matrix are independent; multiplying
  // by the inverse of its top square keeps that property and makes the top
  // the identity.
  Matrix vandermonde = Matrix::vandermonde(total_shards, data_shards);
  Matrix top = vandermonde.submatrix(0, 0, data_shards, data_shards);
  return vandermonde.times(top.invert());
}


//==============================================
// ERASURE CODEC
//==============================================

void ReedSolomon::encode(const ShardBlocks& data, ShardBlocks& parity) const {
  if (data.size() != data_shards_) {
    throw std::invalid_argument("Reed-Solomon: Expected " + std::to_string(data_shards_) +
                                " data blocks, got " + std::to_string(data.size()));
  }
  const size_t block_size = data.front().size();
  for (const auto& block : data) {
    if (block.size() != block_size) {
      throw std::invalid_argument("Reed-Solomon: Data blocks differ in size");
    }
  }

  parity.assign(parity_shards_, std::vector<uint8_t>(block_size, 0));
  if (parity_shards_ == 0) {
    return;
  }

  std::vector<const uint8_t*> rows;
  std::vector<const std::vector<uint8_t>*> inputs;
  std::vector<std::vector<uint8_t>*> outputs;
  for (size_t i = 0; i < parity_shards_; ++i) {
    rows.push_back(matrix_.row(data_shards_ + i));
    outputs.push_back(&parity[i]);
  }
  for (const auto& block : data) {
    inputs.push_back(&block);
  }
  code_some_shards(rows, inputs, outputs, block_size);
}

void ReedSolomon::reconstruct(ShardBlocks& shards, const std::vector<bool>& present) const {
  const size_t total = total_shard_count();
  if (shards.size() != total || present.size() != total) {
    throw std::invalid_argument("Reed-Solomon: Expected " + std::to_string(total) + " shards");
  }

  size_t present_count = 0;
  size_t block_size = 0;
  for (size_t i = 0; i < total; ++i) {
    if (!present[i]) {
      continue;
    }
    if (present_count == 0) {
      block_size = shards[i].size();
    } else if (shards[i].size() != block_size) {
      throw std::invalid_argument("Reed-Solomon: Present blocks differ in size");
    }
    ++present_count;
  }

  if (present_count == total) {
    return;
  }
  if (present_count < data_shards_) {
    throw TooManyErasuresError(total - present_count, parity_shards_);
  }

  // Pick the first data_shards_ present shards and the matching matrix rows
  Matrix sub_matrix(data_shards_, data_shards_);
  std::vector<const std::vector<uint8_t>*> sub_shards;
  for (size_t row = 0; row < total && sub_shards.size() < data_shards_; ++row) {
    if (!present[row]) {
      continue;
    }
    for (size_t c = 0; c < data_shards_; ++c) {
      sub_matrix.set(sub_shards.size(), c, matrix_.get(row, c));
    }
    sub_shards.push_back(&shards[row]);
  }
  Matrix decode_matrix = sub_matrix.invert();

  // Missing data shards come straight from the decode matrix
  std::vector<const uint8_t*> rows;
  std::vector<std::vector<uint8_t>*> outputs;
  for (size_t i = 0; i < data_shards_; ++i) {
    if (!present[i]) {
      shards[i].assign(block_size, 0);
      rows.push_back(decode_matrix.row(i));
      outputs.push_back(&shards[i]);
    }
  }
  if (!outputs.empty()) {
    code_some_shards(rows, sub_shards, outputs, block_size);
  }

  // Missing parity shards are re-encoded from the now complete data shards
  rows.clear();
  outputs.clear();
  std::vector<const std::vector<uint8_t>*> data_inputs;
  for (size_t i = 0; i < data_shards_; ++i) {
    data_inputs.push_back(&shards[i]);
  }
  for (size_t i = data_shards_; i < total; ++i) {
    if (!present[i]) {
      shards[i].assign(block_size, 0);
      rows.push_back(matrix_.row(i));
      outputs.push_back(&shards[i]);
    }
  }
  if (!outputs.empty()) {
    code_some_shards(rows, data_inputs, outputs, block_size);
  }
}


//==============================================
// SHARD CODING
//==============================================

void ReedSolomon::code_some_shards(const std::vector<const uint8_t*>& matrix_rows,
                                   const std::vector<const std::vector<uint8_t>*>& inputs,
                                   const std::vector<std::vector<uint8_t>*>& outputs,
                                   size_t byte_count) {
  const Galois& gf = Galois::instance();

  for (size_t out = 0; out < outputs.size(); ++out) {
    uint8_t* output = outputs[out]->data();
    for (size_t in = 0; in < inputs.size(); ++in) {
      const auto& mul = gf.multiplication_row(matrix_rows[out][in]);
      const uint8_t* input = inputs[in]->data();
      if (in == 0) {
        for (size_t b = 0; b < byte_count; ++b) {
          output[b] = mul[input[b]];
        }
      } else {
        for (size_t b = 0; b < byte_count; ++b) {
          output[b] ^= mul[input[b]];
        }
      }
    }
  }
}

} // namespace rsbackup::codec
