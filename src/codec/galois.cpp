#include "codec/galois.hpp"
#include <stdexcept>

namespace rsbackup::codec {

const Galois& Galois::instance() {
  static const Galois galois;
  return galois;
}

Galois::Galois() {
  // Walk the powers of the generator 2 to fill log and exp tables
  uint16_t value = 1;
  for (size_t log = 0; log < FIELD_SIZE - 1; ++log) {
    log_table_[value] = static_cast<uint8_t>(log);
    exp_table_[log] = static_cast<uint8_t>(value);
    exp_table_[log + FIELD_SIZE - 1] = static_cast<uint8_t>(value);
    value <<= 1;
    if (value >= FIELD_SIZE) {
      value ^= GENERATING_POLYNOMIAL;
    }
  }

  for (size_t a = 0; a < FIELD_SIZE; ++a) {
    for (size_t b = 0; b < FIELD_SIZE; ++b) {
      if (a == 0 || b == 0) {
        mul_table_[a][b] = 0;
      } else {
        mul_table_[a][b] = exp_table_[log_table_[a] + log_table_[b]];
      }
    }
  }
}

uint8_t Galois::divide(uint8_t a, uint8_t b) const {
  if (b == 0) {
    throw std::domain_error("Galois: Division by zero");
  }
  if (a == 0) {
    return 0;
  }
  int log_result = static_cast<int>(log_table_[a]) - static_cast<int>(log_table_[b]);
  if (log_result < 0) {
    log_result += FIELD_SIZE - 1;
  }
  return exp_table_[log_result];
}

uint8_t Galois::exp(uint8_t a, size_t n) const {
  if (n == 0) {
    return 1;
  }
  if (a == 0) {
    return 0;
  }
  size_t log_result = (static_cast<size_t>(log_table_[a]) * n) % (FIELD_SIZE - 1);
  return exp_table_[log_result];
}

} // namespace rsbackup::codec
