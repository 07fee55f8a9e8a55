#ifndef RSBACKUP_CODEC_GALOIS_HPP
#define RSBACKUP_CODEC_GALOIS_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace rsbackup::codec {

// GF(2^8) arithmetic over the polynomial x^8 + x^4 + x^3 + x^2 + 1
class Galois {
public:
  static constexpr size_t FIELD_SIZE = 256;
  static constexpr uint16_t GENERATING_POLYNOMIAL = 0x11d;

  // Tables are built once and shared by every codec
  static const Galois& instance();

  uint8_t add(uint8_t a, uint8_t b) const { return a ^ b; }
  uint8_t subtract(uint8_t a, uint8_t b) const { return a ^ b; }
  uint8_t multiply(uint8_t a, uint8_t b) const { return mul_table_[a][b]; }
  // Throws std::domain_error when b is zero
  uint8_t divide(uint8_t a, uint8_t b) const;
  uint8_t exp(uint8_t a, size_t n) const;

  // Row of products a * x for every x, used by the shard coding loops
  const std::array<uint8_t, FIELD_SIZE>& multiplication_row(uint8_t a) const {
    return mul_table_[a];
  }

private:
  Galois();

  std::array<uint8_t, FIELD_SIZE> log_table_{};
  std::array<uint8_t, (2 * FIELD_SIZE) - 2> exp_table_{};
  std::array<std::array<uint8_t, FIELD_SIZE>, FIELD_SIZE> mul_table_{};
};

} // namespace rsbackup::codec

#endif // RSBACKUP_CODEC_GALOIS_HPP
