#ifndef RSBACKUP_CODEC_MATRIX_HPP
#define RSBACKUP_CODEC_MATRIX_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

namespace rsbackup::codec {

// Dense matrix over GF(2^8)
class Matrix {
public:
  Matrix(size_t rows, size_t columns);

  static Matrix identity(size_t size);
  // Element (r, c) = r^c, any square subset of rows is invertible
  static Matrix vandermonde(size_t rows, size_t columns);

  size_t rows() const { return rows_; }
  size_t columns() const { return columns_; }

  uint8_t get(size_t r, size_t c) const;
  void set(size_t r, size_t c, uint8_t value);
  const uint8_t* row(size_t r) const;

  bool operator==(const Matrix& rhs) const;
  bool operator!=(const Matrix& rhs) const { return !(*this == rhs); }

  Matrix times(const Matrix& rhs) const;
  Matrix augment(const Matrix& rhs) const;
  // Rows [rmin, rmax) and columns [cmin, cmax)
  Matrix submatrix(size_t rmin, size_t cmin, size_t rmax, size_t cmax) const;
  // Throws std::runtime_error when singular
  Matrix invert() const;

  void swap_rows(size_t r1, size_t r2);

private:
  size_t rows_;
  size_t columns_;
  std::vector<uint8_t> data_;

  void gaussian_elimination();
  void check_bounds(size_t r, size_t c) const;
};

std::ostream& operator<<(std::ostream& os, const Matrix& matrix);

} // namespace rsbackup::codec

#endif // RSBACKUP_CODEC_MATRIX_HPP
