#include "codec/matrix.hpp"
#include "codec/galois.hpp"
#include <iomanip>
#include <stdexcept>
#include <utility>

namespace rsbackup::codec {

//==============================================
// CONSTRUCTION
//==============================================

Matrix::Matrix(size_t rows, size_t columns)
  : rows_(rows)
  , columns_(columns)
  , data_(rows * columns, 0) {
  if (rows == 0 || columns == 0) {
    throw std::invalid_argument("Matrix: Dimensions must be non-zero");
  }
}

Matrix Matrix::identity(size_t size) {
  Matrix m(size, size);
  for (size_t i = 0; i < size; ++i) {
    m.set(i, i, 1);
  }
  return m;
}

Matrix Matrix::vandermonde(size_t rows, size_t columns) {
  if (rows > Galois::FIELD_SIZE) {
    throw std::invalid_argument("Matrix: Vandermonde matrix limited to 256 rows");
  }
  const Galois& gf = Galois::instance();
  Matrix m(rows, columns);
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < columns; ++c) {
      m.set(r, c, gf.exp(static_cast<uint8_t>(r), c));
    }
  }
  return m;
}


//==============================================
// ELEMENT ACCESS
//==============================================

void Matrix::check_bounds(size_t r, size_t c) const {
  if (r >= rows_ || c >= columns_) {
    throw std::out_of_range("Matrix: No such row or column");
  }
}

uint8_t Matrix::get(size_t r, size_t c) const {
  check_bounds(r, c);
  return data_[(r * columns_) + c];
}

void Matrix::set(size_t r, size_t c, uint8_t value) {
  check_bounds(r, c);
  data_[(r * columns_) + c] = value;
}

const uint8_t* Matrix::row(size_t r) const {
  if (r >= rows_) {
    throw std::out_of_range("Matrix: No such row");
  }
  return data_.data() + (r * columns_);
}

bool Matrix::operator==(const Matrix& rhs) const {
  return rows_ == rhs.rows_ && columns_ == rhs.columns_ && data_ == rhs.data_;
}


//==============================================
// ARITHMETIC
//==============================================

Matrix Matrix::times(const Matrix& rhs) const {
  if (columns_ != rhs.rows_) {
    throw std::invalid_argument("Matrix: left.columns != right.rows");
  }
  const Galois& gf = Galois::instance();
  Matrix result(rows_, rhs.columns_);
  for (size_t r = 0; r < rows_; ++r) {
    for (size_t c = 0; c < rhs.columns_; ++c) {
      uint8_t value = 0;
      for (size_t i = 0; i < columns_; ++i) {
        value ^= gf.multiply(get(r, i), rhs.get(i, c));
      }
      result.set(r, c, value);
    }
  }
  return result;
}

Matrix Matrix::augment(const Matrix& rhs) const {
  if (rows_ != rhs.rows_) {
    throw std::invalid_argument("Matrix: left.rows != right.rows");
  }
  Matrix result(rows_, columns_ + rhs.columns_);
  for (size_t r = 0; r < rows_; ++r) {
    for (size_t c = 0; c < columns_; ++c) {
      result.set(r, c, get(r, c));
    }
    for (size_t c = 0; c < rhs.columns_; ++c) {
      result.set(r, columns_ + c, rhs.get(r, c));
    }
  }
  return result;
}

Matrix Matrix::submatrix(size_t rmin, size_t cmin, size_t rmax, size_t cmax) const {
  if (rmax > rows_ || cmax > columns_ || rmin >= rmax || cmin >= cmax) {
    throw std::out_of_range("Matrix: Invalid submatrix bounds");
  }
  Matrix result(rmax - rmin, cmax - cmin);
  for (size_t r = rmin; r < rmax; ++r) {
    for (size_t c = cmin; c < cmax; ++c) {
      result.set(r - rmin, c - cmin, get(r, c));
    }
  }
  return result;
}

Matrix Matrix::invert() const {
  if (rows_ != columns_) {
    throw std::invalid_argument("Matrix: Matrix not square");
  }
  // work = { M | I }
  Matrix work = augment(identity(rows_));
  work.gaussian_elimination();
  // work = { I | M^-1 }
  return work.submatrix(0, rows_, rows_, rows_ * 2);
}

void Matrix::swap_rows(size_t r1, size_t r2) {
  if (r1 >= rows_ || r2 >= rows_) {
    throw std::out_of_range("Matrix: No such row");
  }
  if (r1 == r2) {
    return;
  }
  for (size_t c = 0; c < columns_; ++c) {
    std::swap(data_[(r1 * columns_) + c], data_[(r2 * columns_) + c]);
  }
}

void Matrix::gaussian_elimination() {
  const Galois& gf = Galois::instance();

  for (size_t pivot = 0; pivot < rows_; ++pivot) {
    // Find a row with a non-zero pivot if needed
    if (get(pivot, pivot) == 0) {
      for (size_t below = pivot + 1; below < rows_; ++below) {
        if (get(below, pivot) != 0) {
          swap_rows(pivot, below);
          break;
        }
      }
    }
    if (get(pivot, pivot) == 0) {
      throw std::runtime_error("Matrix: Matrix is singular");
    }

    // Scale pivot row so the pivot becomes 1
    uint8_t pivot_value = get(pivot, pivot);
    if (pivot_value != 1) {
      uint8_t scale = gf.divide(1, pivot_value);
      for (size_t c = 0; c < columns_; ++c) {
        set(pivot, c, gf.multiply(get(pivot, c), scale));
      }
    }

    // Clear this column in every other row
    for (size_t r = 0; r < rows_; ++r) {
      if (r == pivot) {
        continue;
      }
      uint8_t factor = get(r, pivot);
      if (factor == 0) {
        continue;
      }
      for (size_t c = 0; c < columns_; ++c) {
        set(r, c, get(r, c) ^ gf.multiply(get(pivot, c), factor));
      }
    }
  }
}

std::ostream& operator<<(std::ostream& os, const Matrix& matrix) {
  os << "{\n";
  for (size_t r = 0; r < matrix.rows(); ++r) {
    os << "  ";
    for (size_t c = 0; c < matrix.columns(); ++c) {
      if (c > 0) {
        os << ", ";
      }
      os << std::hex << std::setw(2) << std::setfill('0')
         << static_cast<unsigned int>(matrix.get(r, c));
    }
    os << "\n";
  }
  os << "}";
  return os << std::dec;
}

} // namespace rsbackup::codec
