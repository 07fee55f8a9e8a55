#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <random>
#include <set>
#include <vector>
#include "codec/galois.hpp"
#include "codec/matrix.hpp"
#include "codec/reed_solomon.hpp"
#include "test_utils.hpp"

using namespace rsbackup::codec;

//==============================================
// GALOIS FIELD
//==============================================

TEST(GaloisTest, KnownProducts) {
  const Galois& gf = Galois::instance();
  EXPECT_EQ(gf.multiply(3, 4), 12);
  EXPECT_EQ(gf.multiply(7, 7), 21);
  EXPECT_EQ(gf.multiply(0, 200), 0);
  EXPECT_EQ(gf.multiply(1, 200), 200);
  // x^7 * x wraps through the polynomial
  EXPECT_EQ(gf.multiply(0x80, 2), 0x1d);
}

TEST(GaloisTest, DivisionInvertsMultiplication) {
  const Galois& gf = Galois::instance();
  for (int a = 0; a < 256; ++a) {
    for (int b = 1; b < 256; ++b) {
      uint8_t product = gf.multiply(static_cast<uint8_t>(a), static_cast<uint8_t>(b));
      ASSERT_EQ(gf.divide(product, static_cast<uint8_t>(b)), a) << a << " / " << b;
    }
  }
}

TEST(GaloisTest, DivideByZeroThrows) {
  EXPECT_THROW(Galois::instance().divide(5, 0), std::domain_error);
}

TEST(GaloisTest, ExpMatchesRepeatedMultiplication) {
  const Galois& gf = Galois::instance();
  for (int a : {0, 1, 2, 5, 13, 200}) {
    uint8_t expected = 1;
    for (size_t n = 0; n < 20; ++n) {
      EXPECT_EQ(gf.exp(static_cast<uint8_t>(a), n), expected) << a << "^" << n;
      expected = gf.multiply(expected, static_cast<uint8_t>(a));
    }
  }
}

TEST(GaloisTest, AdditionIsXor) {
  const Galois& gf = Galois::instance();
  EXPECT_EQ(gf.add(0x53, 0xca), 0x99);
  EXPECT_EQ(gf.subtract(0x53, 0xca), 0x99);
}


//==============================================
// MATRIX
//==============================================

TEST(MatrixTest, IdentityTimesMatrixIsUnchanged) {
  Matrix m = Matrix::vandermonde(4, 3);
  EXPECT_EQ(Matrix::identity(4).times(m), m);
  EXPECT_EQ(m.times(Matrix::identity(3)), m);
}

TEST(MatrixTest, InverseOfVandermondeSquare) {
  Matrix square = Matrix::vandermonde(5, 5);
  Matrix inverse = square.invert();
  EXPECT_EQ(square.times(inverse), Matrix::identity(5));
  EXPECT_EQ(inverse.times(square), Matrix::identity(5));
}

TEST(MatrixTest, SingularMatrixThrows) {
  Matrix m(2, 2);
  m.set(0, 0, 1);
  m.set(0, 1, 2);
  m.set(1, 0, 1);
  m.set(1, 1, 2);
  EXPECT_THROW(m.invert(), std::runtime_error);
}

TEST(MatrixTest, AugmentAndSubmatrix) {
  Matrix left = Matrix::vandermonde(3, 2);
  Matrix joined = left.augment(Matrix::identity(3));
  ASSERT_EQ(joined.rows(), 3u);
  ASSERT_EQ(joined.columns(), 5u);
  EXPECT_EQ(joined.submatrix(0, 0, 3, 2), left);
  EXPECT_EQ(joined.submatrix(0, 2, 3, 5), Matrix::identity(3));
}

TEST(MatrixTest, BoundsAndShapeChecks) {
  Matrix m(2, 3);
  EXPECT_THROW(m.get(2, 0), std::out_of_range);
  EXPECT_THROW(m.set(0, 3, 1), std::out_of_range);
  EXPECT_THROW(m.times(Matrix(2, 2)), std::invalid_argument);
  EXPECT_THROW(Matrix(0, 1), std::invalid_argument);
}


//==============================================
// REED-SOLOMON
//==============================================

class ReedSolomonTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging();
  }

  static ShardBlocks make_data(size_t count, size_t block_size, uint32_t seed) {
    ShardBlocks data(count);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& block : data) {
      block.resize(block_size);
      for (auto& b : block) {
        b = static_cast<uint8_t>(dis(gen));
      }
    }
    return data;
  }

  static ShardBlocks encode_all(const ReedSolomon& codec, const ShardBlocks& data) {
    ShardBlocks parity;
    codec.encode(data, parity);
    ShardBlocks all = data;
    all.insert(all.end(), parity.begin(), parity.end());
    return all;
  }
};

TEST_F(ReedSolomonTest, CodingMatrixIsSystematic) {
  ReedSolomon codec(4, 2);
  const Matrix& matrix = codec.coding_matrix();
  ASSERT_EQ(matrix.rows(), 6u);
  ASSERT_EQ(matrix.columns(), 4u);
  EXPECT_EQ(matrix.submatrix(0, 0, 4, 4), Matrix::identity(4));
}

TEST_F(ReedSolomonTest, RejectsInvalidShardCounts) {
  EXPECT_THROW(ReedSolomon(0, 3), std::invalid_argument);
  EXPECT_THROW(ReedSolomon(200, 57), std::invalid_argument);
  EXPECT_NO_THROW(ReedSolomon(200, 56));
  EXPECT_NO_THROW(ReedSolomon(1, 0));
}

TEST_F(ReedSolomonTest, SingleDataShardParityIsCopy) {
  ReedSolomon codec(1, 2);
  ShardBlocks data = make_data(1, 64, 7);
  ShardBlocks parity;
  codec.encode(data, parity);
  ASSERT_EQ(parity.size(), 2u);
  EXPECT_EQ(parity[0], data[0]);
  EXPECT_EQ(parity[1], data[0]);
}

TEST_F(ReedSolomonTest, EncodeRejectsUnevenBlocks) {
  ReedSolomon codec(2, 1);
  ShardBlocks data{std::vector<uint8_t>(4), std::vector<uint8_t>(5)};
  ShardBlocks parity;
  EXPECT_THROW(codec.encode(data, parity), std::invalid_argument);
}

TEST_F(ReedSolomonTest, ReconstructsEveryErasurePattern) {
  const size_t data_count = 4;
  const size_t parity_count = 3;
  ReedSolomon codec(data_count, parity_count);
  const ShardBlocks original = encode_all(codec, make_data(data_count, 100, 42));
  const size_t total = data_count + parity_count;

  // Every subset of at most parity_count erased shards
  for (uint32_t mask = 1; mask < (1u << total); ++mask) {
    std::vector<bool> present(total, true);
    size_t erased = 0;
    ShardBlocks shards = original;
    for (size_t i = 0; i < total; ++i) {
      if (mask & (1u << i)) {
        present[i] = false;
        shards[i].assign(100, 0xAA);
        ++erased;
      }
    }
    if (erased > parity_count) {
      continue;
    }
    codec.reconstruct(shards, present);
    ASSERT_EQ(shards, original) << "erasure mask " << mask;
  }
}

TEST_F(ReedSolomonTest, TooManyErasuresThrows) {
  ReedSolomon codec(3, 2);
  ShardBlocks shards = encode_all(codec, make_data(3, 16, 1));
  std::vector<bool> present{false, true, false, true, false};
  try {
    codec.reconstruct(shards, present);
    FAIL() << "Expected TooManyErasuresError";
  } catch (const TooManyErasuresError& e) {
    EXPECT_EQ(e.missing(), 3u);
    EXPECT_EQ(e.parity(), 2u);
  }
}

TEST_F(ReedSolomonTest, VerifyReportsMismatchedIndices) {
  ReedSolomon codec(2, 2);
  std::vector<std::string> expected{"a", "b", "c", "d"};
  std::vector<std::string> current{"a", "x", "c", ""};
  EXPECT_THAT(codec.verify(current, expected), ::testing::ElementsAre(1u, 3u));
  EXPECT_TRUE(codec.verify(expected, expected).empty());
  EXPECT_THROW(codec.verify({"a"}, expected), std::invalid_argument);
}

TEST_F(ReedSolomonTest, FactoryBuildsReedSolomon) {
  auto codec = make_reed_solomon(10, 3);
  ASSERT_NE(codec, nullptr);
  EXPECT_EQ(codec->data_shard_count(), 10u);
  EXPECT_EQ(codec->parity_shard_count(), 3u);
  EXPECT_EQ(codec->total_shard_count(), 13u);
}
