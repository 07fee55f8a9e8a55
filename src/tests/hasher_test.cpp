#include <gtest/gtest.h>
#include <string>
#include "crypto/hasher.hpp"

using rsbackup::crypto::Sha256;

TEST(HasherTest, KnownDigests) {
  EXPECT_EQ(Sha256::hash(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(Sha256::hash("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HasherTest, IncrementalMatchesOneShot) {
  std::string data;
  for (int i = 0; i < 10000; ++i) {
    data.push_back(static_cast<char>(i * 31));
  }

  Sha256 hasher;
  for (size_t offset = 0; offset < data.size(); offset += 777) {
    hasher.update(data.substr(offset, 777));
  }
  EXPECT_EQ(hasher.hex_digest(), Sha256::hash(data));
}

TEST(HasherTest, DigestIsLowercaseHex) {
  const std::string digest = Sha256::hash("rsbackup");
  ASSERT_EQ(digest.size(), 2 * Sha256::DIGEST_SIZE);
  for (char c : digest) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << digest;
  }
}

TEST(HasherTest, MovedHasherKeepsState) {
  Sha256 first;
  first.update("ab");
  Sha256 second(std::move(first));
  second.update("c");
  EXPECT_EQ(second.hex_digest(), Sha256::hash("abc"));
}

TEST(HasherTest, UpdateAfterFinalizeThrows) {
  Sha256 hasher;
  hasher.update("abc");
  hasher.hex_digest();
  EXPECT_THROW(hasher.update("more"), rsbackup::crypto::HashError);
}
