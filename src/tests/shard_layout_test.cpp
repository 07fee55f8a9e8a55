#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <string>
#include "store/shard_layout.hpp"
#include "test_utils.hpp"

using namespace rsbackup::store;
using ::testing::ElementsAre;

class ShardLayoutTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> dir;

  void SetUp() override {
    init_logging();
    dir = std::make_unique<TempDir>("shard_layout_test");
  }
};

TEST_F(ShardLayoutTest, PathsFollowNamingScheme) {
  ShardLayout layout("/backups");
  EXPECT_EQ(layout.data_path("tyger"), std::filesystem::path("/backups/tyger"));
  EXPECT_EQ(layout.metadata_path("tyger"), std::filesystem::path("/backups/tyger.md"));
  EXPECT_EQ(layout.parity_path("tyger", 1), std::filesystem::path("/backups/tyger.parity.1"));
  EXPECT_EQ(layout.parity_path("tyger", 12), std::filesystem::path("/backups/tyger.parity.12"));
  EXPECT_THROW(layout.parity_path("tyger", 0), std::out_of_range);
}

TEST_F(ShardLayoutTest, ListSkipsParityFiles) {
  touch_files(dir->path(), {"file2", "file1", "file1.parity.1", "file1.parity.2"});
  ShardLayout layout(dir->path());
  EXPECT_THAT(layout.list(), ElementsAre("file1", "file2"));
}

TEST_F(ShardLayoutTest, ListKeepsMetadataAndNearMisses) {
  touch_files(dir->path(), {"b.md", "b", "a.parity.", "a.parity.x", "Zeta", "c.parity.10"});
  ShardLayout layout(dir->path());
  EXPECT_THAT(layout.list(), ElementsAre("Zeta", "a.parity.", "a.parity.x", "b", "b.md"));
}

TEST_F(ShardLayoutTest, ListOfEmptyRootIsEmpty) {
  ShardLayout layout(dir->path());
  EXPECT_TRUE(layout.list().empty());
}

TEST_F(ShardLayoutTest, ListOfMissingRootFails) {
  ShardLayout layout("/dir/doesnt/exist");
  EXPECT_THROW(layout.list(), InternalError);
}

TEST_F(ShardLayoutTest, ParityFileDetection) {
  EXPECT_TRUE(ShardLayout::is_parity_file("x.parity.1"));
  EXPECT_TRUE(ShardLayout::is_parity_file("x.parity.255"));
  EXPECT_TRUE(ShardLayout::is_parity_file("parity.3"));
  EXPECT_FALSE(ShardLayout::is_parity_file("x.parity."));
  EXPECT_FALSE(ShardLayout::is_parity_file("x.parity.1.md"));
  EXPECT_FALSE(ShardLayout::is_parity_file("x"));
}

TEST_F(ShardLayoutTest, NameValidation) {
  EXPECT_NO_THROW(ShardLayout::validate_name("tyger"));
  EXPECT_NO_THROW(ShardLayout::validate_name("with space.txt"));
  EXPECT_NO_THROW(ShardLayout::validate_name("..."));
  EXPECT_THROW(ShardLayout::validate_name(""), BadRequestError);
  EXPECT_THROW(ShardLayout::validate_name("ty/ger"), BadRequestError);
  EXPECT_THROW(ShardLayout::validate_name("/abs"), BadRequestError);
  EXPECT_THROW(ShardLayout::validate_name("."), BadRequestError);
  EXPECT_THROW(ShardLayout::validate_name(".."), BadRequestError);
  EXPECT_THROW(ShardLayout::validate_name(std::string("a\0b", 3)), BadRequestError);
}
