#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <sstream>
#include <string>
#include <vector>
#include "backup/backup_manager.hpp"
#include "codec/reed_solomon.hpp"
#include "crypto/hasher.hpp"
#include "test_utils.hpp"

using namespace rsbackup;
using namespace rsbackup::backup;
using ::testing::ElementsAre;

namespace {

// Reed-Solomon whose reconstruction hands back damaged shards
class FaultyRebuildCodec : public codec::ErasureCodec {
public:
  FaultyRebuildCodec(size_t data_shards, size_t parity_shards) : inner_(data_shards, parity_shards) {}

  size_t data_shard_count() const override { return inner_.data_shard_count(); }
  size_t parity_shard_count() const override { return inner_.parity_shard_count(); }

  void encode(const codec::ShardBlocks& data, codec::ShardBlocks& parity) const override {
    inner_.encode(data, parity);
  }

  void reconstruct(codec::ShardBlocks& shards, const std::vector<bool>& present) const override {
    inner_.reconstruct(shards, present);
    for (size_t i = 0; i < shards.size(); ++i) {
      if (!present[i]) {
        for (auto& byte : shards[i]) {
          byte ^= 0x5a;
        }
      }
    }
  }

private:
  codec::ReedSolomon inner_;
};

} // namespace

class BackupManagerTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> dir;
  std::unique_ptr<BackupManager> manager;

  void SetUp() override {
    init_logging();
    dir = std::make_unique<TempDir>("backup_manager_test");
    manager = make_manager(4, 2, 64);
  }

  std::unique_ptr<BackupManager> make_manager(size_t data, size_t parity, size_t stripe) {
    BackupConfig config;
    config.backup_root = dir->path();
    config.data_shards = data;
    config.parity_shards = parity;
    config.stripe_size = stripe;
    return std::make_unique<BackupManager>(config);
  }

  SubmitResult submit(const std::string& name, const std::string& content) {
    std::istringstream input(content);
    return manager->submit(name, input);
  }

  std::string retrieve(const std::string& name) {
    std::ostringstream output;
    manager->retrieve(name, output);
    return output.str();
  }

  std::filesystem::path data_path(const std::string& name) { return manager->layout().data_path(name); }
  std::filesystem::path parity_path(const std::string& name, size_t i) { return manager->layout().parity_path(name, i); }

  // Snapshot of every artifact of a record
  std::vector<std::string> artifacts(const std::string& name, size_t parity) {
    std::vector<std::string> contents{read_file(data_path(name)), read_file(manager->layout().metadata_path(name))};
    for (size_t i = 1; i <= parity; ++i) {
      contents.push_back(read_file(parity_path(name, i)));
    }
    return contents;
  }
};


//==============================================
// SUBMIT
//==============================================

TEST_F(BackupManagerTest, SubmitWritesAllArtifacts) {
  const std::string content = random_bytes(5000, 1);
  auto result = submit("tyger", content);

  EXPECT_EQ(result.size, 5000u);
  EXPECT_EQ(result.data_shards, 4u);
  EXPECT_EQ(result.parity_shards, 2u);
  ASSERT_EQ(result.hashes.size(), 6u);

  EXPECT_EQ(read_file(data_path("tyger")), content);
  EXPECT_TRUE(std::filesystem::exists(manager->layout().metadata_path("tyger")));
  for (size_t i = 1; i <= 2; ++i) {
    EXPECT_EQ(std::filesystem::file_size(parity_path("tyger", i)), 1250u);
  }
}

TEST_F(BackupManagerTest, DataShardHashesCoverPaddedChunks) {
  manager = make_manager(2, 1, 64);
  auto result = submit("small", "abcde");

  // Shard size 3: "abc" and "de" plus one byte of padding
  EXPECT_EQ(result.hashes[0], crypto::Sha256::hash("abc"));
  EXPECT_EQ(result.hashes[1], crypto::Sha256::hash(std::string("de\0", 3)));
  EXPECT_EQ(result.hashes[2], crypto::Sha256::hash(read_file(parity_path("small", 1))));
  EXPECT_EQ(read_file(data_path("small")), "abcde");
}

TEST_F(BackupManagerTest, EmptyFileIsValid) {
  auto result = submit("empty", "");
  EXPECT_EQ(result.size, 0u);
  for (const auto& hash : result.hashes) {
    EXPECT_EQ(hash, crypto::Sha256::hash(""));
  }
  EXPECT_TRUE(manager->check("empty").healthy);
  EXPECT_EQ(manager->repair("empty").status, RepairStatus::AlreadyHealthy);
  EXPECT_EQ(retrieve("empty"), "");
}

TEST_F(BackupManagerTest, ExistingDataFileBlocksSubmit) {
  touch_files(dir->path(), {"tyger"});
  EXPECT_THROW(submit("tyger", "new content"), store::AlreadyExistsError);
  EXPECT_EQ(read_file(data_path("tyger")), "");
  EXPECT_FALSE(std::filesystem::exists(parity_path("tyger", 1)));
}

TEST_F(BackupManagerTest, ExistingMetadataBlocksSubmit) {
  touch_files(dir->path(), {"tyger.md"});
  EXPECT_THROW(submit("tyger", "new content"), store::AlreadyExistsError);
  EXPECT_FALSE(std::filesystem::exists(data_path("tyger")));
  EXPECT_EQ(read_file(manager->layout().metadata_path("tyger")), "");
}

TEST_F(BackupManagerTest, ExistingParityFileBlocksSubmit) {
  touch_files(dir->path(), {"tyger.parity.2"});
  EXPECT_THROW(submit("tyger", "new content"), store::AlreadyExistsError);
  EXPECT_FALSE(std::filesystem::exists(data_path("tyger")));
}

TEST_F(BackupManagerTest, ResubmitFails) {
  submit("tyger", "first");
  EXPECT_THROW(submit("tyger", "second"), store::AlreadyExistsError);
  EXPECT_EQ(retrieve("tyger"), "first");
}

TEST_F(BackupManagerTest, InvalidNameWritesNothing) {
  EXPECT_THROW(submit("ty/ger", "content"), store::BadRequestError);
  EXPECT_THROW(submit("", "content"), store::BadRequestError);
  EXPECT_THROW(submit("..", "content"), store::BadRequestError);
  EXPECT_TRUE(std::filesystem::is_empty(dir->path()));
}

TEST_F(BackupManagerTest, FailedStreamIsInternalError) {
  std::istringstream input("data");
  input.setstate(std::ios::badbit);
  EXPECT_THROW(manager->submit("broken", input), store::InternalError);
}


//==============================================
// CHECK
//==============================================

TEST_F(BackupManagerTest, CheckReportsHealthyRecord) {
  auto submitted = submit("tyger", random_bytes(3000, 2));
  auto result = manager->check("tyger");

  EXPECT_EQ(result.name, "tyger");
  EXPECT_TRUE(result.healthy);
  EXPECT_TRUE(result.corrupt_shards.empty());
  EXPECT_EQ(result.hashes, submitted.hashes);
  // YYYY-MM-DD HH:MM:SS
  ASSERT_EQ(result.last_modified.size(), 19u);
  EXPECT_EQ(result.last_modified[4], '-');
  EXPECT_EQ(result.last_modified[10], ' ');
  EXPECT_EQ(result.last_modified[13], ':');
}

TEST_F(BackupManagerTest, CheckFindsCorruptShards) {
  submit("tyger", random_bytes(4000, 3));
  corrupt_bytes(data_path("tyger"), 1000 + 17, 1);  // data shard 1
  corrupt_bytes(parity_path("tyger", 2), 0, 4);     // shard 5

  auto result = manager->check("tyger");
  EXPECT_FALSE(result.healthy);
  EXPECT_THAT(result.corrupt_shards, ElementsAre(1u, 5u));
}

TEST_F(BackupManagerTest, CheckNeverWrites) {
  submit("tyger", random_bytes(4000, 4));
  corrupt_bytes(data_path("tyger"), 0, 1);
  auto before = artifacts("tyger", 2);
  manager->check("tyger");
  EXPECT_EQ(artifacts("tyger", 2), before);
}

TEST_F(BackupManagerTest, MissingParityFileIsCorruptShard) {
  submit("tyger", random_bytes(4000, 5));
  std::filesystem::remove(parity_path("tyger", 1));

  auto result = manager->check("tyger");
  EXPECT_FALSE(result.healthy);
  EXPECT_THAT(result.corrupt_shards, ElementsAre(4u));
}

TEST_F(BackupManagerTest, CheckMissingRecordIsNotFound) {
  EXPECT_THROW(manager->check("lion"), store::NotFoundError);
}

TEST_F(BackupManagerTest, DataWithoutMetadataIsInconsistent) {
  touch_files(dir->path(), {"orphan"});
  EXPECT_THROW(manager->check("orphan"), store::InternalError);
  EXPECT_THROW(manager->repair("orphan"), store::InternalError);
}

TEST_F(BackupManagerTest, UndecodableMetadataIsCorrupt) {
  submit("tyger", "content");
  write_file(manager->layout().metadata_path("tyger"), "garbage");
  EXPECT_THROW(manager->check("tyger"), store::CorruptError);
}

TEST_F(BackupManagerTest, RecordKeepsItsOwnShardCounts) {
  auto submitted = submit("tyger", random_bytes(2000, 6));
  auto other = make_manager(10, 3, 1024);
  auto result = other->check("tyger");
  EXPECT_TRUE(result.healthy);
  EXPECT_EQ(result.hashes, submitted.hashes);
}


TEST_F(BackupManagerTest, TinyRecordsCheckHealthy) {
  // Fewer bytes than data shards leaves whole shards of padding
  manager = make_manager(10, 3, 64);
  for (size_t size : {1u, 5u, 9u, 11u, 30u, 90u}) {
    const std::string name = "tiny" + std::to_string(size);
    submit(name, random_bytes(size, static_cast<uint32_t>(size)));

    auto result = manager->check(name);
    EXPECT_TRUE(result.healthy) << name;
    EXPECT_TRUE(result.corrupt_shards.empty()) << name;
    EXPECT_EQ(manager->repair(name).status, RepairStatus::AlreadyHealthy) << name;
  }
}


//==============================================
// REPAIR
//==============================================

TEST_F(BackupManagerTest, SmallSizesSurviveCorruptionAndRepair) {
  // Sizes 0 through three times the data shard count
  for (size_t size = 0; size <= 12; ++size) {
    const std::string name = "small" + std::to_string(size);
    const std::string content = random_bytes(size, static_cast<uint32_t>(100 + size));
    submit(name, content);
    ASSERT_TRUE(manager->check(name).healthy) << name;
    if (size == 0) {
      continue;
    }

    corrupt_bytes(data_path(name), 0, 1);
    corrupt_bytes(parity_path(name, 1), 0, 1);
    auto damaged = manager->check(name);
    EXPECT_FALSE(damaged.healthy) << name;
    EXPECT_THAT(damaged.corrupt_shards, ElementsAre(0u, 4u)) << name;

    auto result = manager->repair(name);
    EXPECT_EQ(result.status, RepairStatus::Repaired) << name;
    EXPECT_EQ(retrieve(name), content) << name;
    EXPECT_TRUE(manager->check(name).healthy) << name;
  }
}

TEST_F(BackupManagerTest, FailedRebuildLeavesFilesUntouched) {
  submit("tyger", random_bytes(2000, 12));
  corrupt_bytes(data_path("tyger"), 10, 20);
  std::filesystem::remove(parity_path("tyger", 2));
  const std::string damaged_data = read_file(data_path("tyger"));
  const std::string parity = read_file(parity_path("tyger", 1));

  BackupConfig config = manager->config();
  BackupManager faulty(config, [](size_t data, size_t parity_count) {
    return std::make_unique<FaultyRebuildCodec>(data, parity_count);
  });
  EXPECT_THROW(faulty.repair("tyger"), store::InternalError);

  EXPECT_EQ(read_file(data_path("tyger")), damaged_data);
  EXPECT_EQ(read_file(parity_path("tyger", 1)), parity);
  EXPECT_FALSE(std::filesystem::exists(parity_path("tyger", 2)));

  EXPECT_EQ(manager->repair("tyger").status, RepairStatus::Repaired);
  EXPECT_TRUE(manager->check("tyger").healthy);
}

TEST_F(BackupManagerTest, RepairHealthyRecordIsNoOp) {
  submit("tyger", random_bytes(1000, 7));
  auto before = artifacts("tyger", 2);
  auto result = manager->repair("tyger");
  EXPECT_EQ(result.status, RepairStatus::AlreadyHealthy);
  EXPECT_TRUE(result.repaired_shards.empty());
  EXPECT_EQ(artifacts("tyger", 2), before);
}

TEST_F(BackupManagerTest, RepairRestoresUpToParityShards) {
  const std::string content = random_bytes(5000, 8);
  // Shard size is 1250; pairs of data and parity shards
  const std::vector<std::vector<size_t>> patterns{{0}, {3}, {4}, {0, 1}, {2, 5}, {4, 5}, {3, 4}};

  for (size_t p = 0; p < patterns.size(); ++p) {
    const std::string name = "record" + std::to_string(p);
    auto submitted = submit(name, content);
    auto before = artifacts(name, 2);

    for (size_t shard : patterns[p]) {
      if (shard < 4) {
        corrupt_bytes(data_path(name), shard * 1250 + 100, 50);
      } else {
        corrupt_bytes(parity_path(name, shard - 3), 1200, 50);
      }
    }
    ASSERT_FALSE(manager->check(name).healthy);

    auto result = manager->repair(name);
    EXPECT_EQ(result.status, RepairStatus::Repaired);
    EXPECT_EQ(result.repaired_shards.size(), patterns[p].size());
    EXPECT_TRUE(manager->check(name).healthy) << name;
    EXPECT_EQ(artifacts(name, 2), before) << name;
  }
}

TEST_F(BackupManagerTest, RepairRecreatesMissingParityFile) {
  submit("tyger", random_bytes(3333, 9));
  const std::string parity = read_file(parity_path("tyger", 2));
  std::filesystem::remove(parity_path("tyger", 2));

  EXPECT_EQ(manager->repair("tyger").status, RepairStatus::Repaired);
  EXPECT_EQ(read_file(parity_path("tyger", 2)), parity);
}

TEST_F(BackupManagerTest, RepairRestoresTruncatedParityFile) {
  submit("tyger", random_bytes(3333, 10));
  const std::string parity = read_file(parity_path("tyger", 1));
  std::filesystem::resize_file(parity_path("tyger", 1), 10);

  auto result = manager->repair("tyger");
  EXPECT_THAT(result.repaired_shards, ElementsAre(4u));
  EXPECT_EQ(read_file(parity_path("tyger", 1)), parity);
}

TEST_F(BackupManagerTest, RepairRestoresTruncatedDataFile) {
  const std::string content = random_bytes(4000, 11);
  submit("tyger", content);
  // Cuts into the last data shard only
  std::filesystem::resize_file(data_path("tyger"), 3500);

  auto result = manager->repair("tyger");
  EXPECT_THAT(result.repaired_shards, ElementsAre(3u));
  EXPECT_EQ(read_file(data_path("tyger")), content);
}

TEST_F(BackupManagerTest, RepairDoesNotTouchPadding) {
  // 4001 bytes over 4 shards leaves 3 bytes of padding in the last shard
  const std::string content = random_bytes(4001, 12);
  submit("tyger", content);
  corrupt_bytes(data_path("tyger"), 4000, 1);

  manager->repair("tyger");
  EXPECT_EQ(std::filesystem::file_size(data_path("tyger")), 4001u);
  EXPECT_EQ(read_file(data_path("tyger")), content);
}

TEST_F(BackupManagerTest, TooManyCorruptShardsIsUnrecoverable) {
  submit("tyger", random_bytes(4000, 13));
  corrupt_bytes(data_path("tyger"), 0, 1);
  corrupt_bytes(data_path("tyger"), 1000, 1);
  corrupt_bytes(parity_path("tyger", 1), 0, 1);
  auto before = artifacts("tyger", 2);

  try {
    manager->repair("tyger");
    FAIL() << "Expected UnrecoverableError";
  } catch (const store::UnrecoverableError& e) {
    EXPECT_STREQ(e.what(), "Cannot repair data: 3 shards corrupt, only have 2 parity shards");
    EXPECT_EQ(e.corrupt_count(), 3u);
    EXPECT_EQ(e.parity_count(), 2u);
    EXPECT_EQ(e.code(), store::ErrorCode::Unrecoverable);
  }
  EXPECT_EQ(artifacts("tyger", 2), before);
}

TEST_F(BackupManagerTest, RepairMissingRecordIsNotFound) {
  EXPECT_THROW(manager->repair("lion"), store::NotFoundError);
}


//==============================================
// RETRIEVE AND LIST
//==============================================

TEST_F(BackupManagerTest, RetrieveStreamsDataVerbatim) {
  const std::string content = random_bytes(70000, 14);
  submit("tyger", content);
  EXPECT_EQ(retrieve("tyger"), content);

  auto info = manager->retrieve("tyger");
  EXPECT_EQ(info.path, data_path("tyger"));
  EXPECT_EQ(info.size, 70000u);
  EXPECT_GT(info.modified_time, 0);
}

TEST_F(BackupManagerTest, RetrieveSkipsIntegrityCheck) {
  submit("tyger", "abcdefgh");
  corrupt_bytes(data_path("tyger"), 0, 1);
  EXPECT_EQ(retrieve("tyger").substr(1), "bcdefgh");
}

TEST_F(BackupManagerTest, RetrieveMissingIsNotFound) {
  std::ostringstream output;
  EXPECT_THROW(manager->retrieve("lion", output), store::NotFoundError);
  EXPECT_THROW(manager->retrieve("lion"), store::NotFoundError);
  EXPECT_THROW(manager->retrieve("a/b"), store::BadRequestError);
}

TEST_F(BackupManagerTest, ListShowsRecordsAndMetadata) {
  submit("b", "1");
  submit("a", "2");
  EXPECT_THAT(manager->list(), ElementsAre("a", "a.md", "b", "b.md"));
}


//==============================================
// CONFIGURATION
//==============================================

TEST_F(BackupManagerTest, RejectsInvalidConfiguration) {
  EXPECT_THROW(make_manager(0, 2, 64), std::invalid_argument);
  EXPECT_THROW(make_manager(250, 7, 64), std::invalid_argument);
  EXPECT_THROW(make_manager(4, 2, 0), std::invalid_argument);
}

TEST_F(BackupManagerTest, UsesInjectedCodec) {
  std::atomic<int> built{0};
  BackupConfig config;
  config.backup_root = dir->path();
  config.data_shards = 3;
  config.parity_shards = 1;
  BackupManager counted(config, [&built](size_t data, size_t parity) {
    ++built;
    return codec::make_reed_solomon(data, parity);
  });
  const int after_construction = built;

  std::istringstream input("counted content");
  counted.submit("counted", input);
  counted.check("counted");
  EXPECT_EQ(built.load(), after_construction + 2);
}

TEST_F(BackupManagerTest, RecordStateNames) {
  EXPECT_STREQ(record_state_to_string(RecordState::Absent), "Absent");
  EXPECT_STREQ(record_state_to_string(RecordState::Repairing), "Repairing");
}
