#include "core/transfer_manager.hpp"
#include <atomic>
#include <fstream>
#include <set>
#include <string>
#include "core/scripted_source.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/temp_dir.hpp"

namespace {

using ::testing::ElementsAre;
using core::TransferOutcome;

const std::string test_tmpdir = "/tmp/audiofetch_testdir";

std::string makeData(size_t size) {
  std::string data(size, 'a');
  for (size_t i = 0; i < size; i++) data[i] = 'a' + i % 26;
  return data;
}

std::string hexHash(const std::string& data) {
  util::SHA256 hasher;
  hasher.update(data);
  return hasher.finalize().Hex();
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

class TransferManagerTest : public ::testing::Test {
 protected:
  TransferManagerTest()
      : tmp_(test_tmpdir),
        store_(util::File::JoinPath(tmp_.Path(), "state")),
        data_(makeData(10000)) {
    config_.download_directory = util::File::JoinPath(tmp_.Path(), "music");
    config_.chunk_size = 1000;
    source_.Add("track01", data_);
    task_.id = "album/track01";
    task_.source_ref = "track01";
    task_.destination = "album/01.flac";
    task_.total_size = data_.size();
    task_.expected_checksum = hexHash(data_);
  }

  core::TransferResult transfer(core::TransferManager* manager,
                                const core::TransferHooks& hooks =
                                    core::TransferHooks()) {
    core::TransferState prior;
    bool resume = store_.Load(task_.id, &prior);
    return manager->Transfer(task_, &source_, resume ? &prior : nullptr,
                             cancelled_, hooks);
  }

  util::TempDir tmp_;
  core::TransferStateStore store_;
  core::TransferConfig config_;
  core::ScriptedSource source_;
  core::Task task_;
  std::string data_;
  std::atomic<bool> cancelled_{false};
};

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, Complete) {
  core::TransferManager manager(config_, &store_);
  int checkpoints = 0;
  int verifications = 0;
  core::TransferHooks hooks;
  hooks.on_checkpoint = [&](const core::TransferState&) { checkpoints++; };
  hooks.on_verify = [&]() { verifications++; };
  auto result = transfer(&manager, hooks);
  ASSERT_EQ(result.outcome, TransferOutcome::SUCCESS) << result.message;
  EXPECT_EQ(result.resumed_from, 0);
  EXPECT_EQ(result.bytes_transferred, 10000);
  EXPECT_EQ(result.checksum.Hex(), task_.expected_checksum);
  EXPECT_EQ(result.final_path, manager.FinalPath(task_));
  EXPECT_EQ(readFile(result.final_path), data_);
  EXPECT_FALSE(util::File::Exists(manager.PartialPath(task_)));
  EXPECT_EQ(checkpoints, 10);
  EXPECT_EQ(verifications, 1);
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, ResumeAfterInterruption) {
  core::TransferManager manager(config_, &store_);
  source_.FailAt("track01", 4000);
  auto first = transfer(&manager);
  EXPECT_EQ(first.outcome, TransferOutcome::STREAM_ERROR);
  EXPECT_EQ(first.bytes_confirmed, 4000);
  EXPECT_EQ(util::File::Size(manager.PartialPath(task_)), 4000);

  core::TransferState state;
  ASSERT_TRUE(store_.Load(task_.id, &state));
  EXPECT_EQ(state.bytes_confirmed, 4000);
  EXPECT_EQ(state.chunks.size(), 4);
  EXPECT_FALSE(state.invalidated);

  auto second = transfer(&manager);
  ASSERT_EQ(second.outcome, TransferOutcome::SUCCESS) << second.message;
  EXPECT_EQ(second.resumed_from, 4000);
  EXPECT_EQ(second.bytes_transferred, 6000);
  EXPECT_THAT(source_.Opens("track01"), ElementsAre(0, 4000));
  EXPECT_EQ(readFile(second.final_path), data_);
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, Throttled) {
  core::TransferManager manager(config_, &store_);
  source_.ThrottleAt("track01", 2000, std::chrono::milliseconds(1500));
  auto result = transfer(&manager);
  EXPECT_EQ(result.outcome, TransferOutcome::THROTTLED);
  EXPECT_EQ(result.retry_after, std::chrono::milliseconds(1500));
  EXPECT_EQ(result.bytes_confirmed, 2000);
  auto retry = transfer(&manager);
  EXPECT_EQ(retry.outcome, TransferOutcome::SUCCESS);
  EXPECT_EQ(retry.resumed_from, 2000);
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, ChecksumMismatchInvalidates) {
  core::TransferManager manager(config_, &store_);
  task_.expected_checksum = hexHash("something else");
  auto result = transfer(&manager);
  EXPECT_EQ(result.outcome, TransferOutcome::INTEGRITY_ERROR);
  EXPECT_FALSE(util::File::Exists(manager.FinalPath(task_)));
  core::TransferState state;
  ASSERT_TRUE(store_.Load(task_.id, &state));
  EXPECT_TRUE(state.invalidated);
  EXPECT_FALSE(state.last_error.empty());

  // The next attempt starts from scratch.
  task_.expected_checksum = hexHash(data_);
  auto retry = transfer(&manager);
  ASSERT_EQ(retry.outcome, TransferOutcome::SUCCESS) << retry.message;
  EXPECT_EQ(retry.resumed_from, 0);
  EXPECT_EQ(retry.bytes_transferred, 10000);
  EXPECT_THAT(source_.Opens("track01"), ElementsAre(0, 0));
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, StreamLongerThanExpected) {
  core::TransferManager manager(config_, &store_);
  task_.total_size = 9000;
  auto result = transfer(&manager);
  EXPECT_EQ(result.outcome, TransferOutcome::INTEGRITY_ERROR);
  EXPECT_FALSE(util::File::Exists(manager.FinalPath(task_)));
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, StreamShorterThanExpected) {
  core::TransferManager manager(config_, &store_);
  task_.total_size = 12000;
  task_.expected_checksum.clear();
  auto result = transfer(&manager);
  EXPECT_EQ(result.outcome, TransferOutcome::INTEGRITY_ERROR);
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, CorruptedPartialRestarts) {
  core::TransferManager manager(config_, &store_);
  source_.FailAt("track01", 4000);
  ASSERT_EQ(transfer(&manager).outcome, TransferOutcome::STREAM_ERROR);
  {
    std::fstream partial(manager.PartialPath(task_),
                         std::ios::in | std::ios::out | std::ios::binary);
    partial.seekp(100);
    partial.put('#');
  }
  auto result = transfer(&manager);
  ASSERT_EQ(result.outcome, TransferOutcome::SUCCESS) << result.message;
  EXPECT_EQ(result.resumed_from, 0);
  EXPECT_EQ(readFile(result.final_path), data_);
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, CorruptedPartialCaughtAtTheEnd) {
  config_.verify_on_resume = false;
  core::TransferManager manager(config_, &store_);
  source_.FailAt("track01", 4000);
  ASSERT_EQ(transfer(&manager).outcome, TransferOutcome::STREAM_ERROR);
  {
    std::fstream partial(manager.PartialPath(task_),
                         std::ios::in | std::ios::out | std::ios::binary);
    partial.seekp(100);
    partial.put('#');
  }
  auto result = transfer(&manager);
  EXPECT_EQ(result.resumed_from, 4000);
  EXPECT_EQ(result.outcome, TransferOutcome::INTEGRITY_ERROR);
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, TruncatedPartialRestarts) {
  core::TransferManager manager(config_, &store_);
  source_.FailAt("track01", 4000);
  ASSERT_EQ(transfer(&manager).outcome, TransferOutcome::STREAM_ERROR);
  util::File::Remove(manager.PartialPath(task_));
  auto result = transfer(&manager);
  ASSERT_EQ(result.outcome, TransferOutcome::SUCCESS) << result.message;
  EXPECT_EQ(result.resumed_from, 0);
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, SourceChangedRestarts) {
  core::TransferManager manager(config_, &store_);
  source_.Add("track01-remaster", data_);
  source_.FailAt("track01", 4000);
  ASSERT_EQ(transfer(&manager).outcome, TransferOutcome::STREAM_ERROR);
  task_.source_ref = "track01-remaster";
  auto result = transfer(&manager);
  ASSERT_EQ(result.outcome, TransferOutcome::SUCCESS) << result.message;
  EXPECT_EQ(result.resumed_from, 0);
  EXPECT_THAT(source_.Opens("track01-remaster"), ElementsAre(0));
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, CancelledBetweenChunks) {
  core::TransferManager manager(config_, &store_);
  core::TransferHooks hooks;
  hooks.on_checkpoint = [&](const core::TransferState& state) {
    if (state.bytes_confirmed >= 3000) cancelled_ = true;
  };
  auto result = transfer(&manager, hooks);
  EXPECT_EQ(result.outcome, TransferOutcome::CANCELLED);
  EXPECT_EQ(result.bytes_confirmed, 3000);
  core::TransferState state;
  ASSERT_TRUE(store_.Load(task_.id, &state));
  EXPECT_EQ(state.bytes_confirmed, 3000);
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, MissingSource) {
  core::TransferManager manager(config_, &store_);
  task_.source_ref = "nope";
  auto result = transfer(&manager);
  EXPECT_EQ(result.outcome, TransferOutcome::STREAM_ERROR);
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, DefaultDestination) {
  core::TransferManager manager(config_, &store_);
  task_.destination.clear();
  EXPECT_EQ(manager.FinalPath(task_),
            util::File::JoinPath(config_.download_directory, "album%2Ftrack01"));
  EXPECT_EQ(manager.PartialPath(task_), manager.FinalPath(task_) + ".partial");
}

// NOLINTNEXTLINE
TEST_F(TransferManagerTest, DefaultDestinationsAreDistinct) {
  core::TransferManager manager(config_, &store_);
  std::set<std::string> paths;
  for (std::string id : {"a/b", "a_b", "a%2Fb", "a%b", ".hidden", "%2Ehidden",
                         "..", "x"}) {
    core::Task task;
    task.id = id;
    std::string path = manager.FinalPath(task);
    EXPECT_EQ(util::File::BaseDir(path), config_.download_directory) << id;
    EXPECT_TRUE(paths.insert(path).second) << id << " -> " << path;
  }
}

}  // namespace
