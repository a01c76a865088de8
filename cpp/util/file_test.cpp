#include "util/file.hpp"
#include "util/temp_dir.hpp"
#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/sha256.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::StartsWith;
using ::testing::UnorderedElementsAreArray;

const std::string test_tmpdir = "/tmp/audiofetch_testdir";

int unlink_cb(const char* fpath, const struct stat* /*unused*/, int /*unused*/,
              struct FTW* /*unused*/) {
  int rv = remove(fpath);
  if (rv) perror(fpath);
  return rv;
}

int rmrf(const char* path) {
  return nftw(path, unlink_cb, 64, FTW_DEPTH | FTW_PHYS);
}

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

util::File::Chunk asChunk(const std::string& content) {
  auto data = reinterpret_cast<const kj::byte*>(content.data());  // NOLINT
  return util::File::Chunk(data, content.size());
}

void writeFile(util::File::ChunkReceiver* receiver,
               const std::string& content) {
  size_t written = 0;
  while (written < content.size()) {
    size_t size = std::min(content.size() - written,
                           static_cast<size_t>(util::kChunkSize));
    (*receiver)(asChunk(content).slice(written, written + size));
    written += size;
  }
  (*receiver)(util::File::Chunk());
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

std::string readFile(util::File::ChunkProducer* producer) {
  util::File::Chunk chunk;
  std::string content;
  while ((chunk = (*producer)()).size()) {
    content += std::string(chunk.asChars().begin(), chunk.size());
  }
  return content;
}

bool fileExists(const std::string& path) {
  auto file = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (file < 0) return false;
  close(file);
  return true;
}

bool dirExists(const std::string& path) {
  auto dir = opendir(path.c_str());
  if (!dir) return false;
  closedir(dir);
  return true;
}

std::string makeTestDir(const std::string& name) {
  mkdir(test_tmpdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  std::string testdir = test_tmpdir + "/" + name;
  rmrf(testdir.c_str());
  mkdir(testdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  return testdir;
}

/*
 * ListFiles
 */

// NOLINTNEXTLINE
TEST(File, ListFiles) {
  std::string testdir = makeTestDir("list_files");
  for (auto name : {"c.state", "a.state", "b.state"}) {
    writeFile(testdir + "/" + name, "fooo");
  }
  EXPECT_THAT(util::File::ListFiles(testdir),
              ElementsAre(testdir + "/a.state", testdir + "/b.state",
                          testdir + "/c.state"));
}

// NOLINTNEXTLINE
TEST(File, ListFilesSkipsDirectories) {
  std::string testdir = makeTestDir("list_files");
  std::string subdir = testdir + "/nested";
  mkdir(subdir.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  writeFile(subdir + "/deep.state", "fooo");
  writeFile(testdir + "/top.state", "fooo");
  ASSERT_EQ(symlink((testdir + "/top.state").c_str(),
                    (testdir + "/link.state").c_str()),
            0);
  EXPECT_THAT(util::File::ListFiles(testdir),
              ElementsAre(testdir + "/top.state"));
}

// NOLINTNEXTLINE
TEST(File, ListFilesEmpty) {
  std::string testdir = makeTestDir("list_files");
  auto foundFiles = util::File::ListFiles(testdir);
  EXPECT_THAT(foundFiles, IsEmpty());
}

// NOLINTNEXTLINE
TEST(File, ListFilesNoSuchDir) {
  std::string testdir = test_tmpdir + "/lolnope/ahah";
  auto foundFiles = util::File::ListFiles(testdir);
  EXPECT_THAT(foundFiles, IsEmpty());
}

/*
 * Read
 */

// NOLINTNEXTLINE
TEST(File, Read) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/file";
  std::string content = "lallabalalla\n";
  writeFile(filepath, content);
  auto reader = util::File::Read(filepath);
  std::string realContent = readFile(&reader);
  EXPECT_EQ(content, realContent);
}

// NOLINTNEXTLINE
TEST(File, ReadBigFile) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/bigfile";
  std::string content(util::kChunkSize * 2 + 1, 'x');

  writeFile(filepath, content);
  auto reader = util::File::Read(filepath);
  std::string realContent = readFile(&reader);
  EXPECT_EQ(content, realContent);
}

// NOLINTNEXTLINE
TEST(File, ReadFromOffset) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "0123456789");
  auto reader = util::File::Read(filepath, 1000, 4);
  EXPECT_EQ(readFile(&reader), "456789");
}

// NOLINTNEXTLINE
TEST(File, ReadWithLimit) {
  std::string testdir = makeTestDir("read");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "0123456789");
  auto reader = util::File::Read(filepath, 3, 2);
  EXPECT_EQ(readFile(&reader), "234");
}

// NOLINTNEXTLINE
TEST(File, ReadNoSuchFile) {
  std::string filepath = "/no/such/file";
  EXPECT_THROW(util::File::Read(filepath), std::system_error);  // NOLINT
}

/*
 * Write
 */

// NOLINTNEXTLINE
TEST(File, Write) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  std::string content = "wowowow\n";
  {
    auto writer = util::File::Write(filepath);
    writeFile(&writer, content);
  }
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteBigFile) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/bigfile";
  std::string content(util::kChunkSize * 2 + 1, 'x');
  {
    auto writer = util::File::Write(filepath);
    writeFile(&writer, content);
  }
  ASSERT_EQ(content, readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteVisibleOnlyWhenFinalized) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "old");
  {
    auto writer = util::File::Write(filepath);
    writer(asChunk("new contents"));
    EXPECT_EQ("old", readFile(filepath));
  }
  // Never finalized: the old contents stay and no temporary is left behind.
  EXPECT_EQ("old", readFile(filepath));
  EXPECT_THAT(util::File::ListFiles(testdir),
              UnorderedElementsAreArray({filepath}));
}

// NOLINTNEXTLINE
TEST(File, WriteReplaces) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/state";
  writeFile(filepath, "first checkpoint, longer than the second");
  {
    auto writer = util::File::Write(filepath);
    writeFile(&writer, "second");
  }
  EXPECT_EQ("second", readFile(filepath));
}

// NOLINTNEXTLINE
TEST(File, WriteCreatesDirs) {
  std::string testdir = makeTestDir("write");
  std::string filepath = testdir + "/a/b/state";
  {
    auto writer = util::File::Write(filepath);
    writeFile(&writer, "nested");
  }
  EXPECT_EQ("nested", readFile(filepath));
}

/*
 * Hash
 */

// NOLINTNEXTLINE
TEST(File, Hash) {
  std::string testdir = makeTestDir("hash");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "random content");
  util::SHA256_t hash = util::File::Hash(filepath);
  EXPECT_EQ(hash.Hex(),
            "276e3a2aee034b91dba3e553be3a560d27b380575fd43475fdc8f46d552709bb");
  EXPECT_FALSE(hash.isZero());
}

// NOLINTNEXTLINE
TEST(File, HashBigFile) {
  std::string testdir = makeTestDir("hash");
  std::string filepath = testdir + "/bigfile";
  std::string content(util::kChunkSize * 2 + 1, 'x');
  writeFile(filepath, content);
  util::SHA256_t hash = util::File::Hash(filepath);
  EXPECT_EQ(hash.Hex(),
            "71ac24a75f6bc57bc51b43b3d13c3009aa243986b77a92102a3097c9e53123e9");
}

// NOLINTNEXTLINE
TEST(File, HashEmptyFile) {
  std::string testdir = makeTestDir("hash");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "");
  util::SHA256_t hash = util::File::Hash(filepath);
  EXPECT_EQ(hash.Hex(),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

// NOLINTNEXTLINE
TEST(File, HashRange) {
  std::string testdir = makeTestDir("hash");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "xxabcyy");
  EXPECT_EQ(util::File::HashRange(filepath, 2, 3).Hex(),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// NOLINTNEXTLINE
TEST(File, HashNoSuchFile) {
  std::string testdir = makeTestDir("hash");
  std::string filepath = testdir + "/no/such/file";
  EXPECT_THROW(util::File::Hash(filepath), std::system_error);  // NOLINT
}

/*
 * MakeDirs
 */

// NOLINTNEXTLINE
TEST(File, MakeDirs) {
  std::string testdir = makeTestDir("makeDirs");
  std::string dirpath = testdir + "/wow/such/dir";
  EXPECT_FALSE(dirExists(dirpath));
  util::File::MakeDirs(dirpath);
  EXPECT_TRUE(dirExists(dirpath));
}

/*
 * Move
 */

// NOLINTNEXTLINE
TEST(File, Move) {
  std::string testdir = makeTestDir("move");
  std::string filepath = testdir + "/track.partial";
  std::string filepath2 = testdir + "/album/track.flac";
  std::string content{"fLaC"};
  writeFile(filepath, content);
  util::File::Move(filepath, filepath2);
  EXPECT_FALSE(fileExists(filepath));
  EXPECT_EQ(content, readFile(filepath2));
}

// NOLINTNEXTLINE
TEST(File, MoveReplaces) {
  std::string testdir = makeTestDir("move");
  std::string filepath = testdir + "/track.partial";
  std::string filepath2 = testdir + "/track.flac";
  writeFile(filepath, "fresh download");
  writeFile(filepath2, "stale copy");
  util::File::Move(filepath, filepath2);
  EXPECT_FALSE(fileExists(filepath));
  EXPECT_EQ("fresh download", readFile(filepath2));
}

// NOLINTNEXTLINE
TEST(File, MoveSymlinkCopiesTarget) {
  std::string testdir = makeTestDir("move");
  std::string target = testdir + "/target";
  std::string link = testdir + "/link";
  std::string dest = testdir + "/dest";
  writeFile(target, "linked contents");
  ASSERT_EQ(symlink(target.c_str(), link.c_str()), 0);
  util::File::Move(link, dest);
  EXPECT_FALSE(fileExists(link));
  EXPECT_TRUE(fileExists(target));
  EXPECT_EQ("linked contents", readFile(dest));
}

// NOLINTNEXTLINE
TEST(File, MoveNoSuchFile) {
  std::string testdir = makeTestDir("move");
  EXPECT_THROW(util::File::Move(testdir + "/nope", testdir + "/dest"),  // NOLINT
               std::system_error);
}

/*
 * Remove
 */

// NOLINTNEXTLINE
TEST(File, Remove) {
  std::string testdir = makeTestDir("remove");
  std::string filepath = testdir + "/file";
  writeFile(filepath, "holaa");
  util::File::Remove(filepath);
  EXPECT_FALSE(fileExists(filepath));
}

// NOLINTNEXTLINE
TEST(File, RemoveNoSuchFile) {
  std::string testdir = makeTestDir("remove");
  std::string filepath = testdir + "/file";
  EXPECT_THROW(util::File::Remove(filepath), std::system_error);  // NOLINT
  EXPECT_NO_THROW(util::File::RemoveIfExists(filepath));          // NOLINT
}

/*
 * RemoveTree
 */

// NOLINTNEXTLINE
TEST(File, RemoveTree) {
  std::string testdir = makeTestDir("removetree");
  std::string dirpath = testdir + "/dir";
  std::string dirpath2 = dirpath + "/baz";
  mkdir(dirpath.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  mkdir(dirpath2.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH);
  std::array<std::string, 3> files = {dirpath + "/foo", dirpath + "/bar",
                                      dirpath2 + "/buz"};
  for (const auto& file : files) writeFile(file, "holaa");
  util::RemoveTree(dirpath);
  for (const auto& file : files) EXPECT_FALSE(fileExists(file));
  EXPECT_FALSE(dirExists(dirpath));
  EXPECT_FALSE(dirExists(dirpath2));
}

/*
 * ResumableFile
 */

// NOLINTNEXTLINE
TEST(ResumableFile, AppendsFromZero) {
  std::string testdir = makeTestDir("resumable");
  std::string filepath = testdir + "/track.partial";
  {
    util::ResumableFile file(filepath, 0);
    file.Append(asChunk("abc"));
    file.Append(asChunk("def"));
    EXPECT_EQ(file.Offset(), 6);
  }
  EXPECT_EQ("abcdef", readFile(filepath));
}

// NOLINTNEXTLINE
TEST(ResumableFile, TruncatesToOffset) {
  std::string testdir = makeTestDir("resumable");
  std::string filepath = testdir + "/track.partial";
  writeFile(filepath, "abcdefGARBAGE");
  {
    util::ResumableFile file(filepath, 6);
    EXPECT_EQ("abcdef", readFile(filepath));
    file.Append(asChunk("ghi"));
  }
  EXPECT_EQ("abcdefghi", readFile(filepath));
}

// NOLINTNEXTLINE
TEST(ResumableFile, MakesDirs) {
  std::string testdir = makeTestDir("resumable");
  std::string filepath = testdir + "/a/b/track.partial";
  util::ResumableFile file(filepath, 0);
  file.Append(asChunk("x"));
  EXPECT_EQ("x", readFile(filepath));
}

/*
 * TempDir
 */

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string testdir = makeTestDir("tempdir");
  std::string path;
  {
    util::TempDir tmp(testdir);
    path = tmp.Path();
    EXPECT_THAT(path, StartsWith(testdir));
    writeFile(util::File::JoinPath(path, "file"), "holaa");
    EXPECT_TRUE(dirExists(path));
  }
  EXPECT_FALSE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string testdir = makeTestDir("tempdir");
  std::string path;
  {
    util::TempDir tmp(testdir);
    tmp.Keep();
    path = tmp.Path();
  }
  EXPECT_TRUE(dirExists(path));
}

/*
 * JoinPath
 */

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a/b", "c/d"), "a/b/c/d");
}

// NOLINTNEXTLINE
TEST(File, JoinPathFirstAbs) {
  EXPECT_EQ(util::File::JoinPath("/a/b", "c/d"), "/a/b/c/d");
}

// NOLINTNEXTLINE
TEST(File, JoinPathSecondAbs) {
  EXPECT_EQ(util::File::JoinPath("/a/b", "/c/d"), "/c/d");
}

// NOLINTNEXTLINE
TEST(File, JoinPathFirstEmpty) {
  EXPECT_EQ(util::File::JoinPath("", "c/d"), "c/d");
}

/*
 * BaseDir / BaseName
 */

// NOLINTNEXTLINE
TEST(File, BaseDir) { EXPECT_EQ(util::File::BaseDir("a/b/c"), "a/b"); }

// NOLINTNEXTLINE
TEST(File, BaseName) { EXPECT_EQ(util::File::BaseName("a/b/c"), "c"); }

}  // namespace
