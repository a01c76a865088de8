#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/function.h>
#include <kj/io.h>
#include "util/sha256.hpp"

namespace util {

static const constexpr uint32_t kChunkSize = 1024 * 1024;

class File {
 public:
  // A non-owning pointer to a sequence of bytes, usually representing a part of
  // a file.
  using Chunk = kj::ArrayPtr<const kj::byte>;

  // A ChunkReceiver is a function that should be called one or more times with
  // a valid Chunk. An empty Chunk represents EOF.
  using ChunkReceiver = kj::Function<void(Chunk)>;

  // Subsequent calls to this function produce consecutive Chunks from some
  // source. On EOF, an empty Chunk is returned.
  using ChunkProducer = kj::Function<Chunk()>;

  // Lists the regular files directly inside a directory.
  static std::vector<std::string> ListFiles(const std::string& path);

  // Reads the file specified by path in chunks, starting at offset and
  // stopping after limit bytes.
  static ChunkProducer Read(
      const std::string& path,
      uint64_t limit = std::numeric_limits<uint64_t>::max(),
      uint64_t offset = 0);

  // Returns a receiver that writes to the given file, the file ends when an
  // empty chunk is received. The contents replace whatever is at path only
  // then, and only after they reached the disk.
  static ChunkReceiver Write(const std::string& path);

  // Computes the hash of the file specified by path.
  static SHA256_t Hash(const std::string& path);

  // Computes the hash of limit bytes of the file starting at offset.
  static SHA256_t HashRange(const std::string& path, uint64_t offset,
                            uint64_t limit);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Moves a file to a new position, replacing any file already there.
  static void Move(const std::string& from, const std::string& to);

  // Removes a file.
  static void Remove(const std::string& path);

  // Removes a file, if it exists.
  static void RemoveIfExists(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// A file that is written in place at increasing offsets, across process
// restarts. Every Append is on disk when it returns.
class ResumableFile {
 public:
  // Opens path, creating it and its folders if needed, and truncates it to
  // offset. Bytes past offset are discarded.
  ResumableFile(const std::string& path, uint64_t offset);

  // Writes chunk at the current offset and syncs the file.
  void Append(File::Chunk chunk);

  uint64_t Offset() const { return offset_; }
  const std::string& Path() const { return path_; }

  KJ_DISALLOW_COPY(ResumableFile);

 private:
  std::string path_;
  kj::AutoCloseFd fd_;
  uint64_t offset_;
};

}  // namespace util

#endif
