#include "util/file.hpp"
#include "util/sha256.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <system_error>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

// Regular files directly inside path, sorted. Missing directories are empty.
std::vector<std::string> OsListFiles(const std::string& path) {
  std::vector<std::string> files;
  std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(path.c_str()), &closedir);
  if (!dir) {
    if (errno == ENOENT) return files;
    throw std::system_error(errno, std::system_category(), "opendir " + path);
  }
  while (struct dirent* entry = readdir(dir.get())) {  // NOLINT
    std::string file = util::File::JoinPath(path, entry->d_name);
    struct stat st {};
    if (lstat(file.c_str(), &st) == -1 || !S_ISREG(st.st_mode)) continue;
    files.push_back(std::move(file));
  }
  std::sort(files.begin(), files.end());
  return files;
}

// mkostemp wants a mutable, NUL terminated template.
std::vector<char> MakeTemplate(const std::string& prefix) {
  std::string tmpl = prefix + "XXXXXX";
  return std::vector<char>(tmpl.c_str(), tmpl.c_str() + tmpl.size() + 1);
}

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  std::vector<char> data = MakeTemplate(path + ".");
  int fd = mkostemp(data.data(), O_CLOEXEC);
  *tmp = data.data();
  return kj::AutoCloseFd(fd);
}

// Makes a rename durable by syncing the directory that contains it.
void OsSyncDir(const std::string& path) {
  std::string dir = util::File::BaseDir(path);
  if (dir.empty()) dir = ".";
  kj::AutoCloseFd fd{open(dir.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) return;
  if (fsync(fd) == -1 && errno != EINVAL) {
    throw std::system_error(errno, std::system_category(), "fsync " + dir);
  }
}

// Replaces dst with src. Returns errno, or 0 on success.
int OsReplace(const std::string& src, const std::string& dst) {
  if (rename(src.c_str(), dst.c_str()) == -1) return errno;
  return 0;
}

bool OsIsLink(const std::string& path) {
  struct stat buf {};
  if (lstat(path.c_str(), &buf) == -1) return false;
  return S_ISLNK(buf.st_mode);
}

void OsWriteAll(int fd, util::File::Chunk chunk, const std::string& path) {
  size_t pos = 0;
  while (pos < chunk.size()) {
    ssize_t written = write(fd, chunk.begin() + pos,  // NOLINT
                            chunk.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      throw std::system_error(errno, std::system_category(), "write " + path);
    }
    pos += written;
  }
}

util::File::ChunkProducer OsRead(const std::string& path, uint64_t limit,
                                 uint64_t offset) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  if (offset > 0 && lseek(fd, offset, SEEK_SET) == -1) {
    throw std::system_error(errno, std::system_category(), "lseek " + path);
  }
  std::unique_ptr<uint64_t> alreadyRead = std::make_unique<uint64_t>(0);
  auto buf = std::make_unique<std::array<kj::byte, util::kChunkSize>>();
  return [fd = std::move(fd), path, alreadyRead = std::move(alreadyRead), limit,
          buf = std::move(buf)]() mutable {
    if (fd.get() == -1) return util::File::Chunk();
    ssize_t amount;
    uint64_t toRead = util::kChunkSize;
    if (limit - *alreadyRead < toRead) toRead = limit - *alreadyRead;
    while ((amount = read(fd, buf->data(), toRead))) {  // NOLINT
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1) break;
      *alreadyRead += amount;
      return util::File::Chunk(buf->data(), amount);
    }
    if (amount == -1) {
      fd = nullptr;
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    return util::File::Chunk();
  };
}

util::File::ChunkReceiver OsWrite(const std::string& path) {
  std::string temp_file;
  auto fd = OsTempFile(path, &temp_file);

  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  auto done = kj::heap<bool>(false);
  auto written = kj::heap<size_t>(0);
  auto finalize = [done = done.get(), written = written.get(), temp_file]() {
    if (!*done) {
      kj::UnwindDetector detector;
      detector.catchExceptionsIfUnwinding(
          [temp_file]() { util::File::RemoveIfExists(temp_file); });
      if (*written > 0) {
        KJ_LOG(WARNING, "File never finalized!", temp_file);
      }
    }
  };
  return [fd = std::move(fd), temp_file, path, done = std::move(done), written = std::move(written),
          _ = kj::defer(std::move(finalize))](util::File::Chunk chunk) mutable {
    if (fd.get() == -1) return;
    if (chunk.size() == 0) {
      *done = true;
      int error = fsync(fd) == -1 ? errno : OsReplace(temp_file, path);
      if (error != 0) {
        util::File::RemoveIfExists(temp_file);
        throw std::system_error(error, std::system_category(), "Write " + path);
      }
      fd = kj::AutoCloseFd();
      OsSyncDir(path);
      return;
    }
    try {
      OsWriteAll(fd, chunk, temp_file);
    } catch (std::system_error&) {
      fd = nullptr;
      throw;
    }
    *written += chunk.size();
  };
}

// Copies across filesystems, where rename is not possible.
void OsCopy(const std::string& from, const std::string& to) {
  auto producer = util::File::Read(from);
  auto receiver = util::File::Write(to);
  util::File::Chunk chunk;
  while ((chunk = producer()).size()) {
    receiver(chunk);
  }
  receiver(chunk);
}

}  // namespace

namespace util {
std::vector<std::string> File::ListFiles(const std::string& path) {
  return OsListFiles(path);
}

File::ChunkProducer File::Read(const std::string& path, uint64_t limit,
                               uint64_t offset) {
  return OsRead(path, limit, offset);
}

File::ChunkReceiver File::Write(const std::string& path) {
  MakeDirs(BaseDir(path));
  return OsWrite(path);
}

SHA256_t File::Hash(const std::string& path) {
  return HashRange(path, 0, std::numeric_limits<uint64_t>::max());
}

SHA256_t File::HashRange(const std::string& path, uint64_t offset,
                         uint64_t limit) {
  SHA256 hasher;
  auto producer = Read(path, limit, offset);
  Chunk chunk;
  while ((chunk = producer()).size()) {
    hasher.update(chunk);
  }
  return hasher.finalize();
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Move(const std::string& from, const std::string& to) {
  MakeDirs(BaseDir(to));
  int error = OsIsLink(from) ? EXDEV : OsReplace(from, to);
  if (error == EXDEV) {
    OsCopy(from, to);
    Remove(from);
    return;
  }
  if (error != 0) {
    throw std::system_error(error, std::system_category(),
                            "Move " + from + " " + to);
  }
  OsSyncDir(to);
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove " + path);
  }
}

void File::RemoveIfExists(const std::string& path) {
  if (!OsRemove(path) && errno != ENOENT) {
    throw std::system_error(errno, std::system_category(), "remove " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  if (first.empty()) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

ResumableFile::ResumableFile(const std::string& path, uint64_t offset)
    : path_(path), offset_(offset) {
  File::MakeDirs(File::BaseDir(path));
  fd_ = kj::AutoCloseFd(open(path.c_str(),  // NOLINT
                             O_CLOEXEC | O_WRONLY | O_CREAT, S_IRUSR | S_IWUSR));
  if (fd_.get() == -1) {
    throw std::system_error(errno, std::system_category(), "open " + path);
  }
  if (ftruncate(fd_, offset) == -1) {
    throw std::system_error(errno, std::system_category(), "truncate " + path);
  }
  if (lseek(fd_, offset, SEEK_SET) == -1) {
    throw std::system_error(errno, std::system_category(), "lseek " + path);
  }
}

void ResumableFile::Append(File::Chunk chunk) {
  OsWriteAll(fd_, chunk, path_);
  if (fdatasync(fd_) == -1) {
    throw std::system_error(errno, std::system_category(), "fsync " + path_);
  }
  offset_ += chunk.size();
}

}  // namespace util
