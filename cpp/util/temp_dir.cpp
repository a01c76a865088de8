#include "util/temp_dir.hpp"

#include <kj/exception.h>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <system_error>
#include <vector>

#include <ftw.h>

#include "util/file.hpp"

namespace util {

void RemoveTree(const std::string& path) {
  int res = nftw(path.c_str(),
                 [](const char* fpath, const struct stat* sb, int typeflags,
                    struct FTW* ftwbuf) { return remove(fpath); },
                 64, FTW_DEPTH | FTW_PHYS);
  if (res == -1) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  std::string tmpl = File::JoinPath(base, "XXXXXX");
  std::vector<char> data(tmpl.c_str(), tmpl.c_str() + tmpl.size() + 1);
  if (mkdtemp(data.data()) == nullptr) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
  path_ = data.data();
}

void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }

TempDir::~TempDir() {  // NOLINT
  if (!keep_ && !moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { RemoveTree(path_); });
  }
}

}  // namespace util
