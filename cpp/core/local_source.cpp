#include "core/local_source.hpp"

#include <limits>
#include <system_error>

#include "core/errors.hpp"

namespace core {

std::string LocalFileSource::Resolve(const std::string& ref) const {
  static const std::string scheme = "file://";
  std::string path = ref;
  if (path.compare(0, scheme.size(), scheme) == 0) {
    path = path.substr(scheme.size());
  }
  if (root_.empty()) return path;
  return util::File::JoinPath(root_, path);
}

util::File::ChunkProducer LocalFileSource::Open(const std::string& ref,
                                                uint64_t offset) {
  std::string path = Resolve(ref);
  int64_t size = util::File::Size(path);
  if (size < 0) throw StreamError("No such source: " + path);
  if (offset > static_cast<uint64_t>(size)) {
    throw StreamError("Offset " + std::to_string(offset) +
                      " is past the end of " + path);
  }
  util::File::ChunkProducer producer;
  try {
    producer = util::File::Read(path, std::numeric_limits<uint64_t>::max(),
                                offset);
  } catch (std::system_error& exc) {
    throw StreamError(exc.what());
  }
  return [producer = std::move(producer)]() mutable {
    try {
      return producer();
    } catch (std::system_error& exc) {
      throw StreamError(exc.what());
    }
  };
}

}  // namespace core
