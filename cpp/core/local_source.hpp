#ifndef CORE_LOCAL_SOURCE_HPP
#define CORE_LOCAL_SOURCE_HPP

#include <string>

#include "core/stream_source.hpp"

namespace core {

// Reads sources from the local filesystem. References are paths, optionally
// prefixed by "file://"; relative paths are resolved against root.
class LocalFileSource : public StreamSource {
 public:
  explicit LocalFileSource(std::string root = "") : root_(std::move(root)) {}

  util::File::ChunkProducer Open(const std::string& ref,
                                 uint64_t offset) override;

  std::string Resolve(const std::string& ref) const;

 private:
  std::string root_;
};

}  // namespace core

#endif
