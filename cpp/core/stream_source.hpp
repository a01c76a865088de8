#ifndef CORE_STREAM_SOURCE_HPP
#define CORE_STREAM_SOURCE_HPP

#include <cstdint>
#include <string>

#include "core/task.hpp"
#include "util/file.hpp"

namespace core {

// Something bytes can be downloaded from.
class StreamSource {
 public:
  // Opens the stream identified by ref, positioned at offset. The producer
  // returns consecutive chunks and an empty chunk at the end of the stream.
  // Both calls may throw ThrottledError or StreamError.
  virtual util::File::ChunkProducer Open(const std::string& ref,
                                         uint64_t offset) = 0;
  virtual ~StreamSource() = default;
};

// Receives the terminal state of every task, e.g. to update a catalog.
class StatusSink {
 public:
  virtual void Project(const TaskOutcome& outcome) = 0;
  virtual ~StatusSink() = default;
};

}  // namespace core

#endif
