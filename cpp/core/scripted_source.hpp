#ifndef CORE_SCRIPTED_SOURCE_HPP
#define CORE_SCRIPTED_SOURCE_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/stream_source.hpp"

namespace core {

// In-memory StreamSource for tests. Streams are served in pieces of at most
// piece_size bytes; faults and holds fire when a stream reaches a given
// offset.
class ScriptedSource : public StreamSource {
 public:
  explicit ScriptedSource(size_t piece_size = 512) : piece_size_(piece_size) {}

  void Add(const std::string& ref, std::string data) {
    std::lock_guard<std::mutex> lck(mutex_);
    streams_[ref].data = std::move(data);
  }

  // The next `times` reads at offset throw ThrottledError.
  void ThrottleAt(const std::string& ref, uint64_t offset,
                  std::chrono::milliseconds retry_after, int times = 1) {
    std::lock_guard<std::mutex> lck(mutex_);
    streams_[ref].faults[offset] = Fault{true, retry_after, times};
  }

  // The next `times` reads at offset throw StreamError.
  void FailAt(const std::string& ref, uint64_t offset, int times = 1) {
    std::lock_guard<std::mutex> lck(mutex_);
    streams_[ref].faults[offset] =
        Fault{false, std::chrono::milliseconds(0), times};
  }

  // Reads at offset block until Release(ref).
  void HoldAt(const std::string& ref, uint64_t offset) {
    std::lock_guard<std::mutex> lck(mutex_);
    streams_[ref].hold_at = offset;
    streams_[ref].released = false;
  }

  void Release(const std::string& ref) {
    {
      std::lock_guard<std::mutex> lck(mutex_);
      streams_[ref].released = true;
    }
    changed_.notify_all();
  }

  // Waits until at least count streams are blocked on a hold.
  bool WaitHeld(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lck(mutex_);
    return changed_.wait_for(lck, timeout,
                             [&]() { return held_.size() >= count; });
  }

  std::set<std::string> Held() {
    std::lock_guard<std::mutex> lck(mutex_);
    return held_;
  }

  // Offsets at which ref was opened, in order.
  std::vector<uint64_t> Opens(const std::string& ref) {
    std::lock_guard<std::mutex> lck(mutex_);
    return streams_[ref].opens;
  }

  util::File::ChunkProducer Open(const std::string& ref,
                                 uint64_t offset) override {
    std::lock_guard<std::mutex> lck(mutex_);
    auto it = streams_.find(ref);
    if (it == streams_.end()) throw StreamError("No such stream " + ref);
    it->second.opens.push_back(offset);
    if (offset > it->second.data.size()) {
      throw StreamError("Offset past the end of " + ref);
    }
    uint64_t pos = offset;
    return [this, ref, pos]() mutable { return Next(ref, &pos); };
  }

 private:
  struct Fault {
    bool throttle;
    std::chrono::milliseconds retry_after;
    int remaining;
  };

  struct Stream {
    std::string data;
    std::map<uint64_t, Fault> faults;
    int64_t hold_at = -1;
    bool released = true;
    std::vector<uint64_t> opens;
  };

  util::File::Chunk Next(const std::string& ref, uint64_t* pos) {
    std::unique_lock<std::mutex> lck(mutex_);
    Stream& stream = streams_.at(ref);
    if (stream.hold_at == static_cast<int64_t>(*pos) && !stream.released) {
      held_.insert(ref);
      changed_.notify_all();
      changed_.wait(lck, [&]() { return stream.released; });
      held_.erase(ref);
    }
    auto fault = stream.faults.find(*pos);
    if (fault != stream.faults.end() && fault->second.remaining > 0) {
      fault->second.remaining--;
      if (fault->second.throttle) {
        throw ThrottledError("429 Too Many Requests",
                             fault->second.retry_after);
      }
      throw StreamError("Connection reset by peer");
    }
    if (*pos >= stream.data.size()) return util::File::Chunk();
    uint64_t end = std::min<uint64_t>(stream.data.size(), *pos + piece_size_);
    auto next_fault = stream.faults.upper_bound(*pos);
    if (next_fault != stream.faults.end()) {
      end = std::min(end, next_fault->first);
    }
    if (stream.hold_at > static_cast<int64_t>(*pos)) {
      end = std::min(end, static_cast<uint64_t>(stream.hold_at));
    }
    util::File::Chunk chunk(
        reinterpret_cast<const kj::byte*>(stream.data.data()) + *pos,  // NOLINT
        end - *pos);
    *pos = end;
    return chunk;
  }

  size_t piece_size_;
  std::map<std::string, Stream> streams_;
  std::set<std::string> held_;
  std::mutex mutex_;
  std::condition_variable changed_;
};

}  // namespace core

#endif
