#ifndef CORE_TRANSFER_STATE_STORE_HPP
#define CORE_TRANSFER_STATE_STORE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "util/sha256.hpp"

namespace core {

struct ChunkRecord {
  uint64_t offset;
  uint64_t size;
  util::SHA256_t digest;
};

// Checkpoint of a transfer. The first bytes_confirmed bytes of partial_path
// are on disk and described, in order, by chunks.
struct TransferState {
  std::string task_id;
  std::string source_ref;
  std::string partial_path;
  uint64_t bytes_confirmed = 0;
  int64_t total_size = -1;
  util::SHA256_t final_checksum = util::SHA256_t::ZERO;
  std::vector<ChunkRecord> chunks;
  // Set when the completed file failed verification; the next attempt starts
  // over.
  bool invalidated = false;
  std::string last_error;
  int64_t updated_at_ms = 0;
};

// Durable per-task checkpoints, one capnp file per task in a directory.
// Writes are atomic: after a crash a reader sees either the old or the new
// checkpoint.
class TransferStateStore {
 public:
  explicit TransferStateStore(std::string directory);

  void Save(const TransferState& state);

  // Returns false if there is no usable checkpoint for task_id.
  bool Load(const std::string& task_id, TransferState* state) const;

  void Remove(const std::string& task_id);

  std::vector<TransferState> List() const;

  std::string PathFor(const std::string& task_id) const;

 private:
  bool LoadPath(const std::string& path, TransferState* state) const;

  std::string directory_;
};

}  // namespace core

#endif
