#ifndef CORE_TRANSFER_MANAGER_HPP
#define CORE_TRANSFER_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "core/stream_source.hpp"
#include "core/task.hpp"
#include "core/transfer_state_store.hpp"
#include "util/sha256.hpp"

namespace core {

struct TransferConfig {
  std::string download_directory = "downloads";
  uint64_t chunk_size = 2 * 1024 * 1024;
  // Re-hash the confirmed prefix of the partial file before resuming.
  bool verify_on_resume = true;
};

enum class TransferOutcome {
  SUCCESS,
  THROTTLED,
  INTEGRITY_ERROR,
  STREAM_ERROR,
  CANCELLED
};

struct TransferResult {
  TransferOutcome outcome = TransferOutcome::STREAM_ERROR;
  std::string message;
  uint64_t resumed_from = 0;
  uint64_t bytes_transferred = 0;  // fetched by this call
  uint64_t bytes_confirmed = 0;    // on disk when the call returned
  std::chrono::milliseconds retry_after{0};
  std::string final_path;
  util::SHA256_t checksum = util::SHA256_t::ZERO;
};

struct TransferHooks {
  // Called after each checkpoint is persisted.
  std::function<void(const TransferState&)> on_checkpoint;
  // Called once all the bytes are on disk, before the final verification.
  std::function<void()> on_verify;
};

// Moves the bytes of a single task from a StreamSource to
// <download_directory>/<destination>, through a ".partial" file that can be
// resumed after any interruption, including a crash of the process.
class TransferManager {
 public:
  TransferManager(TransferConfig config, TransferStateStore* store);

  // Runs (or resumes from prior, when not null) the transfer of task.
  // cancelled is checked between chunks. Never throws for failures of the
  // source or of the local disk: they are reported in the result.
  TransferResult Transfer(const Task& task, StreamSource* source,
                          const TransferState* prior,
                          const std::atomic<bool>& cancelled,
                          const TransferHooks& hooks = TransferHooks());

  std::string FinalPath(const Task& task) const;
  std::string PartialPath(const Task& task) const;

 private:
  TransferState ResumePoint(const Task& task, const TransferState* prior) const;
  bool PrefixIntact(const TransferState& state) const;
  void Checkpoint(util::ResumableFile* file, TransferState* state,
                  util::File::Chunk chunk);

  TransferConfig config_;
  TransferStateStore* store_;
};

const char* ToString(TransferOutcome outcome);

}  // namespace core

#endif
