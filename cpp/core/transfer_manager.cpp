#include "core/transfer_manager.hpp"

#include <kj/debug.h>
#include <algorithm>
#include <system_error>
#include <vector>

#include "core/errors.hpp"
#include "util/file.hpp"

namespace core {

namespace {
int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// File name for a task without destination. Distinct ids give distinct
// names: '%', '/' and NUL are percent-escaped, and so is a leading '.'.
std::string SafeName(const std::string& id) {
  static const char kHex[] = "0123456789ABCDEF";
  if (id.empty()) return "%";
  std::string name;
  for (size_t i = 0; i < id.size(); i++) {
    unsigned char c = id[i];
    if (c == '%' || c == '/' || c == '\0' || (i == 0 && c == '.')) {
      name += '%';
      name += kHex[c >> 4];
      name += kHex[c & 0xF];
    } else {
      name += c;
    }
  }
  return name;
}
}  // namespace

TransferManager::TransferManager(TransferConfig config,
                                 TransferStateStore* store)
    : config_(std::move(config)), store_(store) {
  KJ_REQUIRE(config_.chunk_size > 0, "Invalid chunk size");
}

std::string TransferManager::FinalPath(const Task& task) const {
  return util::File::JoinPath(
      config_.download_directory,
      task.destination.empty() ? SafeName(task.id) : task.destination);
}

std::string TransferManager::PartialPath(const Task& task) const {
  return FinalPath(task) + ".partial";
}

bool TransferManager::PrefixIntact(const TransferState& state) const {
  uint64_t covered = 0;
  try {
    for (const auto& chunk : state.chunks) {
      if (chunk.offset != covered) return false;
      util::SHA256_t digest = util::File::HashRange(state.partial_path,
                                                    chunk.offset, chunk.size);
      if (digest != chunk.digest) return false;
      covered += chunk.size;
    }
  } catch (std::system_error& exc) {
    KJ_LOG(WARNING, "Cannot read partial file", state.partial_path,
           exc.what());
    return false;
  }
  return covered == state.bytes_confirmed;
}

TransferState TransferManager::ResumePoint(const Task& task,
                                           const TransferState* prior) const {
  TransferState fresh;
  fresh.task_id = task.id;
  fresh.source_ref = task.source_ref;
  fresh.partial_path = PartialPath(task);
  fresh.total_size = task.total_size;
  if (!task.expected_checksum.empty()) {
    fresh.final_checksum = util::SHA256_t(task.expected_checksum);
  }
  if (prior == nullptr) return fresh;

  std::string restart;
  if (prior->invalidated) {
    restart = "previous attempt failed verification: " + prior->last_error;
  } else if (prior->source_ref != task.source_ref) {
    restart = "source changed";
  } else if (prior->partial_path != fresh.partial_path) {
    restart = "destination changed";
  } else if (util::File::Size(prior->partial_path) <
             static_cast<int64_t>(prior->bytes_confirmed)) {
    restart = "partial file is shorter than the checkpoint";
  } else if (config_.verify_on_resume && !PrefixIntact(*prior)) {
    restart = "partial file does not match the checkpoint";
  }
  if (!restart.empty()) {
    KJ_LOG(WARNING, "Restarting transfer from scratch", task.id, restart);
    return fresh;
  }

  TransferState resumed = *prior;
  if (task.total_size >= 0) resumed.total_size = task.total_size;
  if (!fresh.final_checksum.isZero()) {
    resumed.final_checksum = fresh.final_checksum;
  }
  return resumed;
}

void TransferManager::Checkpoint(util::ResumableFile* file,
                                 TransferState* state,
                                 util::File::Chunk chunk) {
  util::SHA256 hasher;
  hasher.update(chunk);
  file->Append(chunk);
  state->chunks.push_back(
      ChunkRecord{state->bytes_confirmed, chunk.size(), hasher.finalize()});
  state->bytes_confirmed += chunk.size();
  state->updated_at_ms = NowMs();
  store_->Save(*state);
}

TransferResult TransferManager::Transfer(const Task& task,
                                         StreamSource* source,
                                         const TransferState* prior,
                                         const std::atomic<bool>& cancelled,
                                         const TransferHooks& hooks) {
  TransferResult result;
  TransferState state;
  auto finish = [&](TransferOutcome outcome, const std::string& message) {
    result.outcome = outcome;
    result.message = message;
    result.bytes_confirmed = state.bytes_confirmed;
    return result;
  };
  auto invalidate = [&](const std::string& message) {
    KJ_LOG(WARNING, "Transfer failed verification", task.id, message);
    state.invalidated = true;
    state.last_error = message;
    state.updated_at_ms = NowMs();
    store_->Save(state);
    return finish(TransferOutcome::INTEGRITY_ERROR, message);
  };

  try {
    result.final_path = FinalPath(task);
    state = ResumePoint(task, prior);
    result.resumed_from = state.bytes_confirmed;
    util::ResumableFile file(state.partial_path, state.bytes_confirmed);
    state.updated_at_ms = NowMs();
    store_->Save(state);
    if (result.resumed_from > 0) {
      KJ_LOG(INFO, "Resuming transfer", task.id, result.resumed_from);
    }

    util::File::ChunkProducer stream =
        source->Open(task.source_ref, state.bytes_confirmed);
    std::vector<kj::byte> buffer;
    bool eof = false;
    while (true) {
      if (cancelled.load()) {
        KJ_LOG(INFO, "Transfer cancelled", task.id, state.bytes_confirmed);
        return finish(TransferOutcome::CANCELLED, "Cancelled");
      }
      while (!eof && buffer.size() < config_.chunk_size) {
        util::File::Chunk piece = stream();
        if (piece.size() == 0) {
          eof = true;
        } else {
          buffer.insert(buffer.end(), piece.begin(), piece.end());
        }
      }
      size_t size = std::min<uint64_t>(buffer.size(), config_.chunk_size);
      if (size == 0) break;
      Checkpoint(&file, &state, util::File::Chunk(buffer.data(), size));
      result.bytes_transferred += size;
      buffer.erase(buffer.begin(), buffer.begin() + size);
      if (state.total_size >= 0 &&
          state.bytes_confirmed > static_cast<uint64_t>(state.total_size)) {
        return invalidate("Stream is longer than " +
                          std::to_string(state.total_size) + " bytes");
      }
      if (hooks.on_checkpoint) hooks.on_checkpoint(state);
    }

    if (hooks.on_verify) hooks.on_verify();
    if (state.total_size >= 0 &&
        state.bytes_confirmed != static_cast<uint64_t>(state.total_size)) {
      return invalidate("Size mismatch: expected " +
                        std::to_string(state.total_size) + " got " +
                        std::to_string(state.bytes_confirmed));
    }
    util::SHA256_t checksum = util::File::Hash(state.partial_path);
    if (!state.final_checksum.isZero() && checksum != state.final_checksum) {
      return invalidate("Checksum mismatch: expected " +
                        state.final_checksum.Hex() + " got " + checksum.Hex());
    }
    util::File::Move(state.partial_path, result.final_path);
    result.checksum = checksum;
    KJ_LOG(INFO, "Transfer completed", task.id, result.final_path,
           state.bytes_confirmed);
    return finish(TransferOutcome::SUCCESS, "");
  } catch (ThrottledError& exc) {
    result.retry_after = exc.RetryAfter();
    return finish(TransferOutcome::THROTTLED, exc.what());
  } catch (StreamError& exc) {
    return finish(TransferOutcome::STREAM_ERROR, exc.what());
  } catch (std::system_error& exc) {
    KJ_LOG(WARNING, "Local I/O error", task.id, exc.what());
    return finish(TransferOutcome::STREAM_ERROR, exc.what());
  } catch (kj::Exception& exc) {
    KJ_LOG(WARNING, "Transfer error", task.id, exc.getDescription());
    return finish(TransferOutcome::STREAM_ERROR, exc.getDescription().cStr());
  }
}

const char* ToString(TransferOutcome outcome) {
  switch (outcome) {
    case TransferOutcome::SUCCESS:
      return "SUCCESS";
    case TransferOutcome::THROTTLED:
      return "THROTTLED";
    case TransferOutcome::INTEGRITY_ERROR:
      return "INTEGRITY_ERROR";
    case TransferOutcome::STREAM_ERROR:
      return "STREAM_ERROR";
    case TransferOutcome::CANCELLED:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

}  // namespace core
