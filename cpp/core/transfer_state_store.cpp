#include "core/transfer_state_store.hpp"

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>
#include <cstring>

#include "capnp/transfer_state.capnp.h"
#include "util/file.hpp"

namespace core {

namespace {
const constexpr char* kStateSuffix = ".state";

bool EndsWith(const std::string& str, const std::string& suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}  // namespace

TransferStateStore::TransferStateStore(std::string directory)
    : directory_(std::move(directory)) {
  util::File::MakeDirs(directory_);
}

std::string TransferStateStore::PathFor(const std::string& task_id) const {
  // Task ids are arbitrary strings, file names are not.
  util::SHA256 hasher;
  hasher.update(task_id);
  return util::File::JoinPath(directory_, hasher.finalize().Hex() + kStateSuffix);
}

void TransferStateStore::Save(const TransferState& state) {
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnproto::TransferState>();
  root.setTaskId(state.task_id.c_str());
  root.setSourceRef(state.source_ref.c_str());
  root.setPartialPath(state.partial_path.c_str());
  root.setBytesConfirmed(state.bytes_confirmed);
  root.setTotalSize(state.total_size);
  if (!state.final_checksum.isZero()) {
    root.setFinalChecksum(state.final_checksum.Bytes());
  }
  auto chunks = root.initChunks(state.chunks.size());
  for (size_t i = 0; i < state.chunks.size(); i++) {
    chunks[i].setOffset(state.chunks[i].offset);
    chunks[i].setSize(state.chunks[i].size);
    chunks[i].setDigest(state.chunks[i].digest.Bytes());
  }
  root.setInvalidated(state.invalidated);
  root.setLastError(state.last_error.c_str());
  root.setUpdatedAt(state.updated_at_ms);

  kj::Array<capnp::word> words = capnp::messageToFlatArray(message);
  auto receiver = util::File::Write(PathFor(state.task_id));
  receiver(words.asBytes());
  receiver(util::File::Chunk());
}

bool TransferStateStore::Load(const std::string& task_id,
                              TransferState* state) const {
  std::string path = PathFor(task_id);
  if (!util::File::Exists(path)) return false;
  if (!LoadPath(path, state)) return false;
  if (state->task_id != task_id) {
    KJ_LOG(WARNING, "Checkpoint belongs to another task", path, task_id,
           state->task_id);
    return false;
  }
  return true;
}

bool TransferStateStore::LoadPath(const std::string& path,
                                  TransferState* state) const {
  std::string contents;
  auto producer = util::File::Read(path);
  util::File::Chunk chunk;
  while ((chunk = producer()).size()) {
    contents.append(chunk.asChars().begin(), chunk.size());
  }
  if (contents.empty() || contents.size() % sizeof(capnp::word) != 0) {
    KJ_LOG(WARNING, "Corrupted checkpoint", path, contents.size());
    return false;
  }
  auto words = kj::heapArray<capnp::word>(contents.size() / sizeof(capnp::word));
  std::memcpy(words.begin(), contents.data(), contents.size());
  try {
    capnp::FlatArrayMessageReader reader(words);
    auto root = reader.getRoot<capnproto::TransferState>();
    TransferState loaded;
    loaded.task_id = root.getTaskId().cStr();
    loaded.source_ref = root.getSourceRef().cStr();
    loaded.partial_path = root.getPartialPath().cStr();
    loaded.bytes_confirmed = root.getBytesConfirmed();
    loaded.total_size = root.getTotalSize();
    if (root.getFinalChecksum().size() == util::DIGEST_SIZE) {
      loaded.final_checksum = util::SHA256_t(root.getFinalChecksum());
    }
    uint64_t covered = 0;
    for (auto chunk_record : root.getChunks()) {
      KJ_REQUIRE(chunk_record.getOffset() == covered, "Chunks are not contiguous");
      KJ_REQUIRE(chunk_record.getDigest().size() == util::DIGEST_SIZE,
                 "Invalid chunk digest");
      loaded.chunks.push_back(ChunkRecord{
          chunk_record.getOffset(), chunk_record.getSize(),
          util::SHA256_t(chunk_record.getDigest())});
      covered += chunk_record.getSize();
    }
    KJ_REQUIRE(covered == loaded.bytes_confirmed,
               "Chunks do not cover the confirmed bytes");
    loaded.invalidated = root.getInvalidated();
    loaded.last_error = root.getLastError().cStr();
    loaded.updated_at_ms = root.getUpdatedAt();
    *state = std::move(loaded);
    return true;
  } catch (kj::Exception& exc) {
    KJ_LOG(WARNING, "Corrupted checkpoint", path, exc.getDescription());
    return false;
  }
}

void TransferStateStore::Remove(const std::string& task_id) {
  util::File::RemoveIfExists(PathFor(task_id));
}

std::vector<TransferState> TransferStateStore::List() const {
  std::vector<TransferState> states;
  for (const auto& path : util::File::ListFiles(directory_)) {
    if (!EndsWith(path, kStateSuffix)) continue;
    TransferState state;
    if (LoadPath(path, &state)) states.push_back(std::move(state));
  }
  return states;
}

}  // namespace core
