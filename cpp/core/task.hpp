#ifndef CORE_TASK_HPP
#define CORE_TASK_HPP

#include <cstdint>
#include <set>
#include <string>

namespace core {

// Higher values are served first.
enum class Priority { LOW = 1, NORMAL = 2, HIGH = 3, CRITICAL = 4 };

enum class TaskStatus { PENDING, READY, RUNNING, DONE, FAILED, CANCELLED };

// Progress of a task inside its lifecycle, finer than TaskStatus.
enum class Phase {
  QUEUED,
  ACQUIRING_SLOT,
  ACQUIRING_RATE,
  TRANSFERRING,
  VERIFYING,
  RETRY_WAIT,
  FINISHED
};

enum class FailureReason {
  NONE,
  STREAM_ERROR,
  INTEGRITY_ERROR,
  BLOCKED_BY_DEPENDENCY,
  RESOURCE_UNSATISFIABLE,
  INTERNAL_ERROR
};

struct Task {
  std::string id;
  Priority priority = Priority::NORMAL;
  std::set<std::string> depends_on;
  uint64_t resource_estimate = 1;

  // What to fetch and where to put it. An empty destination uses the id.
  std::string source_ref;
  std::string destination;

  // Optional metadata known before the transfer, used for verification.
  int64_t total_size = -1;
  std::string expected_checksum;  // hex SHA256

  // Owned by the scheduler.
  TaskStatus status = TaskStatus::PENDING;
  uint32_t attempts = 0;
};

// Snapshot of a task and its bookkeeping.
struct TaskInfo {
  Task task;
  Phase phase = Phase::QUEUED;
  FailureReason reason = FailureReason::NONE;
  std::string message;
  uint32_t throttles = 0;
  std::string final_path;
};

// Terminal result of a task, as seen by subscribers and status sinks.
struct TaskOutcome {
  std::string id;
  TaskStatus status = TaskStatus::PENDING;
  FailureReason reason = FailureReason::NONE;
  std::string message;
  std::string final_path;
  uint32_t attempts = 0;
};

inline bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::DONE || status == TaskStatus::FAILED ||
         status == TaskStatus::CANCELLED;
}

const char* ToString(Priority priority);
const char* ToString(TaskStatus status);
const char* ToString(Phase phase);
const char* ToString(FailureReason reason);

// Parses LOW, NORMAL, HIGH or CRITICAL (case insensitive).
bool ParsePriority(const std::string& str, Priority* priority);

}  // namespace core

#endif
