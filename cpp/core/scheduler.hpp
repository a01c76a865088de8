#ifndef CORE_SCHEDULER_HPP
#define CORE_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "core/task.hpp"

namespace core {

struct SchedulerConfig {
  // Whether priorities can be changed after a task is enqueued.
  bool allow_priority_updates = false;
};

struct SchedulerStats {
  size_t pending = 0;
  size_t ready = 0;
  size_t running = 0;
  size_t done = 0;
  size_t failed = 0;
  size_t cancelled = 0;
};

// Keeps every known task and decides which one runs next: the READY task with
// the highest priority, oldest first among equal priorities. A task becomes
// READY only when all its dependencies are DONE. All methods are thread safe.
class Scheduler {
 public:
  using Clock = std::chrono::steady_clock;

  // Called with the scheduler lock held on the task that would be dispatched.
  // Returning false leaves it READY at the head of the queue. Must not call
  // back into the scheduler.
  using Admission = std::function<bool(const Task&)>;

  // Called, without the scheduler lock, for every task that reaches a
  // terminal status.
  using TerminalListener = std::function<void(const TaskOutcome&)>;

  enum class CancelResult { CANCELLED, RUNNING, ALREADY_TERMINAL };

  explicit Scheduler(SchedulerConfig config = SchedulerConfig());

  void SetTerminalListener(TerminalListener listener);

  // Adds a task. Throws DuplicateTaskError if the id is live or DONE, and
  // DependencyCycleError if the task would close a cycle; in both cases
  // nothing changes. A FAILED or CANCELLED task with the same id is replaced.
  // Depending on a FAILED or CANCELLED task fails the new task right away.
  // A task that can never run is stored already FAILED with the given
  // failure reason.
  void Enqueue(Task task, FailureReason failure = FailureReason::NONE,
               const std::string& message = "");

  // Moves the best READY task to RUNNING and copies it to *task. Returns
  // false if there is none or if admit refused it.
  bool NextReady(Task* task, const Admission& admit = Admission());

  // Terminal transitions. Failing or cancelling a task fails every task that
  // (transitively) depends on it with BLOCKED_BY_DEPENDENCY.
  void MarkDone(const std::string& id, const std::string& final_path = "");
  void MarkFailed(const std::string& id, FailureReason reason,
                  const std::string& message);
  void MarkCancelled(const std::string& id);

  // Puts a RUNNING task back to READY. It is not dispatched before
  // not_before, and keeps its place among tasks with the same priority.
  void Requeue(const std::string& id, Clock::time_point not_before);

  // Cancels a task that is not running yet. Running tasks are reported as
  // such and must be interrupted by whoever runs them.
  CancelResult Cancel(const std::string& id);

  // Changes the priority of a PENDING or READY task. Returns false if the
  // task is in any other status.
  bool UpdatePriority(const std::string& id, Priority priority);

  uint32_t IncrementAttempts(const std::string& id);
  uint32_t IncrementThrottles(const std::string& id);
  void SetPhase(const std::string& id, Phase phase);

  TaskInfo Get(const std::string& id) const;
  bool Contains(const std::string& id) const;
  SchedulerStats Stats() const;

  // Forgets a terminal task. Tasks enqueued later may still depend on an
  // acknowledged DONE task, and are blocked by an acknowledged failure.
  void Acknowledge(const std::string& id);

  // Blocks until a task may be dispatched, Wake is called or timeout
  // expires. Returns true if a READY task is available.
  bool WaitForWork(std::chrono::milliseconds timeout);

  // Blocks until no task is PENDING, READY or RUNNING. Returns false on
  // timeout.
  bool WaitIdle(std::chrono::milliseconds timeout);

  // Wakes up every thread blocked in WaitForWork.
  void Wake();

 private:
  struct Record {
    Task task;
    uint64_t sequence = 0;
    uint64_t token = 0;
    size_t pending_deps = 0;
    Phase phase = Phase::QUEUED;
    FailureReason reason = FailureReason::NONE;
    std::string message;
    std::string final_path;
    uint32_t throttles = 0;
  };

  struct ReadyEntry {
    Priority priority;
    uint64_t sequence;
    uint64_t token;
    std::string id;
    bool operator<(const ReadyEntry& other) const {
      if (priority != other.priority) return priority < other.priority;
      return sequence > other.sequence;
    }
  };

  Record& Find(const std::string& id);
  const Record& Find(const std::string& id) const;
  bool FindCycle(const Task& task, std::vector<std::string>* cycle) const;
  void PushReady(Record* record);
  void PromoteDue(Clock::time_point now);
  bool HasReady();
  bool IsIdle() const;
  void Finish(Record* record, TaskStatus status, FailureReason reason,
              const std::string& message, std::vector<TaskOutcome>* outcomes);
  void Cascade(const std::string& id, std::vector<TaskOutcome>* outcomes);
  void Notify(const std::vector<TaskOutcome>& outcomes);

  SchedulerConfig config_;
  TerminalListener listener_;

  std::unordered_map<std::string, Record> records_;
  std::unordered_set<std::string> acknowledged_done_;
  // Acknowledged FAILED or CANCELLED ids.
  std::unordered_set<std::string> acknowledged_failed_;
  // Who is waiting on a given id. Only PENDING tasks are relevant.
  std::unordered_map<std::string, std::set<std::string>> dependents_;
  std::priority_queue<ReadyEntry> ready_;
  std::multimap<Clock::time_point, std::pair<std::string, uint64_t>> delayed_;

  uint64_t next_sequence_ = 0;
  uint64_t next_token_ = 0;
  uint64_t wake_generation_ = 0;

  mutable std::mutex mutex_;
  std::condition_variable changed_;
};

}  // namespace core

#endif
