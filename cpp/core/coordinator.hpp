#ifndef CORE_COORDINATOR_HPP
#define CORE_COORDINATOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "core/concurrency_controller.hpp"
#include "core/rate_governor.hpp"
#include "core/scheduler.hpp"
#include "core/stream_source.hpp"
#include "core/task.hpp"
#include "core/transfer_manager.hpp"
#include "core/transfer_state_store.hpp"

namespace core {

struct CoordinatorConfig {
  // Stream and integrity failures allowed before a task is FAILED.
  uint32_t max_attempts = 5;
  std::chrono::milliseconds backoff_base{1000};
  std::chrono::milliseconds backoff_cap{60000};
  // Relative amplitude of the random jitter applied to every backoff.
  double jitter = 0.2;
  // Upper bound on how long an idle worker sleeps before looking again.
  std::chrono::milliseconds poll_interval{100};
  // Number of worker threads, 0 means one per concurrency slot.
  size_t workers = 0;
};

// Drives tasks through their lifecycle: takes the next task from the
// scheduler once the concurrency controller admits it, waits for the rate
// governor, runs the transfer and turns its outcome into a terminal status or
// a delayed retry.
class Coordinator {
 public:
  // None of the pointers is owned; they must outlive the coordinator.
  Coordinator(CoordinatorConfig config, Scheduler* scheduler,
              ConcurrencyController* controller, RateGovernor* governor,
              TransferStateStore* store, TransferManager* transfers,
              StreamSource* source, StatusSink* sink = nullptr);
  ~Coordinator();

  void Start();

  // Interrupts running transfers at their next chunk boundary, puts them back
  // to READY and joins the workers. Checkpoints are kept, so a later Start
  // (or a new process) resumes them.
  void Stop();

  // Validates and enqueues a task. Same errors as Scheduler::Enqueue.
  void Enqueue(Task task);

  void Cancel(const std::string& id);
  TaskInfo GetStatus(const std::string& id) const;

  // The future becomes ready when the task reaches a terminal status.
  std::shared_future<TaskOutcome> Subscribe(const std::string& id);

  void Acknowledge(const std::string& id);
  bool UpdatePriority(const std::string& id, Priority priority);

  // Last checkpoint of the task, false if there is none.
  bool Progress(const std::string& id, TransferState* state) const;

  SchedulerStats Stats() const;
  bool WaitIdle(std::chrono::milliseconds timeout);

  // Delay before the next try after the given number of failures.
  std::chrono::milliseconds Backoff(uint32_t failures) const;

 private:
  struct InFlight {
    std::atomic<bool> interrupt{false};
    std::atomic<bool> cancel_requested{false};
  };

  struct Subscription {
    std::promise<TaskOutcome> promise;
    std::shared_future<TaskOutcome> future;
  };

  void ThreadBody();
  void Run(const Task& task,
           std::unique_ptr<ConcurrencyController::Permit> permit);
  void Resolve(const Task& task, const TransferResult& result,
               const InFlight& flags);
  void Retry(const std::string& id, FailureReason reason,
             const std::string& message);
  void Interrupted(const std::string& id, const InFlight& flags);
  bool Sleep(std::chrono::microseconds duration, const InFlight& flags);
  std::shared_ptr<InFlight> Track(const std::string& id);
  void Untrack(const std::string& id);
  void OnTerminal(const TaskOutcome& outcome);
  // Records that id writes to path. Throws if a live task already does.
  // Returns false if the path was already recorded for id.
  bool ReserveDestination(const std::string& id, const std::string& path);

  const CoordinatorConfig config_;
  Scheduler* scheduler_;
  ConcurrencyController* controller_;
  RateGovernor* governor_;
  TransferStateStore* store_;
  TransferManager* transfers_;
  StreamSource* source_;
  StatusSink* sink_;

  std::atomic<bool> quitting_{false};
  bool started_ = false;
  std::vector<std::thread> threads_;
  uint64_t releases_ = 0;
  std::unordered_map<std::string, std::shared_ptr<InFlight>> in_flight_;
  std::unordered_map<std::string, std::shared_ptr<Subscription>> subscribers_;
  // Final path -> id of the last task enqueued to write it.
  std::unordered_map<std::string, std::string> destinations_;
  mutable std::mutex mutex_;
  std::condition_variable wakeup_;
};

}  // namespace core

#endif
