#include "core/scheduler.hpp"

#include <kj/debug.h>
#include <algorithm>
#include <deque>

#include "core/errors.hpp"

namespace core {

Scheduler::Scheduler(SchedulerConfig config) : config_(config) {}

void Scheduler::SetTerminalListener(TerminalListener listener) {
  std::lock_guard<std::mutex> lck(mutex_);
  listener_ = std::move(listener);
}

Scheduler::Record& Scheduler::Find(const std::string& id) {
  auto it = records_.find(id);
  if (it == records_.end()) throw UnknownTaskError(id);
  return it->second;
}

const Scheduler::Record& Scheduler::Find(const std::string& id) const {
  auto it = records_.find(id);
  if (it == records_.end()) throw UnknownTaskError(id);
  return it->second;
}

bool Scheduler::FindCycle(const Task& task,
                          std::vector<std::string>* cycle) const {
  // Only PENDING tasks can still wait on the new one.
  std::unordered_map<std::string, std::string> parent;
  std::deque<std::string> queue;
  auto found = [&](const std::string& last) {
    std::vector<std::string> path;
    for (std::string cur = last; cur != task.id; cur = parent.at(cur)) {
      path.push_back(cur);
    }
    cycle->clear();
    cycle->push_back(task.id);
    cycle->insert(cycle->end(), path.rbegin(), path.rend());
    cycle->push_back(task.id);
    return true;
  };
  for (const auto& dep : task.depends_on) {
    if (dep == task.id) {
      *cycle = {task.id, task.id};
      return true;
    }
    if (parent.emplace(dep, task.id).second) queue.push_back(dep);
  }
  while (!queue.empty()) {
    std::string cur = queue.front();
    queue.pop_front();
    auto it = records_.find(cur);
    if (it == records_.end() || it->second.task.status != TaskStatus::PENDING)
      continue;
    for (const auto& next : it->second.task.depends_on) {
      if (next == task.id) return found(cur);
      if (parent.emplace(next, cur).second) queue.push_back(next);
    }
  }
  return false;
}

void Scheduler::PushReady(Record* record) {
  record->token = ++next_token_;
  ready_.push(ReadyEntry{record->task.priority, record->sequence,
                         record->token, record->task.id});
}

void Scheduler::PromoteDue(Clock::time_point now) {
  while (!delayed_.empty() && delayed_.begin()->first <= now) {
    auto entry = delayed_.begin()->second;
    delayed_.erase(delayed_.begin());
    auto it = records_.find(entry.first);
    if (it == records_.end()) continue;
    Record& record = it->second;
    if (record.task.status != TaskStatus::READY ||
        record.phase != Phase::RETRY_WAIT || record.token != entry.second)
      continue;
    record.phase = Phase::QUEUED;
    PushReady(&record);
  }
}

bool Scheduler::HasReady() {
  while (!ready_.empty()) {
    const ReadyEntry& top = ready_.top();
    auto it = records_.find(top.id);
    if (it != records_.end() && it->second.task.status == TaskStatus::READY &&
        it->second.phase != Phase::RETRY_WAIT &&
        it->second.token == top.token)
      return true;
    ready_.pop();
  }
  return false;
}

bool Scheduler::IsIdle() const {
  for (const auto& kv : records_) {
    if (!IsTerminal(kv.second.task.status)) return false;
  }
  return true;
}

void Scheduler::Finish(Record* record, TaskStatus status, FailureReason reason,
                       const std::string& message,
                       std::vector<TaskOutcome>* outcomes) {
  if (record->task.status == TaskStatus::PENDING) {
    for (const auto& dep : record->task.depends_on) {
      auto it = dependents_.find(dep);
      if (it == dependents_.end()) continue;
      it->second.erase(record->task.id);
      if (it->second.empty()) dependents_.erase(it);
    }
  }
  record->task.status = status;
  record->phase = Phase::FINISHED;
  record->reason = reason;
  record->message = message;
  TaskOutcome outcome;
  outcome.id = record->task.id;
  outcome.status = status;
  outcome.reason = reason;
  outcome.message = message;
  outcome.final_path = record->final_path;
  outcome.attempts = record->task.attempts;
  outcomes->push_back(std::move(outcome));
}

void Scheduler::Cascade(const std::string& id,
                        std::vector<TaskOutcome>* outcomes) {
  std::deque<std::string> queue{id};
  while (!queue.empty()) {
    std::string cur = queue.front();
    queue.pop_front();
    auto it = dependents_.find(cur);
    if (it == dependents_.end()) continue;
    std::set<std::string> waiting = std::move(it->second);
    dependents_.erase(it);
    for (const auto& next : waiting) {
      auto rec = records_.find(next);
      if (rec == records_.end() ||
          rec->second.task.status != TaskStatus::PENDING)
        continue;
      Finish(&rec->second, TaskStatus::FAILED,
             FailureReason::BLOCKED_BY_DEPENDENCY,
             "Dependency " + cur + " did not complete", outcomes);
      KJ_LOG(INFO, "Task blocked by dependency", next, cur);
      queue.push_back(next);
    }
  }
}

void Scheduler::Notify(const std::vector<TaskOutcome>& outcomes) {
  changed_.notify_all();
  if (outcomes.empty()) return;
  TerminalListener listener;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    listener = listener_;
  }
  if (!listener) return;
  for (const auto& outcome : outcomes) listener(outcome);
}

void Scheduler::Enqueue(Task task, FailureReason failure,
                        const std::string& message) {
  std::vector<TaskOutcome> outcomes;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    auto old = records_.find(task.id);
    if (old != records_.end()) {
      TaskStatus status = old->second.task.status;
      if (status != TaskStatus::FAILED && status != TaskStatus::CANCELLED) {
        throw DuplicateTaskError(task.id);
      }
    }
    std::vector<std::string> cycle;
    if (FindCycle(task, &cycle)) throw DependencyCycleError(cycle);

    std::string blocker;
    std::vector<std::string> waiting_on;
    for (const auto& dep : task.depends_on) {
      auto it = records_.find(dep);
      if (it == records_.end()) {
        if (acknowledged_done_.count(dep)) continue;
        if (acknowledged_failed_.count(dep)) {
          blocker = dep;
          break;
        }
        waiting_on.push_back(dep);
        continue;
      }
      TaskStatus status = it->second.task.status;
      if (status == TaskStatus::DONE) continue;
      if (status == TaskStatus::FAILED || status == TaskStatus::CANCELLED) {
        blocker = dep;
        break;
      }
      waiting_on.push_back(dep);
    }

    if (old != records_.end()) {
      KJ_LOG(INFO, "Replacing finished task", task.id,
             ToString(old->second.task.status));
      records_.erase(old);
    }
    acknowledged_done_.erase(task.id);
    acknowledged_failed_.erase(task.id);

    Record record;
    record.sequence = next_sequence_++;
    task.status = TaskStatus::PENDING;
    task.attempts = 0;
    record.task = std::move(task);
    std::string id = record.task.id;
    Record& stored = records_.emplace(id, std::move(record)).first->second;

    // Tasks enqueued earlier may already wait on this id.
    if (failure != FailureReason::NONE) {
      Finish(&stored, TaskStatus::FAILED, failure, message, &outcomes);
      Cascade(id, &outcomes);
    } else if (!blocker.empty()) {
      Finish(&stored, TaskStatus::FAILED, FailureReason::BLOCKED_BY_DEPENDENCY,
             "Dependency " + blocker + " did not complete", &outcomes);
      Cascade(id, &outcomes);
    } else if (waiting_on.empty()) {
      stored.task.status = TaskStatus::READY;
      PushReady(&stored);
    } else {
      stored.pending_deps = waiting_on.size();
      for (const auto& dep : waiting_on) dependents_[dep].insert(id);
    }
  }
  Notify(outcomes);
}

bool Scheduler::NextReady(Task* task, const Admission& admit) {
  std::lock_guard<std::mutex> lck(mutex_);
  PromoteDue(Clock::now());
  if (!HasReady()) return false;
  Record& record = records_.at(ready_.top().id);
  if (admit) {
    record.phase = Phase::ACQUIRING_SLOT;
    if (!admit(record.task)) return false;
  }
  ready_.pop();
  record.task.status = TaskStatus::RUNNING;
  record.phase = Phase::ACQUIRING_RATE;
  *task = record.task;
  return true;
}

void Scheduler::MarkDone(const std::string& id, const std::string& final_path) {
  std::vector<TaskOutcome> outcomes;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    Record& record = Find(id);
    KJ_REQUIRE(record.task.status == TaskStatus::RUNNING, id,
               ToString(record.task.status), "Only running tasks can complete");
    record.final_path = final_path;
    Finish(&record, TaskStatus::DONE, FailureReason::NONE, "", &outcomes);
    auto it = dependents_.find(id);
    if (it != dependents_.end()) {
      std::set<std::string> waiting = std::move(it->second);
      dependents_.erase(it);
      for (const auto& next : waiting) {
        auto rec = records_.find(next);
        if (rec == records_.end() ||
            rec->second.task.status != TaskStatus::PENDING)
          continue;
        if (--rec->second.pending_deps == 0) {
          rec->second.task.status = TaskStatus::READY;
          PushReady(&rec->second);
        }
      }
    }
  }
  Notify(outcomes);
}

void Scheduler::MarkFailed(const std::string& id, FailureReason reason,
                           const std::string& message) {
  std::vector<TaskOutcome> outcomes;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    Record& record = Find(id);
    KJ_REQUIRE(!IsTerminal(record.task.status), id,
               ToString(record.task.status), "Task already finished");
    Finish(&record, TaskStatus::FAILED, reason, message, &outcomes);
    Cascade(id, &outcomes);
  }
  Notify(outcomes);
}

void Scheduler::MarkCancelled(const std::string& id) {
  std::vector<TaskOutcome> outcomes;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    Record& record = Find(id);
    KJ_REQUIRE(record.task.status == TaskStatus::RUNNING, id,
               ToString(record.task.status), "Task is not running");
    Finish(&record, TaskStatus::CANCELLED, FailureReason::NONE, "Cancelled",
           &outcomes);
    Cascade(id, &outcomes);
  }
  Notify(outcomes);
}

void Scheduler::Requeue(const std::string& id, Clock::time_point not_before) {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    Record& record = Find(id);
    KJ_REQUIRE(record.task.status == TaskStatus::RUNNING, id,
               ToString(record.task.status), "Task is not running");
    record.task.status = TaskStatus::READY;
    if (not_before <= Clock::now()) {
      record.phase = Phase::QUEUED;
      PushReady(&record);
    } else {
      record.phase = Phase::RETRY_WAIT;
      record.token = ++next_token_;
      delayed_.emplace(not_before, std::make_pair(id, record.token));
    }
  }
  changed_.notify_all();
}

Scheduler::CancelResult Scheduler::Cancel(const std::string& id) {
  std::vector<TaskOutcome> outcomes;
  CancelResult result;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    Record& record = Find(id);
    switch (record.task.status) {
      case TaskStatus::PENDING:
      case TaskStatus::READY:
        Finish(&record, TaskStatus::CANCELLED, FailureReason::NONE,
               "Cancelled", &outcomes);
        Cascade(id, &outcomes);
        result = CancelResult::CANCELLED;
        break;
      case TaskStatus::RUNNING:
        result = CancelResult::RUNNING;
        break;
      default:
        result = CancelResult::ALREADY_TERMINAL;
    }
  }
  Notify(outcomes);
  return result;
}

bool Scheduler::UpdatePriority(const std::string& id, Priority priority) {
  std::lock_guard<std::mutex> lck(mutex_);
  KJ_REQUIRE(config_.allow_priority_updates, "Priority updates are disabled");
  Record& record = Find(id);
  if (record.task.status == TaskStatus::PENDING) {
    record.task.priority = priority;
    return true;
  }
  if (record.task.status == TaskStatus::READY) {
    record.task.priority = priority;
    if (record.phase != Phase::RETRY_WAIT) PushReady(&record);
    return true;
  }
  return false;
}

uint32_t Scheduler::IncrementAttempts(const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  return ++Find(id).task.attempts;
}

uint32_t Scheduler::IncrementThrottles(const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  return ++Find(id).throttles;
}

void Scheduler::SetPhase(const std::string& id, Phase phase) {
  std::lock_guard<std::mutex> lck(mutex_);
  Record& record = Find(id);
  if (IsTerminal(record.task.status)) return;
  record.phase = phase;
}

TaskInfo Scheduler::Get(const std::string& id) const {
  std::lock_guard<std::mutex> lck(mutex_);
  const Record& record = Find(id);
  TaskInfo info;
  info.task = record.task;
  info.phase = record.phase;
  info.reason = record.reason;
  info.message = record.message;
  info.throttles = record.throttles;
  info.final_path = record.final_path;
  return info;
}

bool Scheduler::Contains(const std::string& id) const {
  std::lock_guard<std::mutex> lck(mutex_);
  return records_.count(id) != 0;
}

SchedulerStats Scheduler::Stats() const {
  std::lock_guard<std::mutex> lck(mutex_);
  SchedulerStats stats;
  for (const auto& kv : records_) {
    switch (kv.second.task.status) {
      case TaskStatus::PENDING:
        stats.pending++;
        break;
      case TaskStatus::READY:
        stats.ready++;
        break;
      case TaskStatus::RUNNING:
        stats.running++;
        break;
      case TaskStatus::DONE:
        stats.done++;
        break;
      case TaskStatus::FAILED:
        stats.failed++;
        break;
      case TaskStatus::CANCELLED:
        stats.cancelled++;
        break;
    }
  }
  return stats;
}

void Scheduler::Acknowledge(const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  Record& record = Find(id);
  KJ_REQUIRE(IsTerminal(record.task.status), id, ToString(record.task.status),
             "Only finished tasks can be acknowledged");
  if (record.task.status == TaskStatus::DONE) {
    acknowledged_done_.insert(id);
  } else {
    acknowledged_failed_.insert(id);
  }
  records_.erase(id);
}

bool Scheduler::WaitForWork(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lck(mutex_);
  auto deadline = Clock::now() + timeout;
  uint64_t generation = wake_generation_;
  while (true) {
    Clock::time_point now = Clock::now();
    PromoteDue(now);
    if (HasReady()) return true;
    if (generation != wake_generation_ || now >= deadline) return false;
    Clock::time_point until = deadline;
    if (!delayed_.empty()) until = std::min(until, delayed_.begin()->first);
    changed_.wait_until(lck, until);
  }
}

bool Scheduler::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lck(mutex_);
  return changed_.wait_for(lck, timeout, [this] { return IsIdle(); });
}

void Scheduler::Wake() {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    wake_generation_++;
  }
  changed_.notify_all();
}

}  // namespace core
