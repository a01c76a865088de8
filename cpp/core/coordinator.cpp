#include "core/coordinator.hpp"

#include <kj/common.h>
#include <kj/debug.h>
#include <algorithm>
#include <cmath>
#include <random>

#include "core/errors.hpp"
#include "util/misc.hpp"
#include "util/sha256.hpp"

namespace core {

namespace {
using Clock = Scheduler::Clock;

bool IsHexDigest(const std::string& str) {
  if (str.size() != 2 * util::DIGEST_SIZE) return false;
  return str.find_first_not_of("0123456789abcdefABCDEF") == std::string::npos;
}

void ValidateTask(const Task& task) {
  KJ_REQUIRE(!task.id.empty(), "Task id cannot be empty");
  KJ_REQUIRE(task.expected_checksum.empty() ||
                 IsHexDigest(task.expected_checksum),
             task.id, task.expected_checksum, "Invalid checksum");
  if (task.destination.empty()) return;
  KJ_REQUIRE(task.destination[0] != '/', task.id, task.destination,
             "Destination must be relative");
  for (const auto& part : util::split(task.destination, '/')) {
    KJ_REQUIRE(part != "..", task.id, task.destination,
               "Destination escapes the download directory");
  }
}
}  // namespace

Coordinator::Coordinator(CoordinatorConfig config, Scheduler* scheduler,
                         ConcurrencyController* controller,
                         RateGovernor* governor, TransferStateStore* store,
                         TransferManager* transfers, StreamSource* source,
                         StatusSink* sink)
    : config_(config),
      scheduler_(scheduler),
      controller_(controller),
      governor_(governor),
      store_(store),
      transfers_(transfers),
      source_(source),
      sink_(sink) {
  KJ_REQUIRE(config_.max_attempts > 0, "At least one attempt is needed");
  scheduler_->SetTerminalListener(
      [this](const TaskOutcome& outcome) { OnTerminal(outcome); });
  controller_->SetReleaseHook([this]() {
    {
      std::lock_guard<std::mutex> lck(mutex_);
      releases_++;
    }
    wakeup_.notify_all();
  });
}

Coordinator::~Coordinator() {
  Stop();
  scheduler_->SetTerminalListener(nullptr);
  controller_->SetReleaseHook(nullptr);
}

void Coordinator::Start() {
  std::lock_guard<std::mutex> lck(mutex_);
  KJ_REQUIRE(!started_, "Coordinator already started");
  started_ = true;
  quitting_ = false;
  size_t workers = config_.workers;
  if (workers == 0) workers = controller_->Config().max_concurrent;
  threads_.reserve(workers);
  for (size_t i = 0; i < workers; i++) {
    threads_.emplace_back([this] { ThreadBody(); });
  }
  KJ_LOG(INFO, "Coordinator started", workers);
}

void Coordinator::Stop() {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    if (!started_) return;
    started_ = false;
    quitting_ = true;
    for (auto& kv : in_flight_) kv.second->interrupt = true;
  }
  wakeup_.notify_all();
  scheduler_->Wake();
  for (auto& thread : threads_) thread.join();
  threads_.clear();
  std::lock_guard<std::mutex> lck(mutex_);
  in_flight_.clear();
  KJ_LOG(INFO, "Coordinator stopped");
}

void Coordinator::ThreadBody() {
  while (!quitting_) {
    uint64_t releases;
    {
      std::lock_guard<std::mutex> lck(mutex_);
      releases = releases_;
    }
    Task task;
    std::unique_ptr<ConcurrencyController::Permit> permit;
    ConcurrencyController::Refusal refusal =
        ConcurrencyController::Refusal::NONE;
    bool dispatched = scheduler_->NextReady(&task, [&](const Task& next) {
      permit = controller_->TryAcquire(next.id, next.resource_estimate,
                                       &refusal);
      return permit != nullptr;
    });
    if (dispatched) {
      Run(task, std::move(permit));
      continue;
    }
    if (refusal != ConcurrencyController::Refusal::NONE) {
      // The head of the queue waits for a running transfer to finish.
      std::unique_lock<std::mutex> lck(mutex_);
      wakeup_.wait_for(lck, config_.poll_interval,
                       [&] { return quitting_ || releases_ != releases; });
    } else {
      scheduler_->WaitForWork(config_.poll_interval);
    }
  }
}

void Coordinator::Run(const Task& task,
                      std::unique_ptr<ConcurrencyController::Permit> permit) {
  std::shared_ptr<InFlight> flags = Track(task.id);
  auto untrack = kj::defer([this, &task]() { Untrack(task.id); });
  try {
    std::chrono::microseconds wait = governor_->Acquire();
    if (wait.count() > 0) {
      KJ_LOG(INFO, "Waiting for the rate limit", task.id, wait.count());
      if (!Sleep(wait, *flags)) {
        permit->Release();
        Interrupted(task.id, *flags);
        return;
      }
    }
    scheduler_->SetPhase(task.id, Phase::TRANSFERRING);
    TransferState prior;
    bool has_prior = store_->Load(task.id, &prior);
    TransferHooks hooks;
    hooks.on_verify = [this, &task]() {
      scheduler_->SetPhase(task.id, Phase::VERIFYING);
    };
    TransferResult result =
        transfers_->Transfer(task, source_, has_prior ? &prior : nullptr,
                             flags->interrupt, hooks);
    permit->Release();
    Resolve(task, result, *flags);
    // A cancellation that arrived after the last chunk boundary.
    if (flags->cancel_requested) scheduler_->Cancel(task.id);
  } catch (std::exception& exc) {
    permit->Release();
    KJ_LOG(ERROR, "Unexpected error running task", task.id, exc.what());
    Retry(task.id, FailureReason::INTERNAL_ERROR, exc.what());
  } catch (kj::Exception& exc) {
    permit->Release();
    KJ_LOG(ERROR, "Unexpected error running task", task.id,
           exc.getDescription());
    Retry(task.id, FailureReason::INTERNAL_ERROR,
          exc.getDescription().cStr());
  }
}

void Coordinator::Resolve(const Task& task, const TransferResult& result,
                          const InFlight& flags) {
  switch (result.outcome) {
    case TransferOutcome::SUCCESS:
      governor_->OnSuccess();
      store_->Remove(task.id);
      scheduler_->MarkDone(task.id, result.final_path);
      break;
    case TransferOutcome::THROTTLED: {
      governor_->OnBackpressure(result.retry_after);
      uint32_t throttles = scheduler_->IncrementThrottles(task.id);
      std::chrono::milliseconds delay =
          std::max(Backoff(throttles), result.retry_after);
      KJ_LOG(WARNING, "Throttled, retrying later", task.id, throttles,
             delay.count());
      scheduler_->Requeue(task.id, Clock::now() + delay);
      break;
    }
    case TransferOutcome::INTEGRITY_ERROR:
      Retry(task.id, FailureReason::INTEGRITY_ERROR, result.message);
      break;
    case TransferOutcome::STREAM_ERROR:
      Retry(task.id, FailureReason::STREAM_ERROR, result.message);
      break;
    case TransferOutcome::CANCELLED:
      Interrupted(task.id, flags);
      break;
  }
}

void Coordinator::Retry(const std::string& id, FailureReason reason,
                        const std::string& message) {
  uint32_t attempts = scheduler_->IncrementAttempts(id);
  if (attempts >= config_.max_attempts) {
    KJ_LOG(WARNING, "Giving up on task", id, attempts, ToString(reason),
           message);
    scheduler_->MarkFailed(id, reason, message);
    return;
  }
  std::chrono::milliseconds delay = Backoff(attempts);
  KJ_LOG(WARNING, "Transfer failed, retrying later", id, attempts,
         ToString(reason), message, delay.count());
  scheduler_->Requeue(id, Clock::now() + delay);
}

void Coordinator::Interrupted(const std::string& id, const InFlight& flags) {
  if (flags.cancel_requested) {
    scheduler_->MarkCancelled(id);
  } else {
    scheduler_->Requeue(id, Clock::now());
  }
}

std::chrono::milliseconds Coordinator::Backoff(uint32_t failures) const {
  thread_local std::mt19937 rng{std::random_device{}()};
  double exponent = failures > 0 ? failures - 1 : 0;
  double delay = std::min<double>(
      config_.backoff_cap.count(),
      config_.backoff_base.count() * std::pow(2.0, exponent));
  std::uniform_real_distribution<double> jitter(-config_.jitter,
                                                config_.jitter);
  delay *= 1.0 + jitter(rng);
  return std::chrono::milliseconds(std::max<int64_t>(0, std::llround(delay)));
}

bool Coordinator::Sleep(std::chrono::microseconds duration,
                        const InFlight& flags) {
  std::unique_lock<std::mutex> lck(mutex_);
  return !wakeup_.wait_for(lck, duration,
                           [&] { return quitting_ || flags.interrupt; });
}

std::shared_ptr<Coordinator::InFlight> Coordinator::Track(
    const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  auto& flags = in_flight_[id];
  if (!flags) flags = std::make_shared<InFlight>();
  if (quitting_) flags->interrupt = true;
  return flags;
}

void Coordinator::Untrack(const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  in_flight_.erase(id);
}

void Coordinator::OnTerminal(const TaskOutcome& outcome) {
  KJ_LOG(INFO, "Task finished", outcome.id, ToString(outcome.status),
         ToString(outcome.reason), outcome.message);
  std::shared_ptr<Subscription> subscription;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    auto it = subscribers_.find(outcome.id);
    if (it != subscribers_.end()) {
      subscription = std::move(it->second);
      subscribers_.erase(it);
    }
    in_flight_.erase(outcome.id);
  }
  if (subscription) subscription->promise.set_value(outcome);
  if (sink_ == nullptr) return;
  try {
    sink_->Project(outcome);
  } catch (std::exception& exc) {
    KJ_LOG(ERROR, "Status sink failed", outcome.id, exc.what());
  }
}

void Coordinator::Enqueue(Task task) {
  ValidateTask(task);
  std::string id = task.id;
  std::string path = transfers_->FinalPath(task);
  bool reserved = ReserveDestination(id, path);
  FailureReason failure = FailureReason::NONE;
  std::string message;
  if (!controller_->Fits(task.resource_estimate)) {
    failure = FailureReason::RESOURCE_UNSATISFIABLE;
    message = "Resource estimate " + std::to_string(task.resource_estimate) +
              " exceeds the ceiling " +
              std::to_string(controller_->Config().resource_ceiling);
  }
  bool enqueued = false;
  auto release = kj::defer([&]() {
    if (!reserved || enqueued) return;
    std::lock_guard<std::mutex> lck(mutex_);
    auto it = destinations_.find(path);
    if (it != destinations_.end() && it->second == id) destinations_.erase(it);
  });
  scheduler_->Enqueue(std::move(task), failure, message);
  enqueued = true;
  KJ_LOG(INFO, "Task enqueued", id, path);
}

bool Coordinator::ReserveDestination(const std::string& id,
                                     const std::string& path) {
  std::lock_guard<std::mutex> lck(mutex_);
  auto it = destinations_.find(path);
  if (it != destinations_.end()) {
    if (it->second == id) return false;
    bool live = false;
    try {
      TaskInfo owner = scheduler_->Get(it->second);
      live = !IsTerminal(owner.task.status) &&
             transfers_->FinalPath(owner.task) == path;
    } catch (UnknownTaskError&) {
      // Acknowledged, the path is free again.
    }
    KJ_REQUIRE(!live, id, it->second, path,
               "Another task is downloading to the same path");
  }
  destinations_[path] = id;
  return true;
}

void Coordinator::Cancel(const std::string& id) {
  while (scheduler_->Cancel(id) == Scheduler::CancelResult::RUNNING) {
    std::lock_guard<std::mutex> lck(mutex_);
    // The run may have been requeued meanwhile: try again.
    if (scheduler_->Get(id).task.status != TaskStatus::RUNNING) continue;
    auto& flags = in_flight_[id];
    if (!flags) flags = std::make_shared<InFlight>();
    flags->cancel_requested = true;
    flags->interrupt = true;
    break;
  }
  wakeup_.notify_all();
}

TaskInfo Coordinator::GetStatus(const std::string& id) const {
  return scheduler_->Get(id);
}

std::shared_future<TaskOutcome> Coordinator::Subscribe(const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  TaskInfo info = scheduler_->Get(id);
  if (IsTerminal(info.task.status)) {
    TaskOutcome outcome;
    outcome.id = id;
    outcome.status = info.task.status;
    outcome.reason = info.reason;
    outcome.message = info.message;
    outcome.final_path = info.final_path;
    outcome.attempts = info.task.attempts;
    std::promise<TaskOutcome> promise;
    promise.set_value(outcome);
    return promise.get_future().share();
  }
  auto& subscription = subscribers_[id];
  if (!subscription) {
    subscription = std::make_shared<Subscription>();
    subscription->future = subscription->promise.get_future().share();
  }
  return subscription->future;
}

void Coordinator::Acknowledge(const std::string& id) {
  scheduler_->Acknowledge(id);
}

bool Coordinator::UpdatePriority(const std::string& id, Priority priority) {
  return scheduler_->UpdatePriority(id, priority);
}

bool Coordinator::Progress(const std::string& id, TransferState* state) const {
  return store_->Load(id, state);
}

SchedulerStats Coordinator::Stats() const { return scheduler_->Stats(); }

bool Coordinator::WaitIdle(std::chrono::milliseconds timeout) {
  return scheduler_->WaitIdle(timeout);
}

}  // namespace core
