#include "core/concurrency_controller.hpp"

#include <kj/debug.h>
#include <algorithm>

namespace core {

void ConcurrencyController::Permit::Release() {
  if (released_.exchange(true)) return;
  owner_->Release(*this);
}

ConcurrencyController::ConcurrencyController(ConcurrencyConfig config)
    : config_(config) {
  KJ_REQUIRE(config_.max_concurrent > 0, "At least one slot is needed");
}

std::unique_ptr<ConcurrencyController::Permit>
ConcurrencyController::TryAcquire(const std::string& task_id,
                                  uint64_t resource, Refusal* refusal) {
  std::lock_guard<std::mutex> lck(mutex_);
  Refusal reason = Refusal::NONE;
  if (active_ >= config_.max_concurrent) {
    reason = Refusal::BUSY;
  } else if (config_.resource_ceiling != 0 &&
             reserved_ + resource > config_.resource_ceiling) {
    reason = Refusal::RESOURCE_EXHAUSTED;
  }
  if (refusal) *refusal = reason;
  if (reason != Refusal::NONE) return nullptr;
  active_++;
  reserved_ += resource;
  peak_active_ = std::max(peak_active_, active_);
  peak_reserved_ = std::max(peak_reserved_, reserved_);
  return std::unique_ptr<Permit>(new Permit(this, task_id, resource));
}

bool ConcurrencyController::Fits(uint64_t resource) const {
  return config_.resource_ceiling == 0 || resource <= config_.resource_ceiling;
}

void ConcurrencyController::SetReleaseHook(std::function<void()> hook) {
  std::lock_guard<std::mutex> lck(mutex_);
  release_hook_ = std::move(hook);
}

void ConcurrencyController::Release(const Permit& permit) {
  std::function<void()> hook;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    KJ_ASSERT(active_ > 0 && reserved_ >= permit.Resource(), permit.TaskId());
    active_--;
    reserved_ -= permit.Resource();
    hook = release_hook_;
  }
  if (hook) hook();
}

size_t ConcurrencyController::Active() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return active_;
}

uint64_t ConcurrencyController::Reserved() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return reserved_;
}

size_t ConcurrencyController::PeakActive() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return peak_active_;
}

uint64_t ConcurrencyController::PeakReserved() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return peak_reserved_;
}

const char* ToString(ConcurrencyController::Refusal refusal) {
  switch (refusal) {
    case ConcurrencyController::Refusal::NONE:
      return "NONE";
    case ConcurrencyController::Refusal::BUSY:
      return "BUSY";
    case ConcurrencyController::Refusal::RESOURCE_EXHAUSTED:
      return "RESOURCE_EXHAUSTED";
  }
  return "UNKNOWN";
}

}  // namespace core
