#ifndef CORE_CONCURRENCY_CONTROLLER_HPP
#define CORE_CONCURRENCY_CONTROLLER_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <kj/common.h>

namespace core {

struct ConcurrencyConfig {
  // Maximum number of transfers running at the same time.
  size_t max_concurrent = 3;
  // Maximum sum of the resource estimates of running transfers, 0 means
  // unlimited.
  uint64_t resource_ceiling = 0;
};

// Admission control for transfers. A transfer may only run while it holds a
// Permit, and the permits handed out never exceed either bound.
class ConcurrencyController {
 public:
  enum class Refusal { NONE, BUSY, RESOURCE_EXHAUSTED };

  // Reservation of one slot and some resource. Released on destruction if not
  // before. Must not outlive the controller that issued it.
  class Permit {
   public:
    ~Permit() { Release(); }

    // Gives back the slot and the resource. Calling it more than once has no
    // further effect.
    void Release();

    const std::string& TaskId() const { return task_id_; }
    uint64_t Resource() const { return resource_; }

    KJ_DISALLOW_COPY(Permit);

   private:
    friend class ConcurrencyController;
    Permit(ConcurrencyController* owner, std::string task_id,
           uint64_t resource)
        : owner_(owner), task_id_(std::move(task_id)), resource_(resource) {}

    ConcurrencyController* owner_;
    std::string task_id_;
    uint64_t resource_;
    std::atomic<bool> released_{false};
  };

  explicit ConcurrencyController(ConcurrencyConfig config);

  // Returns a permit, or nullptr and the reason in *refusal.
  std::unique_ptr<Permit> TryAcquire(const std::string& task_id,
                                     uint64_t resource,
                                     Refusal* refusal = nullptr);

  // False if a transfer needing resource could never be admitted.
  bool Fits(uint64_t resource) const;

  // Called (without locks held) every time a permit is released.
  void SetReleaseHook(std::function<void()> hook);

  size_t Active() const;
  uint64_t Reserved() const;
  size_t PeakActive() const;
  uint64_t PeakReserved() const;
  const ConcurrencyConfig& Config() const { return config_; }

 private:
  void Release(const Permit& permit);

  const ConcurrencyConfig config_;
  std::function<void()> release_hook_;
  size_t active_ = 0;
  uint64_t reserved_ = 0;
  size_t peak_active_ = 0;
  uint64_t peak_reserved_ = 0;
  mutable std::mutex mutex_;
};

const char* ToString(ConcurrencyController::Refusal refusal);

}  // namespace core

#endif
