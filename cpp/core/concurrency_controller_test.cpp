#include "core/concurrency_controller.hpp"
#include <atomic>
#include <thread>
#include <vector>
#include <kj/exception.h>
#include "gtest/gtest.h"

namespace {

using core::ConcurrencyConfig;
using core::ConcurrencyController;
using Refusal = core::ConcurrencyController::Refusal;

ConcurrencyConfig makeConfig(size_t slots, uint64_t ceiling) {
  ConcurrencyConfig config;
  config.max_concurrent = slots;
  config.resource_ceiling = ceiling;
  return config;
}

// NOLINTNEXTLINE
TEST(ConcurrencyController, SlotLimit) {
  ConcurrencyController controller(makeConfig(2, 0));
  auto a = controller.TryAcquire("a", 1);
  auto b = controller.TryAcquire("b", 1);
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  Refusal refusal = Refusal::NONE;
  EXPECT_FALSE(controller.TryAcquire("c", 1, &refusal));
  EXPECT_EQ(refusal, Refusal::BUSY);
  EXPECT_EQ(controller.Active(), 2);
  a->Release();
  EXPECT_TRUE(controller.TryAcquire("c", 1, &refusal));
  EXPECT_EQ(refusal, Refusal::NONE);
}

// NOLINTNEXTLINE
TEST(ConcurrencyController, ResourceCeiling) {
  ConcurrencyController controller(makeConfig(10, 3));
  auto a = controller.TryAcquire("a", 2);
  ASSERT_TRUE(a);
  Refusal refusal = Refusal::NONE;
  EXPECT_FALSE(controller.TryAcquire("b", 2, &refusal));
  EXPECT_EQ(refusal, Refusal::RESOURCE_EXHAUSTED);
  auto c = controller.TryAcquire("c", 1);
  ASSERT_TRUE(c);
  EXPECT_EQ(controller.Reserved(), 3);
}

// NOLINTNEXTLINE
TEST(ConcurrencyController, Fits) {
  ConcurrencyController limited(makeConfig(1, 4));
  EXPECT_TRUE(limited.Fits(4));
  EXPECT_FALSE(limited.Fits(5));
  ConcurrencyController unlimited(makeConfig(1, 0));
  EXPECT_TRUE(unlimited.Fits(1000000));
}

// NOLINTNEXTLINE
TEST(ConcurrencyController, ReleaseIsIdempotent) {
  ConcurrencyController controller(makeConfig(2, 5));
  int hooks = 0;
  controller.SetReleaseHook([&]() { hooks++; });
  {
    auto a = controller.TryAcquire("a", 3);
    auto b = controller.TryAcquire("b", 2);
    a->Release();
    a->Release();
    EXPECT_EQ(controller.Active(), 1);
    EXPECT_EQ(controller.Reserved(), 2);
    EXPECT_EQ(hooks, 1);
  }
  // b released by its destructor, a not released again.
  EXPECT_EQ(controller.Active(), 0);
  EXPECT_EQ(controller.Reserved(), 0);
  EXPECT_EQ(hooks, 2);
  EXPECT_EQ(controller.PeakActive(), 2);
  EXPECT_EQ(controller.PeakReserved(), 5);
}

// NOLINTNEXTLINE
TEST(ConcurrencyController, NeverExceedsBounds) {
  ConcurrencyController controller(makeConfig(3, 5));
  std::atomic<int> admitted{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; t++) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < 500; i++) {
        auto permit =
            controller.TryAcquire("t" + std::to_string(t), 1 + (i + t) % 3);
        if (!permit) continue;
        admitted++;
        EXPECT_LE(controller.Active(), 3);
        EXPECT_LE(controller.Reserved(), 5);
      }
    });
  }
  for (auto& thread : threads) thread.join();
  EXPECT_GT(admitted.load(), 0);
  EXPECT_LE(controller.PeakActive(), 3);
  EXPECT_LE(controller.PeakReserved(), 5);
  EXPECT_EQ(controller.Active(), 0);
  EXPECT_EQ(controller.Reserved(), 0);
}

// NOLINTNEXTLINE
TEST(ConcurrencyController, NoSlots) {
  EXPECT_THROW(ConcurrencyController(makeConfig(0, 0)),  // NOLINT
               kj::Exception);
}

}  // namespace
