#include <atomic>
#include <thread>
#include <vector>

#include "executor/limiter.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/errors.hpp"

namespace {

using namespace executor;

TEST(LimiterTest, TestSlotsAreReleased) {
  Limiter limiter(2, 1000);
  {
    Limiter::Slot first(&limiter, nullptr);
    Limiter::Slot second(&limiter, nullptr);
    EXPECT_EQ(limiter.Running(), 2u);
  }
  EXPECT_EQ(limiter.Running(), 0u);
}

TEST(LimiterTest, TestBusy) {
  Limiter limiter(1, 50);
  Limiter::Slot slot(&limiter, nullptr);
  try {
    Limiter::Slot other(&limiter, nullptr);
    FAIL() << "Got a second slot";
  } catch (const sandbox::provisioning_error& e) {
    EXPECT_EQ(e.reason(), sandbox::provisioning_error::Reason::BUSY);
  }
  EXPECT_EQ(limiter.Running(), 1u);
  EXPECT_EQ(limiter.Waiting(), 0u);
}

TEST(LimiterTest, TestCancelledWhileQueued) {
  Limiter limiter(1, 10000);
  Limiter::Slot slot(&limiter, nullptr);
  int checks = 0;
  EXPECT_THROW(Limiter::Slot(&limiter, [&checks]() { return ++checks > 2; }),
               sandbox::cancelled_error);
  EXPECT_EQ(limiter.Waiting(), 0u);
}

TEST(LimiterTest, TestQueuedRequestRuns) {
  Limiter limiter(1, 10000);
  std::unique_ptr<Limiter::Slot> slot(new Limiter::Slot(&limiter, nullptr));
  std::atomic<bool> acquired{false};
  std::thread waiter([&]() {
    Limiter::Slot queued(&limiter, nullptr);
    acquired = true;
  });
  while (limiter.Waiting() == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  EXPECT_FALSE(acquired);
  slot.reset();
  waiter.join();
  EXPECT_TRUE(acquired);
}

TEST(LimiterTest, TestNeverExceedsCap) {
  Limiter limiter(3, 10000);
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 12; i++) {
    threads.emplace_back([&]() {
      Limiter::Slot slot(&limiter, nullptr);
      int now = ++running;
      int seen = peak;
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      running--;
    });
  }
  for (std::thread& thread : threads) thread.join();
  EXPECT_LE(peak, 3);
  EXPECT_EQ(limiter.Running(), 0u);
}

}  // namespace
