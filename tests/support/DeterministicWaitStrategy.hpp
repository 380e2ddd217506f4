// Repository: Carillon
// Component: Deterministic Wait Strategy (test only)
// Purpose: Advances DeterministicTimeSource by exactly the requested duration
//          instead of sleeping. No wall-clock dependence.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_
#define CARILLON_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include "DeterministicTimeSource.hpp"
#include "carillon/timing/IWaitStrategy.hpp"

namespace carillon::testing {

class DeterministicWaitStrategy : public timing::IWaitStrategy {
 public:
  explicit DeterministicWaitStrategy(std::shared_ptr<DeterministicTimeSource> ts)
      : ts_(std::move(ts)) {}

  void WaitFor(std::chrono::milliseconds duration) override {
    ++wait_calls_;
    const int64_t ms = duration.count();
    if (ms > max_wait_ms_.load()) {
      max_wait_ms_.store(ms);
    }
    ts_->AdvanceMs(ms);
  }

  int64_t WaitCalls() const { return wait_calls_.load(); }
  int64_t MaxWaitMs() const { return max_wait_ms_.load(); }

 private:
  std::shared_ptr<DeterministicTimeSource> ts_;
  std::atomic<int64_t> wait_calls_{0};
  std::atomic<int64_t> max_wait_ms_{0};
};

}  // namespace carillon::testing

#endif  // CARILLON_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_
