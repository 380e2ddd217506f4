// Repository: Carillon
// Component: Deterministic Time Source (test only)
// Purpose: Virtual local clock advanced explicitly by tests.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_
#define CARILLON_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_

#include <atomic>
#include <cstdint>

#include "carillon/timing/ITimeSource.hpp"

namespace carillon::testing {

class DeterministicTimeSource : public timing::ITimeSource {
 public:
  explicit DeterministicTimeSource(int64_t start_local_ms = 0)
      : now_ms_(start_local_ms) {}

  int64_t NowLocalMs() const override {
    return now_ms_.load(std::memory_order_acquire);
  }

  void AdvanceMs(int64_t delta) {
    now_ms_.fetch_add(delta, std::memory_order_acq_rel);
  }

  void SetMs(int64_t value) {
    now_ms_.store(value, std::memory_order_release);
  }

 private:
  std::atomic<int64_t> now_ms_;
};

}  // namespace carillon::testing

#endif  // CARILLON_TESTS_SUPPORT_DETERMINISTIC_TIME_SOURCE_HPP_
