// Repository: Carillon
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from minute-boundary math in ClockSync.
//          Production: RealtimeWaitStrategy sleeps.
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2025 Carillon

#ifndef CARILLON_TIMING_IWAIT_STRATEGY_HPP_
#define CARILLON_TIMING_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <thread>

namespace carillon::timing {

class IWaitStrategy {
 public:
  virtual void WaitFor(std::chrono::milliseconds duration) = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  void WaitFor(std::chrono::milliseconds duration) override {
    std::this_thread::sleep_for(duration);
  }
};

}  // namespace carillon::timing

#endif  // CARILLON_TIMING_IWAIT_STRATEGY_HPP_
