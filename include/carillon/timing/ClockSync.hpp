// Repository: Carillon
// Component: ClockSync
// Purpose: Align the playout thread to the start of each wall-clock minute.
// Copyright (c) 2025 Carillon
//
// ClockSync polls the time source at a bounded interval (never tight-looping)
// and returns when the seconds field reads 0. A sleep is never longer than the
// time remaining to the next boundary, so the boundary is seen within one
// poll interval even on a coarse clock.

#ifndef CARILLON_TIMING_CLOCK_SYNC_HPP_
#define CARILLON_TIMING_CLOCK_SYNC_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>

#include "carillon/timing/ITimeSource.hpp"
#include "carillon/timing/IWaitStrategy.hpp"
#include "carillon/timing/Timestamp.hpp"

namespace carillon::timing {

class ClockSync {
 public:
  static constexpr int64_t kDefaultPollIntervalMs = 200;
  static constexpr int64_t kMinPollIntervalMs = 10;
  static constexpr int64_t kMaxPollIntervalMs = 500;

  // poll_interval_ms is clamped to [kMinPollIntervalMs, kMaxPollIntervalMs].
  ClockSync(std::shared_ptr<ITimeSource> time_source,
            std::shared_ptr<IWaitStrategy> wait_strategy,
            int64_t poll_interval_ms = kDefaultPollIntervalMs);

  ClockSync(const ClockSync&) = delete;
  ClockSync& operator=(const ClockSync&) = delete;

  // Blocks until the clock's seconds field is 0 for a minute not yet
  // returned by this instance, then returns that instant.
  // Returns nullopt if *stop_requested becomes true while waiting.
  std::optional<Timestamp> WaitForMinuteBoundary(
      const std::atomic<bool>* stop_requested = nullptr);

  // Sleeps until lead_ms before the boundary following the last one returned
  // (or the current minute's end, before any was returned) so the following
  // WaitForMinuteBoundary() only polls through the final stretch.
  // If the clock was stepped back so that instant is over a minute away, the
  // current minute's end is used instead.
  // Returns immediately if that instant has passed or stop is requested.
  void SleepUntilBeforeNextBoundary(int64_t lead_ms,
                                    const std::atomic<bool>* stop_requested = nullptr);

  Timestamp Now() const;

  int64_t PollIntervalMs() const { return poll_interval_ms_; }

 private:
  std::shared_ptr<ITimeSource> time_source_;
  std::shared_ptr<IWaitStrategy> wait_strategy_;
  int64_t poll_interval_ms_;

  // Minute index (local ms / kMsPerMinute) of the last boundary returned.
  std::optional<int64_t> last_minute_index_;
};

}  // namespace carillon::timing

#endif  // CARILLON_TIMING_CLOCK_SYNC_HPP_
