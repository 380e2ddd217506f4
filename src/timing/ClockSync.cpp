// Repository: Carillon
// Component: ClockSync
// Purpose: Bounded-interval polling for the minute boundary.
// Copyright (c) 2025 Carillon

#include "carillon/timing/ClockSync.hpp"

#include <algorithm>
#include <chrono>

namespace carillon::timing {

namespace {

int64_t MinuteIndex(int64_t local_ms) {
  int64_t q = local_ms / kMsPerMinute;
  if (local_ms % kMsPerMinute < 0) {
    --q;
  }
  return q;
}

bool StopRequested(const std::atomic<bool>* stop_requested) {
  return stop_requested != nullptr && stop_requested->load(std::memory_order_acquire);
}

}  // namespace

ClockSync::ClockSync(std::shared_ptr<ITimeSource> time_source,
                     std::shared_ptr<IWaitStrategy> wait_strategy,
                     int64_t poll_interval_ms)
    : time_source_(std::move(time_source)),
      wait_strategy_(std::move(wait_strategy)),
      poll_interval_ms_(std::clamp(poll_interval_ms, kMinPollIntervalMs, kMaxPollIntervalMs)) {}

Timestamp ClockSync::Now() const {
  return Timestamp::FromLocalMs(time_source_->NowLocalMs());
}

std::optional<Timestamp> ClockSync::WaitForMinuteBoundary(
    const std::atomic<bool>* stop_requested) {
  while (true) {
    if (StopRequested(stop_requested)) {
      return std::nullopt;
    }

    const int64_t now_ms = time_source_->NowLocalMs();
    const int64_t minute_index = MinuteIndex(now_ms);
    const int64_t ms_into_minute = now_ms - minute_index * kMsPerMinute;

    // Seconds field reads 0 and this minute has not been handed out yet.
    if (ms_into_minute < kMsPerSecond &&
        (!last_minute_index_.has_value() || *last_minute_index_ != minute_index)) {
      last_minute_index_ = minute_index;
      return Timestamp::FromLocalMs(now_ms);
    }

    // Never sleep across the boundary: wake exactly on it when it is nearer
    // than one poll interval.
    const int64_t until_boundary = kMsPerMinute - ms_into_minute;
    const int64_t sleep_ms = std::min(poll_interval_ms_, until_boundary);
    wait_strategy_->WaitFor(std::chrono::milliseconds(sleep_ms));
  }
}

void ClockSync::SleepUntilBeforeNextBoundary(int64_t lead_ms,
                                             const std::atomic<bool>* stop_requested) {
  // Anchor on the last minute handed out: if a long play already ran into
  // the next minute's second 0, that boundary is still caught (late).
  const int64_t now_ms = time_source_->NowLocalMs();
  const int64_t lead = std::max<int64_t>(lead_ms, 0);
  int64_t anchor = last_minute_index_.has_value() ? *last_minute_index_ : MinuteIndex(now_ms);
  int64_t wake_ms = (anchor + 1) * kMsPerMinute - lead;

  // Wall clock stepped backwards: sleep toward the upcoming boundary only.
  if (wake_ms - now_ms > kMsPerMinute) {
    anchor = MinuteIndex(now_ms);
    wake_ms = (anchor + 1) * kMsPerMinute - lead;
  }

  while (!StopRequested(stop_requested)) {
    const int64_t remaining = wake_ms - time_source_->NowLocalMs();
    if (remaining <= 0) {
      return;
    }
    // Sleep in poll-sized chunks so Stop() is honored promptly.
    wait_strategy_->WaitFor(std::chrono::milliseconds(std::min(remaining, poll_interval_ms_)));
  }
}

}  // namespace carillon::timing
