// Repository: Carillon
// Component: System Time Source
// Purpose: Local wall-clock milliseconds from the system clock.
// Copyright (c) 2025 Carillon

#include "carillon/timing/ITimeSource.hpp"

#include <chrono>
#include <ctime>

namespace carillon::timing {

int64_t SystemTimeSource::NowLocalMs() const {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const int64_t utc_ms = duration_cast<milliseconds>(now.time_since_epoch()).count();

  // Zone offset is re-read every call so DST changes take effect on the
  // next minute without a restart.
  const std::time_t secs = system_clock::to_time_t(now);
  std::tm local{};
  if (localtime_r(&secs, &local) == nullptr) {
    return utc_ms;
  }
  return utc_ms + static_cast<int64_t>(local.tm_gmtoff) * 1000;
}

}  // namespace carillon::timing
