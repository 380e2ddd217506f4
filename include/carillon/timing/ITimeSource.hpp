#pragma once
#include <cstdint>

namespace carillon::timing {

// Wall-clock source in *local* time: milliseconds since 1970-01-01T00:00 as
// read on the tower's clock face (UTC shifted by the current zone offset).
// Schedules are written in local time, so the scheduler never sees UTC.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowLocalMs() const = 0;
};

class SystemTimeSource : public ITimeSource {
public:
  int64_t NowLocalMs() const override;
};

}  // namespace carillon::timing
