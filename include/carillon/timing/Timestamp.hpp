// Repository: Carillon
// Component: Civil Timestamp
// Purpose: Break local wall-clock milliseconds into the calendar fields the
//          rule matcher compares against.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_TIMING_TIMESTAMP_HPP_
#define CARILLON_TIMING_TIMESTAMP_HPP_

#include <cstdint>
#include <string>

namespace carillon::timing {

inline constexpr int64_t kMsPerSecond = 1'000;
inline constexpr int64_t kMsPerMinute = 60'000;
inline constexpr int64_t kMsPerDay = 86'400'000;

struct CalendarDate {
  int year = 1970;   // Full year, e.g. 2021
  int month = 1;     // 1..12
  int day = 1;       // 1..31

  bool operator==(const CalendarDate& other) const {
    return year == other.year && month == other.month && day == other.day;
  }
  bool operator!=(const CalendarDate& other) const { return !(*this == other); }
};

// Number of days in the given month (1..12); leap years honored.
int DaysInMonth(int year, int month);

// Timestamp is one instant of local wall-clock time, already broken into
// fields. Weekday uses 0 = Sunday .. 6 = Saturday.
struct Timestamp {
  int year = 1970;
  int month = 1;
  int day = 1;
  int weekday = 4;
  int hour = 0;
  int minute = 0;
  int second = 0;
  int millisecond = 0;

  CalendarDate Date() const { return CalendarDate{year, month, day}; }

  // Pure integer civil arithmetic; valid for any int64 millisecond value.
  static Timestamp FromLocalMs(int64_t local_ms);

  // Inverse of FromLocalMs for whole fields (weekday is derived, not read).
  static int64_t ToLocalMs(int year, int month, int day,
                           int hour = 0, int minute = 0, int second = 0);

  // "YYYY-MM-DD HH:MM:SS" for log lines.
  std::string ToString() const;
};

}  // namespace carillon::timing

#endif  // CARILLON_TIMING_TIMESTAMP_HPP_
