// Repository: Carillon
// Component: Civil Timestamp
// Purpose: Days-from-civil / civil-from-days conversion (proleptic Gregorian).
// Copyright (c) 2025 Carillon

#include "carillon/timing/Timestamp.hpp"

#include <cstdio>

namespace carillon::timing {

namespace {

int64_t FloorDiv(int64_t value, int64_t divisor) {
  int64_t q = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --q;
  }
  return q;
}

// Days since 1970-01-01 for y-m-d.
int64_t DaysFromCivil(int64_t y, int m, int d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;                                   // [0, 399]
  const int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;  // [0, 365]
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;           // [0, 146096]
  return era * 146097 + doe - 719468;
}

void CivilFromDays(int64_t z, int64_t* y_out, int* m_out, int* d_out) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const int64_t mp = (5 * doy + 2) / 153;
  const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  *y_out = yoe + era * 400 + (m <= 2 ? 1 : 0);
  *m_out = m;
  *d_out = d;
}

bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

}  // namespace

int DaysInMonth(int year, int month) {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) {
    return 0;
  }
  if (month == 2 && IsLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

Timestamp Timestamp::FromLocalMs(int64_t local_ms) {
  const int64_t days = FloorDiv(local_ms, kMsPerDay);
  const int64_t ms_of_day = local_ms - days * kMsPerDay;

  Timestamp ts;
  int64_t year = 0;
  CivilFromDays(days, &year, &ts.month, &ts.day);
  ts.year = static_cast<int>(year);
  // 1970-01-01 was a Thursday (4).
  ts.weekday = static_cast<int>(days >= -4 ? (days + 4) % 7 : (days + 5) % 7 + 6);
  ts.hour = static_cast<int>(ms_of_day / 3'600'000);
  ts.minute = static_cast<int>((ms_of_day / kMsPerMinute) % 60);
  ts.second = static_cast<int>((ms_of_day / kMsPerSecond) % 60);
  ts.millisecond = static_cast<int>(ms_of_day % kMsPerSecond);
  return ts;
}

int64_t Timestamp::ToLocalMs(int year, int month, int day,
                             int hour, int minute, int second) {
  const int64_t days = DaysFromCivil(year, month, day);
  return days * kMsPerDay + static_cast<int64_t>(hour) * 3'600'000 +
         static_cast<int64_t>(minute) * kMsPerMinute +
         static_cast<int64_t>(second) * kMsPerSecond;
}

std::string Timestamp::ToString() const {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                year, month, day, hour, minute, second);
  return buf;
}

}  // namespace carillon::timing
