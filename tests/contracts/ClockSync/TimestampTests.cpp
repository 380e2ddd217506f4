// Repository: Carillon
// Component: Timestamp Tests
// Purpose: Verify civil-time breakdown of local milliseconds.
// Copyright (c) 2025 Carillon

#include <gtest/gtest.h>

#include "carillon/timing/Timestamp.hpp"

namespace carillon::timing::testing {
namespace {

TEST(TimestampTest, EpochIsThursdayMidnight) {
  const Timestamp ts = Timestamp::FromLocalMs(0);
  EXPECT_EQ(ts.year, 1970);
  EXPECT_EQ(ts.month, 1);
  EXPECT_EQ(ts.day, 1);
  EXPECT_EQ(ts.weekday, 4);
  EXPECT_EQ(ts.hour, 0);
  EXPECT_EQ(ts.minute, 0);
  EXPECT_EQ(ts.second, 0);
  EXPECT_EQ(ts.millisecond, 0);
}

TEST(TimestampTest, NegativeMillisecondsFloorToPreviousDay) {
  const Timestamp ts = Timestamp::FromLocalMs(-1);
  EXPECT_EQ(ts.year, 1969);
  EXPECT_EQ(ts.month, 12);
  EXPECT_EQ(ts.day, 31);
  EXPECT_EQ(ts.weekday, 3);  // Wednesday
  EXPECT_EQ(ts.hour, 23);
  EXPECT_EQ(ts.minute, 59);
  EXPECT_EQ(ts.second, 59);
  EXPECT_EQ(ts.millisecond, 999);

  // 1969-12-27 was a Saturday, 1969-12-21 a Sunday.
  EXPECT_EQ(Timestamp::FromLocalMs(-5 * kMsPerDay).weekday, 6);
  EXPECT_EQ(Timestamp::FromLocalMs(-11 * kMsPerDay).weekday, 0);
}

TEST(TimestampTest, KnownDates) {
  const Timestamp christmas =
      Timestamp::FromLocalMs(Timestamp::ToLocalMs(2021, 12, 25, 6, 0, 0));
  EXPECT_EQ(christmas.Date(), (CalendarDate{2021, 12, 25}));
  EXPECT_EQ(christmas.weekday, 6);  // Saturday
  EXPECT_EQ(christmas.hour, 6);
  EXPECT_EQ(christmas.ToString(), "2021-12-25 06:00:00");

  const Timestamp leap = Timestamp::FromLocalMs(Timestamp::ToLocalMs(2024, 2, 29, 23, 59, 59));
  EXPECT_EQ(leap.Date(), (CalendarDate{2024, 2, 29}));
  EXPECT_EQ(leap.weekday, 4);  // Thursday
  EXPECT_EQ(leap.minute, 59);
  EXPECT_EQ(leap.second, 59);

  const Timestamp sunday = Timestamp::FromLocalMs(Timestamp::ToLocalMs(2021, 7, 4, 9, 0, 0));
  EXPECT_EQ(sunday.weekday, 0);
}

TEST(TimestampTest, MinuteBoundaryArithmetic) {
  const int64_t ms = Timestamp::ToLocalMs(2021, 12, 31, 23, 59, 59) + 999;
  const Timestamp before = Timestamp::FromLocalMs(ms);
  const Timestamp after = Timestamp::FromLocalMs(ms + 1);
  EXPECT_EQ(before.year, 2021);
  EXPECT_EQ(before.millisecond, 999);
  EXPECT_EQ(after.Date(), (CalendarDate{2022, 1, 1}));
  EXPECT_EQ(after.hour, 0);
  EXPECT_EQ(after.minute, 0);
  EXPECT_EQ(after.second, 0);
  EXPECT_EQ(after.weekday, 6);  // 2022-01-01 was a Saturday
}

TEST(TimestampTest, DaysInMonth) {
  EXPECT_EQ(DaysInMonth(2021, 1), 31);
  EXPECT_EQ(DaysInMonth(2021, 2), 28);
  EXPECT_EQ(DaysInMonth(2024, 2), 29);
  EXPECT_EQ(DaysInMonth(2100, 2), 28);
  EXPECT_EQ(DaysInMonth(2000, 2), 29);
  EXPECT_EQ(DaysInMonth(2021, 4), 30);
  EXPECT_EQ(DaysInMonth(2021, 12), 31);
  EXPECT_EQ(DaysInMonth(2021, 0), 0);
  EXPECT_EQ(DaysInMonth(2021, 13), 0);
}

}  // namespace
}  // namespace carillon::timing::testing
