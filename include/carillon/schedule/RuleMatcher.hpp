// Repository: Carillon
// Component: RuleMatcher
// Purpose: Pure decision whether a rule is due at a given minute.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_SCHEDULE_RULE_MATCHER_HPP_
#define CARILLON_SCHEDULE_RULE_MATCHER_HPP_

#include "carillon/schedule/RuleTypes.hpp"
#include "carillon/timing/Timestamp.hpp"

namespace carillon::schedule {

// First failing check, in evaluation order.
enum class MatchVerdict {
  kDue = 0,
  kWrongDate,
  kWrongWeekday,
  kWrongHour,
  kWrongMinute,
};

const char* MatchVerdictToString(MatchVerdict verdict);

// Evaluates one rule against one timestamp with no side effects:
//   1. fixed_date set  → now's calendar date must equal it (weekdays ignored)
//      otherwise       → now's weekday must lie in [start, end]
//   2. now's hour must lie in [start_hour, end_hour]
//   3. now's minute must equal rule.minute
// Seconds are not examined and there is no de-duplication across calls.
MatchVerdict Evaluate(const Rule& rule, const timing::Timestamp& now);

inline bool IsDue(const Rule& rule, const timing::Timestamp& now) {
  return Evaluate(rule, now) == MatchVerdict::kDue;
}

// Inclusive weekday range. end < start wraps past Saturday ("fr-mo" is
// Fri, Sat, Sun, Mon). Any bound outside 0..6 never matches.
bool WeekdayInRange(int weekday, int start_weekday, int end_weekday);

// Inclusive hour range; start > end never matches.
bool HourInRange(int hour, int start_hour, int end_hour);

// 12-hour strike count for a 24-hour clock hour: 0 and 12 → 12, 13 → 1.
int StrikeCountForHour(int hour);

}  // namespace carillon::schedule

#endif  // CARILLON_SCHEDULE_RULE_MATCHER_HPP_
