// Repository: Carillon
// Component: RuleMatcher
// Copyright (c) 2025 Carillon

#include "carillon/schedule/RuleMatcher.hpp"

namespace carillon::schedule {

const char* MatchVerdictToString(MatchVerdict verdict) {
  switch (verdict) {
    case MatchVerdict::kDue: return "DUE";
    case MatchVerdict::kWrongDate: return "WRONG_DATE";
    case MatchVerdict::kWrongWeekday: return "WRONG_WEEKDAY";
    case MatchVerdict::kWrongHour: return "WRONG_HOUR";
    case MatchVerdict::kWrongMinute: return "WRONG_MINUTE";
  }
  return "UNKNOWN";
}

bool WeekdayInRange(int weekday, int start_weekday, int end_weekday) {
  if (start_weekday < kSunday || start_weekday > kSaturday ||
      end_weekday < kSunday || end_weekday > kSaturday) {
    return false;
  }
  if (start_weekday <= end_weekday) {
    return weekday >= start_weekday && weekday <= end_weekday;
  }
  return weekday >= start_weekday || weekday <= end_weekday;
}

bool HourInRange(int hour, int start_hour, int end_hour) {
  return hour >= start_hour && hour <= end_hour;
}

int StrikeCountForHour(int hour) {
  const int count = ((hour % 12) + 12) % 12;
  return count == 0 ? 12 : count;
}

MatchVerdict Evaluate(const Rule& rule, const timing::Timestamp& now) {
  if (rule.fixed_date.has_value()) {
    if (now.Date() != *rule.fixed_date) {
      return MatchVerdict::kWrongDate;
    }
  } else if (!WeekdayInRange(now.weekday, rule.start_weekday, rule.end_weekday)) {
    return MatchVerdict::kWrongWeekday;
  }

  if (!HourInRange(now.hour, rule.start_hour, rule.end_hour)) {
    return MatchVerdict::kWrongHour;
  }

  if (now.minute != rule.minute) {
    return MatchVerdict::kWrongMinute;
  }
  return MatchVerdict::kDue;
}

}  // namespace carillon::schedule
