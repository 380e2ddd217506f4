// Repository: Carillon
// Component: Schedule Rule Types
// Copyright (c) 2025 Carillon

#include "carillon/schedule/RuleTypes.hpp"

#include <cstdio>
#include <sstream>

namespace carillon::schedule {

namespace {
constexpr const char* kWeekdaySymbols[7] = {"su", "mo", "tu", "we", "th", "fr", "sa"};
}

const char* WeekdaySymbol(int weekday) {
  if (weekday < kSunday || weekday > kSaturday) {
    return "??";
  }
  return kWeekdaySymbols[weekday];
}

const char* ScheduleErrorToString(ScheduleError error) {
  switch (error) {
    case ScheduleError::kNone: return "NONE";
    case ScheduleError::kNotFound: return "NOT_FOUND";
    case ScheduleError::kInvalidPosition: return "INVALID_POSITION";
  }
  return "UNKNOWN";
}

Rule Rule::Recurring(int start_weekday, int end_weekday,
                     int start_hour, int end_hour,
                     int minute, SoundRef sound) {
  Rule rule;
  rule.start_weekday = start_weekday;
  rule.end_weekday = end_weekday;
  rule.start_hour = start_hour;
  rule.end_hour = end_hour;
  rule.minute = minute;
  rule.sound = std::move(sound);
  return rule;
}

Rule Rule::OnDate(const CalendarDate& date,
                  int start_hour, int end_hour,
                  int minute, SoundRef sound) {
  Rule rule;
  rule.fixed_date = date;
  rule.start_weekday = kDisabledWeekday;
  rule.end_weekday = kDisabledWeekday;
  rule.start_hour = start_hour;
  rule.end_hour = end_hour;
  rule.minute = minute;
  rule.sound = std::move(sound);
  return rule;
}

std::string FormatDate(const CalendarDate& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d/%02d/%02d",
                date.month, date.day, date.year % 100);
  return buf;
}

std::string Rule::Describe() const {
  std::ostringstream o;
  if (fixed_date.has_value()) {
    o << FormatDate(*fixed_date);
  } else {
    o << WeekdaySymbol(start_weekday);
    if (end_weekday != start_weekday) {
      o << "-" << WeekdaySymbol(end_weekday);
    }
  }
  o << " " << start_hour;
  if (end_hour != start_hour) {
    o << "-" << end_hour;
  }
  o << " " << minute << " " << sound.ToString();
  return o.str();
}

bool Rule::operator==(const Rule& other) const {
  return fixed_date == other.fixed_date &&
         start_weekday == other.start_weekday &&
         end_weekday == other.end_weekday &&
         start_hour == other.start_hour &&
         end_hour == other.end_hour &&
         minute == other.minute &&
         sound == other.sound;
}

}  // namespace carillon::schedule
