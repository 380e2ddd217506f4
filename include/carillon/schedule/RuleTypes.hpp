// Repository: Carillon
// Component: Schedule Rule Types
// Purpose: Immutable playout directive and its sound reference.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_SCHEDULE_RULE_TYPES_HPP_
#define CARILLON_SCHEDULE_RULE_TYPES_HPP_

#include <optional>
#include <string>

#include "carillon/timing/Timestamp.hpp"

namespace carillon::schedule {

using timing::CalendarDate;

// =============================================================================
// Weekdays
// =============================================================================

inline constexpr int kSunday = 0;
inline constexpr int kSaturday = 6;

// Stored in both weekday fields of a fixed-date rule. Out of range on purpose:
// a recurring check against it can never succeed.
inline constexpr int kDisabledWeekday = 8;

// "su" .. "sa"; "??" for anything outside 0..6.
const char* WeekdaySymbol(int weekday);

// =============================================================================
// Error Codes
// =============================================================================

enum class ScheduleError {
  kNone = 0,

  // Delete or heal of a position past the end (or an empty store)
  kNotFound,

  // Position 0 or negative; positions are 1-based
  kInvalidPosition,
};

const char* ScheduleErrorToString(ScheduleError error);

// =============================================================================
// SoundRef
// =============================================================================

// Either the Strike keyword (hour-count strike sequence, expanded at play
// time) or a sound name resolved against the configured sound directory.
struct SoundRef {
  enum class Kind { kStrike, kNamed };

  Kind kind = Kind::kNamed;
  std::string name;  // Empty for kStrike

  static SoundRef Strike() { return SoundRef{Kind::kStrike, ""}; }
  static SoundRef Named(std::string sound_name) {
    return SoundRef{Kind::kNamed, std::move(sound_name)};
  }

  bool IsStrike() const { return kind == Kind::kStrike; }

  // "Strike" or the name as entered.
  std::string ToString() const { return IsStrike() ? "Strike" : name; }

  bool operator==(const SoundRef& other) const {
    return kind == other.kind && name == other.name;
  }
};

// =============================================================================
// Rule
// =============================================================================

// One scheduled playout directive. Exactly one of fixed_date or the weekday
// range is active. Rules are shared immutably once handed to the RuleStore;
// an edit replaces the whole rule at its position.
struct Rule {
  std::optional<CalendarDate> fixed_date;
  int start_weekday = kSunday;    // 0..6, or kDisabledWeekday with fixed_date
  int end_weekday = kSaturday;
  int start_hour = 0;             // 0..23, inclusive
  int end_hour = 23;
  int minute = 0;                 // 0..59, exact
  SoundRef sound;

  static Rule Recurring(int start_weekday, int end_weekday,
                        int start_hour, int end_hour,
                        int minute, SoundRef sound);

  static Rule OnDate(const CalendarDate& date,
                     int start_hour, int end_hour,
                     int minute, SoundRef sound);

  bool IsFixedDate() const { return fixed_date.has_value(); }

  // Day, hour, minute and sound columns, e.g. "mo-fr 9-17 0 Strike".
  std::string Describe() const;

  bool operator==(const Rule& other) const;
};

// "mm/dd/yy" as the operator typed it.
std::string FormatDate(const CalendarDate& date);

}  // namespace carillon::schedule

#endif  // CARILLON_SCHEDULE_RULE_TYPES_HPP_
