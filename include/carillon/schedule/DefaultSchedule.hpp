// Repository: Carillon
// Component: Default Schedule
// Purpose: Tower-clock rule set installed at startup.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_SCHEDULE_DEFAULT_SCHEDULE_HPP_
#define CARILLON_SCHEDULE_DEFAULT_SCHEDULE_HPP_

#include <vector>

#include "carillon/schedule/RuleTypes.hpp"

namespace carillon::schedule {

inline constexpr int kDefaultFirstHour = 0;
inline constexpr int kDefaultLastHour = 23;

// Every day, hours first_hour..last_hour:
//   :59 Hour, :00 Strike, :15 Quarter, :30 Half, :45 ThreeQuarter
std::vector<Rule> DefaultTowerSchedule(int first_hour = kDefaultFirstHour,
                                       int last_hour = kDefaultLastHour);

}  // namespace carillon::schedule

#endif  // CARILLON_SCHEDULE_DEFAULT_SCHEDULE_HPP_
