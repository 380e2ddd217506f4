// Repository: Carillon
// Component: Default Schedule
// Copyright (c) 2025 Carillon

#include "carillon/schedule/DefaultSchedule.hpp"

namespace carillon::schedule {

std::vector<Rule> DefaultTowerSchedule(int first_hour, int last_hour) {
  // Display order: the hour melody leads into the strike that follows it.
  return {
      Rule::Recurring(kSunday, kSaturday, first_hour, last_hour, 59, SoundRef::Named("Hour")),
      Rule::Recurring(kSunday, kSaturday, first_hour, last_hour, 0, SoundRef::Strike()),
      Rule::Recurring(kSunday, kSaturday, first_hour, last_hour, 15, SoundRef::Named("Quarter")),
      Rule::Recurring(kSunday, kSaturday, first_hour, last_hour, 30, SoundRef::Named("Half")),
      Rule::Recurring(kSunday, kSaturday, first_hour, last_hour, 45, SoundRef::Named("ThreeQuarter")),
  };
}

}  // namespace carillon::schedule
