// Repository: Carillon
// Component: ScheduleRenderer
// Purpose: Operator-facing text for the schedule table and instructions.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_EDITOR_SCHEDULE_RENDERER_HPP_
#define CARILLON_EDITOR_SCHEDULE_RENDERER_HPP_

#include <string>

#include "carillon/schedule/RuleStore.hpp"

namespace carillon::editor {

class ScheduleRenderer {
 public:
  // Header line, then "N: <day(s)> <hour(s)> <minute> <sound>" per rule,
  // numbered from 1 in list order. Every line ends in '\n'.
  static std::string Render(const schedule::RuleSnapshot& snapshot);

  static std::string Instructions();
};

}  // namespace carillon::editor

#endif  // CARILLON_EDITOR_SCHEDULE_RENDERER_HPP_
