// Repository: Carillon
// Component: ScheduleRenderer
// Copyright (c) 2025 Carillon

#include "carillon/editor/ScheduleRenderer.hpp"

#include <sstream>

namespace carillon::editor {

std::string ScheduleRenderer::Render(const schedule::RuleSnapshot& snapshot) {
  std::ostringstream out;
  out << "Day(s) Hr(s) Min Tune\n";
  for (size_t i = 0; i < snapshot.rules.size(); ++i) {
    if (!snapshot.rules[i]) {
      continue;
    }
    out << (i + 1) << ": " << snapshot.rules[i]->Describe() << "\n";
  }
  return out.str();
}

std::string ScheduleRenderer::Instructions() {
  return "- Enter Line# Day(s) Hour(s) Minute and File Name or Strike.\n"
         "- Separate line# and event parameters with a single space.\n"
         "- Day is mm/dd/yy, su, mo, tu, we, th, fr, or sa.\n"
         "- Hour is 24-hour time between 0 and 23.\n"
         "- Minute is between 0 and 59. Events play at hh:mm:00.\n"
         "- Ranges are allowed and inclusive: 0-23 = hourly, su-sa = daily.\n"
         "- Tunes are filenames and are cAsE SeNsiTiVe.\n"
         "- Line#<enter> to delete a line.\n"
         "- <enter> to show the schedule.\n"
         "- ?<enter> to repeat these instructions\n";
}

}  // namespace carillon::editor
