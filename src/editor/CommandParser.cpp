// Repository: Carillon
// Component: CommandParser
// Purpose: Turn one operator input line into a validated editor command.
// Copyright (c) 2025 Carillon

#include "carillon/editor/CommandParser.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "carillon/timing/Timestamp.hpp"

namespace carillon::editor {

namespace {

// Digits only, at most 6 of them (anything longer is out of every range).
std::optional<int> ParseNumber(const std::string& text) {
  if (text.empty() || text.size() > 6) {
    return std::nullopt;
  }
  int value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

// Splits on single spaces, keeping empty fields. After max_splits the rest
// of the line is returned as the final field.
std::vector<std::string> Split(const std::string& text, char sep, size_t max_splits) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (fields.size() < max_splits) {
    const size_t pos = text.find(sep, start);
    if (pos == std::string::npos) {
      break;
    }
    fields.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  fields.push_back(text.substr(start));
  return fields;
}

std::vector<std::string> Split(const std::string& text, char sep) {
  return Split(text, sep, std::string::npos);
}

std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::optional<int> WeekdayFromSymbol(const std::string& symbol) {
  const std::string lower = ToLower(symbol);
  for (int d = schedule::kSunday; d <= schedule::kSaturday; ++d) {
    if (lower == schedule::WeekdaySymbol(d)) {
      return d;
    }
  }
  return std::nullopt;
}

struct DayField {
  std::optional<schedule::CalendarDate> date;
  int start_weekday = schedule::kSunday;
  int end_weekday = schedule::kSaturday;
};

ParseResult DayError(ParseError e, std::string message) {
  return ParseResult::Failure(e, "Error: " + std::move(message));
}

std::optional<ParseResult> ParseDate(const std::string& field, DayField* out) {
  const auto parts = Split(field, '/');
  if (field.size() != 8 || parts.size() != 3 ||
      parts[0].size() != 2 || parts[1].size() != 2 || parts[2].size() != 2) {
    return DayError(ParseError::kBadDate, "Date must be mm/dd/yy");
  }
  const auto month = ParseNumber(parts[0]);
  const auto day = ParseNumber(parts[1]);
  const auto year = ParseNumber(parts[2]);
  if (!month || !day || !year) {
    return DayError(ParseError::kBadDate, "Date must be mm/dd/yy");
  }
  if (*month < 1 || *month > 12) {
    return DayError(ParseError::kBadMonth, parts[0] + " is not a valid month");
  }
  if (*year < 21) {
    return DayError(ParseError::kBadYear, parts[2] + " is not a valid year");
  }
  const int full_year = 2000 + *year;
  if (*day < 1 || *day > timing::DaysInMonth(full_year, *month)) {
    return DayError(ParseError::kBadDay, parts[1] + " is not a valid day");
  }
  out->date = schedule::CalendarDate{full_year, *month, *day};
  return std::nullopt;
}

std::optional<ParseResult> ParseWeekdays(const std::string& field, DayField* out) {
  const auto parts = Split(field, '-');
  if (parts.size() > 2) {
    return DayError(ParseError::kWeekdayList, "Weekday list. Use multiple events instead");
  }
  const auto start = WeekdayFromSymbol(parts[0]);
  const auto end = parts.size() == 2 ? WeekdayFromSymbol(parts[1]) : start;
  if (!start || !end) {
    return DayError(ParseError::kBadWeekday, "Day(s) must be su, mo, tu, we, th, fr or sa");
  }
  out->start_weekday = *start;
  out->end_weekday = *end;
  return std::nullopt;
}

std::optional<ParseResult> ParseHours(const std::string& field, int* start_hour, int* end_hour) {
  const auto parts = Split(field, '-');
  if (parts.size() > 2) {
    return DayError(ParseError::kHourList, "Hour range must be start-end");
  }
  const auto start = ParseNumber(parts[0]);
  if (!start) {
    return DayError(ParseError::kBadHour, "Start Hour " + parts[0] + " must be numeric");
  }
  if (*start > 23) {
    return DayError(ParseError::kBadHour,
                    "Start Hour " + parts[0] + " must be between 0 and 23");
  }
  const std::string& end_text = parts.size() == 2 ? parts[1] : parts[0];
  const auto end = ParseNumber(end_text);
  if (!end) {
    return DayError(ParseError::kBadHour, "End Hour " + end_text + " must be numeric");
  }
  if (*end > 23) {
    return DayError(ParseError::kBadHour, "End Hour " + end_text + " must be between 0 and 23");
  }
  if (*end < *start) {
    return DayError(ParseError::kBadHour, "End Hour " + end_text +
                                              " must not be earlier than Start Hour " + parts[0]);
  }
  *start_hour = *start;
  *end_hour = *end;
  return std::nullopt;
}

}  // namespace

const char* ParseErrorToString(ParseError error) {
  switch (error) {
    case ParseError::kNone: return "NONE";
    case ParseError::kMissingLineNumber: return "MISSING_LINE_NUMBER";
    case ParseError::kBadLineNumber: return "BAD_LINE_NUMBER";
    case ParseError::kTooFewFields: return "TOO_FEW_FIELDS";
    case ParseError::kBadDate: return "BAD_DATE";
    case ParseError::kBadMonth: return "BAD_MONTH";
    case ParseError::kBadDay: return "BAD_DAY";
    case ParseError::kBadYear: return "BAD_YEAR";
    case ParseError::kBadWeekday: return "BAD_WEEKDAY";
    case ParseError::kWeekdayList: return "WEEKDAY_LIST";
    case ParseError::kBadHour: return "BAD_HOUR";
    case ParseError::kHourList: return "HOUR_LIST";
    case ParseError::kBadMinute: return "BAD_MINUTE";
    case ParseError::kSoundMissing: return "SOUND_MISSING";
  }
  return "UNKNOWN";
}

CommandParser::CommandParser(std::shared_ptr<const audio::SoundLibrary> sounds)
    : sounds_(std::move(sounds)) {}

ParseResult CommandParser::Parse(const std::string& raw_line) const {
  std::string line = raw_line;
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  const auto fields = Split(line, ' ', 4);
  Command command;

  if (fields[0] == "?") {
    command.kind = Command::Kind::kShowInstructions;
    return ParseResult::Success(command);
  }
  if (fields[0].empty()) {
    command.kind = Command::Kind::kShowSchedule;
    return ParseResult::Success(command);
  }

  const auto position = ParseNumber(fields[0]);
  if (!position) {
    return ParseResult::Failure(ParseError::kMissingLineNumber,
                                "Error: Input must begin with a line number");
  }
  if (*position < 1) {
    return ParseResult::Failure(ParseError::kBadLineNumber,
                                "Error: Line numbers start at 1");
  }
  command.position = *position;

  if (fields.size() == 1) {
    command.kind = Command::Kind::kDelete;
    return ParseResult::Success(command);
  }
  if (fields.size() < 5) {
    return ParseResult::Failure(ParseError::kTooFewFields,
                                "Error: Enter five items, separated by single space\n"
                                " Line# Day Hour(s) Minute and Tune");
  }

  DayField day;
  const bool is_date = fields[1].find('/') != std::string::npos;
  auto failure = is_date ? ParseDate(fields[1], &day) : ParseWeekdays(fields[1], &day);
  if (failure) {
    return *failure;
  }

  int start_hour = 0;
  int end_hour = 0;
  failure = ParseHours(fields[2], &start_hour, &end_hour);
  if (failure) {
    return *failure;
  }

  const auto minute = ParseNumber(fields[3]);
  if (!minute) {
    return ParseResult::Failure(ParseError::kBadMinute,
                                "Error: Minute " + fields[3] + " must be numeric");
  }
  if (*minute > 59) {
    return ParseResult::Failure(ParseError::kBadMinute,
                                "Error: Minute " + fields[3] + " must be between 0 and 59");
  }

  const std::string& sound_text = fields[4];
  if (sound_text.empty()) {
    return ParseResult::Failure(ParseError::kSoundMissing,
                                "Error: Enter a tune file name or Strike");
  }
  const schedule::SoundRef sound = ToLower(sound_text) == "strike"
                                       ? schedule::SoundRef::Strike()
                                       : schedule::SoundRef::Named(sound_text);
  if (sounds_) {
    const auto available = sounds_->CheckAvailable(sound);
    if (!available.success) {
      return ParseResult::Failure(
          ParseError::kSoundMissing,
          sound.IsStrike() ? "Error: File " + available.detail + " is missing"
                           : "Error: " + available.detail + " not found - check sPeLLing");
    }
  }

  command.kind = Command::Kind::kUpsert;
  if (day.date) {
    command.rule = schedule::Rule::OnDate(*day.date, start_hour, end_hour, *minute, sound);
  } else {
    command.rule = schedule::Rule::Recurring(day.start_weekday, day.end_weekday,
                                             start_hour, end_hour, *minute, sound);
  }
  return ParseResult::Success(command);
}

}  // namespace carillon::editor
