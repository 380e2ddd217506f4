// Repository: Carillon
// Component: CommandParser
// Purpose: Turn one operator input line into a validated editor command.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_EDITOR_COMMAND_PARSER_HPP_
#define CARILLON_EDITOR_COMMAND_PARSER_HPP_

#include <memory>
#include <optional>
#include <string>

#include "carillon/audio/SoundLibrary.hpp"
#include "carillon/schedule/RuleTypes.hpp"

namespace carillon::editor {

// =============================================================================
// Error Codes
// =============================================================================

enum class ParseError {
  kNone = 0,
  kMissingLineNumber,  // First field is not a number
  kBadLineNumber,      // Line number 0
  kTooFewFields,       // Fewer than five fields for an add/replace
  kBadDate,            // Not mm/dd/yy
  kBadMonth,
  kBadDay,
  kBadYear,            // Before 21
  kBadWeekday,         // Not one of su mo tu we th fr sa
  kWeekdayList,        // More than two weekdays
  kBadHour,            // Non-numeric, out of 0..23, or end before start
  kHourList,           // More than two hours
  kBadMinute,
  kSoundMissing,       // Sound file (or a strike file) not readable
};

const char* ParseErrorToString(ParseError error);

struct Command {
  enum class Kind {
    kShowInstructions,  // "?"
    kShowSchedule,      // Empty line
    kDelete,            // Line number alone
    kUpsert,            // Line number plus a full rule
  };

  Kind kind = Kind::kShowSchedule;
  int position = 0;                   // kDelete and kUpsert
  std::optional<schedule::Rule> rule;  // kUpsert only
};

struct ParseResult {
  bool success;
  ParseError error;
  std::string message;  // Operator-facing, set on failure
  Command command;

  static ParseResult Success(Command c) {
    return {true, ParseError::kNone, "", std::move(c)};
  }
  static ParseResult Failure(ParseError e, std::string m) {
    return {false, e, std::move(m), Command{}};
  }
};

// Grammar (fields separated by exactly one space):
//
//   ?
//   <empty line>
//   Line#
//   Line# Day(s) Hour(s) Minute Sound
//
//   Day(s)  : mm/dd/yy | wd | wd-wd     wd in su mo tu we th fr sa (any case)
//   Hour(s) : h | h-h                   0..23, start <= end
//   Minute  : 0..59
//   Sound   : rest of the line (may contain spaces); "strike" in any case
//             selects the strike sequence
//
// Sound availability is checked against the SoundLibrary when one is given.
class CommandParser {
 public:
  explicit CommandParser(std::shared_ptr<const audio::SoundLibrary> sounds = nullptr);

  ParseResult Parse(const std::string& line) const;

 private:
  std::shared_ptr<const audio::SoundLibrary> sounds_;
};

}  // namespace carillon::editor

#endif  // CARILLON_EDITOR_COMMAND_PARSER_HPP_
