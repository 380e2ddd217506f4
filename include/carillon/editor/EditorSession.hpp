// Repository: Carillon
// Component: EditorSession
// Purpose: Interactive line loop that lets the operator view and edit the
//          live schedule.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_EDITOR_EDITOR_SESSION_HPP_
#define CARILLON_EDITOR_EDITOR_SESSION_HPP_

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

#include "carillon/editor/CommandParser.hpp"
#include "carillon/schedule/RuleStore.hpp"

namespace carillon::editor {

// EditorSession reads one command per line from `in` and writes the
// instructions, schedule table, prompts and error messages to `out`.
// It is the only writer to the RuleStore apart from playout healing.
//
// Thread Safety:
// - Run() on one thread (normally main)
// - NotifyRuleRemoved() may be called from the playout thread; writes to
//   `out` are serialized
class EditorSession {
 public:
  EditorSession(std::shared_ptr<schedule::RuleStore> store, CommandParser parser,
                std::istream& in, std::ostream& out);

  EditorSession(const EditorSession&) = delete;
  EditorSession& operator=(const EditorSession&) = delete;

  // Prints the instructions and the table, then processes lines until end
  // of input (or a read error).
  void Run();

  // Applies one input line. Returns true if the store changed.
  bool HandleLine(const std::string& line);

  // Reports a rule removed by the playout loop and reprints the table and
  // prompt, since the operator's line numbers just shifted.
  void NotifyRuleRemoved(int position, const schedule::Rule& rule);

 private:
  void WriteSchedule();
  void WritePrompt();
  void Write(const std::string& text);

  std::shared_ptr<schedule::RuleStore> store_;
  CommandParser parser_;
  std::istream& in_;
  std::ostream& out_;
  std::mutex out_mutex_;
};

}  // namespace carillon::editor

#endif  // CARILLON_EDITOR_EDITOR_SESSION_HPP_
