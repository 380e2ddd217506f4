// Repository: Carillon
// Component: EditorSession
// Purpose: Interactive line loop that lets the operator view and edit the
//          live schedule.
// Copyright (c) 2025 Carillon

#include "carillon/editor/EditorSession.hpp"

#include <istream>
#include <ostream>

#include "carillon/editor/ScheduleRenderer.hpp"
#include "carillon/util/Logger.hpp"

namespace carillon::editor {

EditorSession::EditorSession(std::shared_ptr<schedule::RuleStore> store,
                             CommandParser parser,
                             std::istream& in, std::ostream& out)
    : store_(std::move(store)), parser_(std::move(parser)), in_(in), out_(out) {}

void EditorSession::Run() {
  Write(ScheduleRenderer::Instructions() + "\n");
  WriteSchedule();
  WritePrompt();

  std::string line;
  while (std::getline(in_, line)) {
    HandleLine(line);
    WritePrompt();
  }
  Write("\n");
  util::Logger::Info("[EditorSession] Operator input closed");
}

bool EditorSession::HandleLine(const std::string& line) {
  const ParseResult parsed = parser_.Parse(line);
  if (!parsed.success) {
    util::Logger::Debug("[EditorSession] Rejected (" +
                        std::string(ParseErrorToString(parsed.error)) + "): " + line);
    Write(parsed.message + "\n");
    return false;
  }

  const Command& command = parsed.command;
  switch (command.kind) {
    case Command::Kind::kShowInstructions:
      Write(ScheduleRenderer::Instructions());
      return false;

    case Command::Kind::kShowSchedule:
      WriteSchedule();
      return false;

    case Command::Kind::kDelete: {
      const auto result = store_->DeleteAt(command.position);
      if (!result.success) {
        Write("No line " + std::to_string(command.position) + " to delete\n");
        return false;
      }
      util::Logger::Debug("[EditorSession] Deleted line " + std::to_string(command.position));
      WriteSchedule();
      return true;
    }

    case Command::Kind::kUpsert: {
      const auto result = store_->UpsertAt(command.position, *command.rule);
      if (!result.success) {
        Write("Error: Line " + std::to_string(command.position) + " cannot be set (" +
              ScheduleErrorToString(result.error) + ")\n");
        return false;
      }
      util::Logger::Debug("[EditorSession] Line " + std::to_string(result.position) + ": " +
                          command.rule->Describe());
      WriteSchedule();
      return true;
    }
  }
  return false;
}

void EditorSession::NotifyRuleRemoved(int position, const schedule::Rule& rule) {
  Write("\nEvent " + std::to_string(position) + " " + rule.Describe() +
        " deleted. Resuming schedule\n");
  WriteSchedule();
  WritePrompt();
}

void EditorSession::WriteSchedule() {
  Write(ScheduleRenderer::Render(store_->Snapshot()));
}

void EditorSession::WritePrompt() {
  Write(">");
}

void EditorSession::Write(const std::string& text) {
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << text << std::flush;
}

}  // namespace carillon::editor
