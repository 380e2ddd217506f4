// Repository: Carillon
// Component: EditorSession Contract Tests
// Purpose: Verify the operator line loop against the live RuleStore and the
//          rendered schedule table.
// Copyright (c) 2025 Carillon

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "carillon/editor/EditorSession.hpp"
#include "carillon/editor/ScheduleRenderer.hpp"
#include "carillon/schedule/DefaultSchedule.hpp"
#include "carillon/schedule/RuleStore.hpp"
#include "carillon/util/Logger.hpp"

namespace carillon::editor::testing {
namespace {

using schedule::Rule;
using schedule::RuleStore;
using schedule::SoundRef;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// =============================================================================
// ScheduleRenderer
// =============================================================================

TEST(ScheduleRendererTest, RendersNumberedRows) {
  RuleStore store;
  store.UpsertAt(1, Rule::Recurring(0, 6, 0, 23, 0, SoundRef::Strike()));
  store.UpsertAt(2, Rule::Recurring(1, 5, 9, 17, 30, SoundRef::Named("Amazing Grace")));
  store.UpsertAt(3, Rule::Recurring(0, 0, 10, 10, 5, SoundRef::Named("Call")));
  store.UpsertAt(4, Rule::OnDate({2021, 12, 25}, 0, 23, 0, SoundRef::Named("Carol")));

  EXPECT_EQ(ScheduleRenderer::Render(store.Snapshot()),
            "Day(s) Hr(s) Min Tune\n"
            "1: su-sa 0-23 0 Strike\n"
            "2: mo-fr 9-17 30 Amazing Grace\n"
            "3: su 10 5 Call\n"
            "4: 12/25/21 0-23 0 Carol\n");
}

TEST(ScheduleRendererTest, EmptyScheduleIsHeaderOnly) {
  EXPECT_EQ(ScheduleRenderer::Render(schedule::RuleSnapshot{}), "Day(s) Hr(s) Min Tune\n");
}

TEST(ScheduleRendererTest, InstructionsDescribeTheGrammar) {
  const std::string text = ScheduleRenderer::Instructions();
  EXPECT_TRUE(Contains(text, "Line# Day(s) Hour(s) Minute"));
  EXPECT_TRUE(Contains(text, "mm/dd/yy"));
  EXPECT_TRUE(Contains(text, "cAsE SeNsiTiVe"));
}

// =============================================================================
// EditorSession
// =============================================================================

class EditorSessionTest : public ::testing::Test {
 protected:
  void SetUp() override { store_ = std::make_shared<RuleStore>(schedule::DefaultTowerSchedule()); }

  std::string RunWith(const std::string& input) {
    std::istringstream in(input);
    std::ostringstream out;
    EditorSession session(store_, CommandParser(), in, out);
    session.Run();
    return out.str();
  }

  std::shared_ptr<RuleStore> store_;
};

TEST_F(EditorSessionTest, PrintsInstructionsScheduleAndPromptAtStart) {
  const std::string out = RunWith("");
  EXPECT_EQ(out.rfind(ScheduleRenderer::Instructions(), 0), 0u);
  EXPECT_TRUE(Contains(out, "1: su-sa 0-23 59 Hour\n"));
  EXPECT_TRUE(Contains(out, "5: su-sa 0-23 45 ThreeQuarter\n"));
  EXPECT_TRUE(Contains(out, ">"));
}

TEST_F(EditorSessionTest, UpsertAppendsAndReplaces) {
  const std::string out = RunWith("9 mo-fr 9-17 30 Bell\n2 su 12 0 strike\n");
  const auto snapshot = store_->Snapshot();
  ASSERT_EQ(snapshot.size(), 6u);
  EXPECT_EQ(*snapshot.rules[5], Rule::Recurring(1, 5, 9, 17, 30, SoundRef::Named("Bell")));
  EXPECT_EQ(*snapshot.rules[1], Rule::Recurring(0, 0, 12, 12, 0, SoundRef::Strike()));
  EXPECT_TRUE(Contains(out, "6: mo-fr 9-17 30 Bell\n"));
  EXPECT_TRUE(Contains(out, "2: su 12 0 Strike\n"));
}

TEST_F(EditorSessionTest, DeleteRenumbersAndReprints) {
  const std::string out = RunWith("1\n");
  ASSERT_EQ(store_->Len(), 4);
  EXPECT_TRUE(store_->Snapshot().rules[0]->sound.IsStrike());
  EXPECT_TRUE(Contains(out, "1: su-sa 0-23 0 Strike\n"));
}

TEST_F(EditorSessionTest, DeleteMissingLineReportsAndKeepsStore) {
  const uint64_t version = store_->Version();
  const std::string out = RunWith("8\n");
  EXPECT_TRUE(Contains(out, "No line 8 to delete\n"));
  EXPECT_EQ(store_->Len(), 5);
  EXPECT_EQ(store_->Version(), version);
}

TEST_F(EditorSessionTest, DeleteOnEmptyStore) {
  store_ = std::make_shared<RuleStore>();
  const std::string out = RunWith("1\n");
  EXPECT_TRUE(Contains(out, "No line 1 to delete\n"));
}

TEST_F(EditorSessionTest, ParseErrorLeavesStoreUnchanged) {
  const uint64_t version = store_->Version();
  const std::string out = RunWith("1 xx 9 0 Bell\nhello\n1 su 25 0 Bell\n");
  EXPECT_TRUE(Contains(out, "Error: Day(s) must be su, mo, tu, we, th, fr or sa\n"));
  EXPECT_TRUE(Contains(out, "Error: Input must begin with a line number\n"));
  EXPECT_TRUE(Contains(out, "Start Hour 25 must be between 0 and 23"));
  EXPECT_EQ(store_->Version(), version);
}

TEST_F(EditorSessionTest, QuestionMarkAndEmptyLine) {
  const std::string out = RunWith("?\n\n");
  // Once at start, once for '?'.
  const std::string instructions = ScheduleRenderer::Instructions();
  const size_t first = out.find(instructions);
  ASSERT_NE(first, std::string::npos);
  EXPECT_NE(out.find(instructions, first + 1), std::string::npos);

  const std::string header = "Day(s) Hr(s) Min Tune\n";
  size_t count = 0;
  for (size_t pos = out.find(header); pos != std::string::npos; pos = out.find(header, pos + 1)) {
    ++count;
  }
  EXPECT_EQ(count, 2u);
}

TEST_F(EditorSessionTest, HandleLineReportsChanges) {
  std::istringstream in;
  std::ostringstream out;
  EditorSession session(store_, CommandParser(), in, out);

  EXPECT_TRUE(session.HandleLine("1 sa 8 0 Bell"));
  EXPECT_TRUE(session.HandleLine("5"));
  EXPECT_FALSE(session.HandleLine("5 sa 8 0"));
  EXPECT_FALSE(session.HandleLine(""));
  EXPECT_FALSE(session.HandleLine("40"));
  EXPECT_EQ(store_->Len(), 4);
}

TEST_F(EditorSessionTest, EditsLogAtDebugOnly) {
  std::vector<std::string> infos;
  std::vector<std::string> debugs;
  util::Logger::SetInfoSink([&](const std::string& line) { infos.push_back(line); });
  util::Logger::SetSink(util::LogLevel::kDebug,
                        [&](const std::string& line) {
                          if (line.rfind("[EditorSession]", 0) == 0) {
                            debugs.push_back(line);
                          }
                        });

  std::istringstream in;
  std::ostringstream out;
  EditorSession session(store_, CommandParser(), in, out);
  EXPECT_TRUE(session.HandleLine("1 sa 8 0 Bell"));
  EXPECT_TRUE(session.HandleLine("2"));

  util::Logger::SetInfoSink(nullptr);
  util::Logger::SetSink(util::LogLevel::kDebug, nullptr);

  EXPECT_TRUE(infos.empty());
  ASSERT_EQ(debugs.size(), 2u);
  EXPECT_EQ(debugs[0], "[EditorSession] Line 1: sa 8 0 Bell");
  EXPECT_EQ(debugs[1], "[EditorSession] Deleted line 2");
}

TEST_F(EditorSessionTest, RuleRemovedNotificationReprintsTableAndPrompt) {
  std::istringstream in;
  std::ostringstream out;
  EditorSession session(store_, CommandParser(), in, out);

  const Rule removed = Rule::Recurring(0, 6, 9, 9, 0, SoundRef::Named("Toll"));
  session.NotifyRuleRemoved(3, removed);

  const std::string text = out.str();
  EXPECT_TRUE(Contains(text, "Event 3 su-sa 9 0 Toll deleted. Resuming schedule\n"));
  EXPECT_TRUE(Contains(text, "Day(s) Hr(s) Min Tune\n1: "));
  EXPECT_EQ(text.back(), '>');
}

}  // namespace
}  // namespace carillon::editor::testing
