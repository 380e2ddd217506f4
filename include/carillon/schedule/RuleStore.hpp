// Repository: Carillon
// Component: RuleStore
// Purpose: Shared, ordered, lock-guarded collection of schedule rules.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_SCHEDULE_RULE_STORE_HPP_
#define CARILLON_SCHEDULE_RULE_STORE_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "carillon/schedule/RuleTypes.hpp"

namespace carillon::schedule {

// Point-in-time copy of the store. Rules are shared immutable values, so
// holding a snapshot across a long play never blocks an editor and a later
// mutation never changes what the snapshot sees.
struct RuleSnapshot {
  uint64_t version = 0;
  std::vector<std::shared_ptr<const Rule>> rules;

  size_t size() const { return rules.size(); }
  bool empty() const { return rules.empty(); }
};

// RuleStore is the only mutable state shared between the editor thread and
// the playout thread. Every operation takes the same mutex; nothing blocking
// (playback, operator input) ever runs under it.
//
// Positions are 1-based to match what the operator sees on screen.
// The store performs no validation of rule contents.
class RuleStore {
 public:
  struct MutationResult {
    bool success;
    ScheduleError error;
    int position;  // Position affected on success, 0 on failure

    static MutationResult Success(int p) {
      return {true, ScheduleError::kNone, p};
    }
    static MutationResult Failure(ScheduleError e) {
      return {false, e, 0};
    }
  };

  RuleStore() = default;
  explicit RuleStore(const std::vector<Rule>& initial);

  RuleStore(const RuleStore&) = delete;
  RuleStore& operator=(const RuleStore&) = delete;

  RuleSnapshot Snapshot() const;

  // Replace the rule at position, or append when position > Len().
  // Fails only with kInvalidPosition for position < 1.
  MutationResult UpsertAt(int position, Rule rule);

  // Remove the rule at position. kNotFound when position > Len() (including
  // an empty store); the store is left unchanged.
  MutationResult DeleteAt(int position);

  // Remove exactly this rule object. Tries last_known_position first; if the
  // list was renumbered since the caller's snapshot, removes the same object
  // wherever it now is. kNotFound when it is already gone.
  MutationResult RemoveIfPresent(int last_known_position,
                                 const std::shared_ptr<const Rule>& rule);

  int Len() const;

  // Incremented on every successful mutation.
  uint64_t Version() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<const Rule>> rules_;
  uint64_t version_ = 0;
};

}  // namespace carillon::schedule

#endif  // CARILLON_SCHEDULE_RULE_STORE_HPP_
