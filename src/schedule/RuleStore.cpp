// Repository: Carillon
// Component: RuleStore Implementation
// Copyright (c) 2025 Carillon

#include "carillon/schedule/RuleStore.hpp"

#include "carillon/util/Logger.hpp"

namespace carillon::schedule {

RuleStore::RuleStore(const std::vector<Rule>& initial) {
  rules_.reserve(initial.size());
  for (const auto& rule : initial) {
    rules_.push_back(std::make_shared<const Rule>(rule));
  }
}

RuleSnapshot RuleStore::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return RuleSnapshot{version_, rules_};
}

RuleStore::MutationResult RuleStore::UpsertAt(int position, Rule rule) {
  if (position < 1) {
    return MutationResult::Failure(ScheduleError::kInvalidPosition);
  }
  auto shared = std::make_shared<const Rule>(std::move(rule));

  int affected = position;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<size_t>(position) > rules_.size()) {
      rules_.push_back(std::move(shared));
      affected = static_cast<int>(rules_.size());
    } else {
      rules_[static_cast<size_t>(position - 1)] = std::move(shared);
    }
    ++version_;
  }

  util::Logger::Debug("[RuleStore] Upsert at " + std::to_string(affected));
  return MutationResult::Success(affected);
}

RuleStore::MutationResult RuleStore::DeleteAt(int position) {
  if (position < 1) {
    return MutationResult::Failure(ScheduleError::kInvalidPosition);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<size_t>(position) > rules_.size()) {
      return MutationResult::Failure(ScheduleError::kNotFound);
    }
    rules_.erase(rules_.begin() + (position - 1));
    ++version_;
  }

  util::Logger::Debug("[RuleStore] Deleted " + std::to_string(position));
  return MutationResult::Success(position);
}

RuleStore::MutationResult RuleStore::RemoveIfPresent(
    int last_known_position, const std::shared_ptr<const Rule>& rule) {
  if (!rule) {
    return MutationResult::Failure(ScheduleError::kNotFound);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (last_known_position >= 1 &&
      static_cast<size_t>(last_known_position) <= rules_.size() &&
      rules_[static_cast<size_t>(last_known_position - 1)] == rule) {
    rules_.erase(rules_.begin() + (last_known_position - 1));
    ++version_;
    return MutationResult::Success(last_known_position);
  }

  // Renumbered since the snapshot (earlier delete or insert): find the object.
  for (size_t i = 0; i < rules_.size(); ++i) {
    if (rules_[i] == rule) {
      rules_.erase(rules_.begin() + static_cast<std::ptrdiff_t>(i));
      ++version_;
      return MutationResult::Success(static_cast<int>(i + 1));
    }
  }
  return MutationResult::Failure(ScheduleError::kNotFound);
}

int RuleStore::Len() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(rules_.size());
}

uint64_t RuleStore::Version() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return version_;
}

}  // namespace carillon::schedule
