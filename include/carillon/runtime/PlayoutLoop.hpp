// Repository: Carillon
// Component: PlayoutLoop
// Purpose: Background thread that wakes each minute, evaluates the schedule
//          and plays every due rule in list order.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_RUNTIME_PLAYOUT_LOOP_HPP_
#define CARILLON_RUNTIME_PLAYOUT_LOOP_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "carillon/audio/IAudioPlayer.hpp"
#include "carillon/audio/SoundLibrary.hpp"
#include "carillon/schedule/RuleStore.hpp"
#include "carillon/timing/ClockSync.hpp"

namespace carillon::runtime {

struct PlayoutLoopConfig {
  // How long before each boundary the idle sleep ends and polling resumes.
  int64_t wake_lead_ms = 1000;
};

// PlayoutLoop owns the playout thread.
//
// Lifecycle per minute:
//   kSyncing    → ClockSync::WaitForMinuteBoundary()
//   kEvaluating → RuleStore::Snapshot(), then RuleMatcher over each rule
//   kPlaying    → IAudioPlayer::Play() for each due rule, sequentially
//   kIdle       → ClockSync::SleepUntilBeforeNextBoundary(wake_lead_ms)
//
// A due rule whose sound cannot be played is removed from the store (exactly
// that rule object) and the loop carries on with the rest of the snapshot.
// Output device failures are logged and leave the schedule untouched.
// Plays are never interrupted: Stop() waits for an in-flight play.
class PlayoutLoop {
 public:
  enum class State {
    kIdle = 0,
    kSyncing,
    kEvaluating,
    kPlaying,
    kStopped,
  };

  using Config = PlayoutLoopConfig;

  struct Stats {
    uint64_t ticks = 0;     // Minute boundaries evaluated
    uint64_t matches = 0;   // Rules found due
    uint64_t plays = 0;     // Successful plays
    uint64_t failures = 0;  // Failed plays
    uint64_t healed = 0;    // Rules removed after a failure
    uint64_t device_errors = 0;  // Failures blamed on the output device
  };

  // Invoked on the playout thread after a failing rule was removed.
  // Not invoked for device errors.
  // position is where the rule sat when it was removed.
  using RuleRemovedCallback =
      std::function<void(int position, const schedule::Rule& rule,
                         const audio::PlaybackResult& failure)>;

  PlayoutLoop(std::shared_ptr<schedule::RuleStore> store,
              std::shared_ptr<timing::ClockSync> clock,
              std::shared_ptr<const audio::SoundLibrary> sounds,
              std::shared_ptr<audio::IAudioPlayer> player,
              Config config = Config());
  ~PlayoutLoop();

  PlayoutLoop(const PlayoutLoop&) = delete;
  PlayoutLoop& operator=(const PlayoutLoop&) = delete;

  // Set before Start().
  void SetRuleRemovedCallback(RuleRemovedCallback callback);

  // Returns false if already running.
  bool Start();
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // One evaluation pass for the given minute. Runs on the caller's thread;
  // the background loop calls this once per boundary.
  void RunTick(const timing::Timestamp& now);

  State state() const { return state_.load(std::memory_order_acquire); }
  Stats GetStats() const;

 private:
  void Run();
  audio::PlaybackResult PlayRule(const schedule::Rule& rule, const timing::Timestamp& now);
  void HealRule(int position, const std::shared_ptr<const schedule::Rule>& rule,
                const audio::PlaybackResult& failure);
  void SetState(State state) { state_.store(state, std::memory_order_release); }

  std::shared_ptr<schedule::RuleStore> store_;
  std::shared_ptr<timing::ClockSync> clock_;
  std::shared_ptr<const audio::SoundLibrary> sounds_;
  std::shared_ptr<audio::IAudioPlayer> player_;
  Config config_;
  RuleRemovedCallback on_rule_removed_;

  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;
  std::atomic<State> state_;
  std::unique_ptr<std::thread> playout_thread_;

  mutable std::mutex stats_mutex_;
  Stats stats_;
};

const char* PlayoutStateToString(PlayoutLoop::State state);

}  // namespace carillon::runtime

#endif  // CARILLON_RUNTIME_PLAYOUT_LOOP_HPP_
