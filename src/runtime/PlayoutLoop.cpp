// Repository: Carillon
// Component: PlayoutLoop
// Purpose: Background thread that wakes each minute, evaluates the schedule
//          and plays every due rule in list order.
// Copyright (c) 2025 Carillon

#include "carillon/runtime/PlayoutLoop.hpp"

#include <exception>
#include <string>

#include "carillon/schedule/RuleMatcher.hpp"
#include "carillon/util/Logger.hpp"

namespace carillon::runtime {

const char* PlayoutStateToString(PlayoutLoop::State state) {
  switch (state) {
    case PlayoutLoop::State::kIdle: return "IDLE";
    case PlayoutLoop::State::kSyncing: return "SYNCING";
    case PlayoutLoop::State::kEvaluating: return "EVALUATING";
    case PlayoutLoop::State::kPlaying: return "PLAYING";
    case PlayoutLoop::State::kStopped: return "STOPPED";
  }
  return "UNKNOWN";
}

PlayoutLoop::PlayoutLoop(std::shared_ptr<schedule::RuleStore> store,
                         std::shared_ptr<timing::ClockSync> clock,
                         std::shared_ptr<const audio::SoundLibrary> sounds,
                         std::shared_ptr<audio::IAudioPlayer> player,
                         Config config)
    : store_(std::move(store)),
      clock_(std::move(clock)),
      sounds_(std::move(sounds)),
      player_(std::move(player)),
      config_(config),
      running_(false),
      stop_requested_(false),
      state_(State::kIdle) {}

PlayoutLoop::~PlayoutLoop() { Stop(); }

void PlayoutLoop::SetRuleRemovedCallback(RuleRemovedCallback callback) {
  on_rule_removed_ = std::move(callback);
}

bool PlayoutLoop::Start() {
  if (running_.load(std::memory_order_acquire)) {
    util::Logger::Warn("[PlayoutLoop] Already running");
    return false;
  }

  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  playout_thread_ = std::make_unique<std::thread>(&PlayoutLoop::Run, this);

  util::Logger::Info("[PlayoutLoop] Started (rules=" + std::to_string(store_->Len()) +
                     ", wake_lead_ms=" + std::to_string(config_.wake_lead_ms) + ")");
  return true;
}

void PlayoutLoop::Stop() {
  if (!running_.load(std::memory_order_acquire) && !playout_thread_) {
    return;
  }

  util::Logger::Info("[PlayoutLoop] Stopping...");
  stop_requested_.store(true, std::memory_order_release);

  if (playout_thread_ && playout_thread_->joinable()) {
    playout_thread_->join();
  }
  playout_thread_.reset();
  running_.store(false, std::memory_order_release);

  const Stats stats = GetStats();
  util::Logger::Info("[PlayoutLoop] Stopped. ticks=" + std::to_string(stats.ticks) +
                     " plays=" + std::to_string(stats.plays) +
                     " failures=" + std::to_string(stats.failures) +
                     " device_errors=" + std::to_string(stats.device_errors) +
                     " healed=" + std::to_string(stats.healed));
}

PlayoutLoop::Stats PlayoutLoop::GetStats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void PlayoutLoop::Run() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    SetState(State::kSyncing);
    const auto now = clock_->WaitForMinuteBoundary(&stop_requested_);
    if (!now.has_value()) {
      break;
    }

    RunTick(*now);

    SetState(State::kIdle);
    clock_->SleepUntilBeforeNextBoundary(config_.wake_lead_ms, &stop_requested_);
  }
  SetState(State::kStopped);
}

void PlayoutLoop::RunTick(const timing::Timestamp& now) {
  SetState(State::kEvaluating);
  const schedule::RuleSnapshot snapshot = store_->Snapshot();
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.ticks;
  }
  util::Logger::Debug("[PlayoutLoop] Tick " + now.ToString() + " rules=" +
                      std::to_string(snapshot.size()) + " version=" +
                      std::to_string(snapshot.version));

  for (size_t i = 0; i < snapshot.rules.size(); ++i) {
    const std::shared_ptr<const schedule::Rule>& rule = snapshot.rules[i];
    if (!rule || !schedule::IsDue(*rule, now)) {
      continue;
    }
    const int position = static_cast<int>(i) + 1;
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.matches;
    }

    SetState(State::kPlaying);
    const audio::PlaybackResult result = PlayRule(*rule, now);
    SetState(State::kEvaluating);

    if (result.success) {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.plays;
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.failures;
      if (!audio::IsSoundFault(result.error)) {
        ++stats_.device_errors;
      }
    }
    if (audio::IsSoundFault(result.error)) {
      HealRule(position, rule, result);
    } else {
      util::Logger::Error("[PlayoutLoop] Audio output failed for event " +
                          std::to_string(position) + " " + rule->Describe() + " (" +
                          audio::PlaybackErrorToString(result.error) +
                          (result.detail.empty() ? "" : ": " + result.detail) +
                          "). Event kept");
    }
  }
}

audio::PlaybackResult PlayoutLoop::PlayRule(const schedule::Rule& rule,
                                            const timing::Timestamp& now) {
  const audio::PlaybackResult available = sounds_->CheckPlayable(rule.sound, now.hour);
  if (!available.success) {
    return available;
  }

  const std::string& path = available.detail;
  util::Logger::Debug("[PlayoutLoop] Due: " + rule.Describe() + " -> " + path);
  try {
    return player_->Play(path);
  } catch (const std::exception& e) {
    return audio::PlaybackResult::Failure(audio::PlaybackError::kDecodeError,
                                          std::string("exception: ") + e.what());
  }
}

void PlayoutLoop::HealRule(int position, const std::shared_ptr<const schedule::Rule>& rule,
                           const audio::PlaybackResult& failure) {
  util::Logger::Error("[PlayoutLoop] Internal Error: A scheduled event could not be played (" +
                      std::string(audio::PlaybackErrorToString(failure.error)) +
                      (failure.detail.empty() ? "" : ": " + failure.detail) + ")");

  const auto removed = store_->RemoveIfPresent(position, rule);
  if (!removed.success) {
    util::Logger::Warn("[PlayoutLoop] Event " + rule->Describe() +
                       " was already removed. Resuming schedule");
    return;
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.healed;
  }
  util::Logger::Warn("[PlayoutLoop] Event " + std::to_string(removed.position) + " " +
                     rule->Describe() + " deleted. Resuming schedule");

  if (on_rule_removed_) {
    on_rule_removed_(removed.position, *rule, failure);
  }
}

}  // namespace carillon::runtime
