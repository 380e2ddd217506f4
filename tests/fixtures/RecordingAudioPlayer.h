#ifndef CARILLON_TESTS_FIXTURES_RECORDING_AUDIO_PLAYER_H_
#define CARILLON_TESTS_FIXTURES_RECORDING_AUDIO_PLAYER_H_

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "carillon/audio/IAudioPlayer.hpp"
#include "support/DeterministicTimeSource.hpp"

namespace carillon::tests::fixtures
{

// Records every Play() call. Paths can be scripted to fail or throw, and each
// play can advance a virtual clock to stand in for the sound's duration.
class RecordingAudioPlayer : public audio::IAudioPlayer
{
public:
  audio::PlaybackResult Play(const std::string& path) override
  {
    std::function<void(const std::string&)> hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      played_.push_back(path);
      hook = on_play_;
    }
    if (hook)
    {
      hook(path);
    }
    if (clock_ && play_duration_ms_ > 0)
    {
      clock_->AdvanceMs(play_duration_ms_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (throwing_.count(path) > 0)
    {
      throw std::runtime_error("player exploded on " + path);
    }
    const auto failure = failing_.find(path);
    if (failure != failing_.end())
    {
      return audio::PlaybackResult::Failure(failure->second, path);
    }
    return audio::PlaybackResult::Success();
  }

  void FailOn(const std::string& path,
              audio::PlaybackError error = audio::PlaybackError::kDecodeError)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_[path] = error;
  }

  void ThrowOn(const std::string& path)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    throwing_.insert(path);
  }

  // Runs on the playing thread before the result is returned.
  void OnPlay(std::function<void(const std::string&)> hook)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    on_play_ = std::move(hook);
  }

  void SimulateDuration(std::shared_ptr<testing::DeterministicTimeSource> clock,
                        int64_t duration_ms)
  {
    clock_ = std::move(clock);
    play_duration_ms_ = duration_ms;
  }

  std::vector<std::string> Played() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return played_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::string> played_;
  std::map<std::string, audio::PlaybackError> failing_;
  std::set<std::string> throwing_;
  std::function<void(const std::string&)> on_play_;
  std::shared_ptr<testing::DeterministicTimeSource> clock_;
  int64_t play_duration_ms_ = 0;
};

} // namespace carillon::tests::fixtures

#endif // CARILLON_TESTS_FIXTURES_RECORDING_AUDIO_PLAYER_H_
