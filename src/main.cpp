// Repository: Carillon
// Component: Carillon Main
// Purpose: Process entry point; wires the schedule, clock, audio output,
//          playout thread and operator editor together.
// Copyright (c) 2025 Carillon

#include <signal.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "carillon/audio/FFmpegAudioPlayer.hpp"
#include "carillon/audio/IAudioSink.hpp"
#include "carillon/audio/SdlAudioSink.hpp"
#include "carillon/audio/SoundLibrary.hpp"
#include "carillon/editor/CommandParser.hpp"
#include "carillon/editor/EditorSession.hpp"
#include "carillon/runtime/CarillonConfig.hpp"
#include "carillon/runtime/PlayoutLoop.hpp"
#include "carillon/schedule/DefaultSchedule.hpp"
#include "carillon/schedule/RuleStore.hpp"
#include "carillon/timing/ClockSync.hpp"
#include "carillon/timing/ITimeSource.hpp"
#include "carillon/timing/IWaitStrategy.hpp"
#include "carillon/util/Logger.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// No SA_RESTART: a blocked read on stdin returns so the editor can exit.
void InstallSignalHandlers() {
  struct sigaction action {};
  action.sa_handler = SignalHandler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

std::shared_ptr<carillon::audio::IAudioSink> CreateAudioSink(bool headless) {
  using carillon::util::Logger;
  if (!headless) {
    auto device = std::make_shared<carillon::audio::SdlAudioSink>();
    if (device->Initialize()) {
      return device;
    }
    Logger::Warn("[carillon] Audio device unavailable (" + device->LastError() +
                 "), using headless output");
  }
  auto sink = std::make_shared<carillon::audio::HeadlessAudioSink>(/*pace_realtime=*/true);
  sink->Initialize();
  return sink;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace carillon;

  const std::vector<std::string> argv_list(argv + 1, argv + argc);
  const runtime::CliArgs args = runtime::ParseArgs(argv_list, runtime::ConfigFromEnvironment());
  if (args.help) {
    runtime::PrintUsage(std::cout, argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    runtime::PrintUsage(std::cerr, argv[0]);
    return 1;
  }
  const runtime::CarillonConfig& config = args.config;

  InstallSignalHandlers();

  auto store = std::make_shared<schedule::RuleStore>(
      config.install_default_schedule ? schedule::DefaultTowerSchedule()
                                      : std::vector<schedule::Rule>{});
  auto sounds = std::make_shared<const audio::SoundLibrary>(
      config.sound_dir, config.sound_extension, config.strike_prefix);
  util::Logger::Info("[carillon] Sound directory: " + sounds->BaseDir());

  auto sink = CreateAudioSink(config.headless);
  auto player = std::make_shared<audio::FFmpegAudioPlayer>(sink);
  auto clock = std::make_shared<timing::ClockSync>(
      std::make_shared<timing::SystemTimeSource>(),
      std::make_shared<timing::RealtimeWaitStrategy>(),
      config.poll_interval_ms);

  editor::EditorSession session(store, editor::CommandParser(sounds), std::cin, std::cout);

  runtime::PlayoutLoop::Config loop_config;
  loop_config.wake_lead_ms = config.wake_lead_ms;
  runtime::PlayoutLoop loop(store, clock, sounds, player, loop_config);
  loop.SetRuleRemovedCallback(
      [&session](int position, const schedule::Rule& rule, const audio::PlaybackResult&) {
        session.NotifyRuleRemoved(position, rule);
      });

  if (!loop.Start()) {
    util::Logger::Error("[carillon] Failed to start playout loop");
    return 1;
  }

  session.Run();

  // Operator input closed: keep ringing unattended until told to stop.
  if (!g_termination_requested.load(std::memory_order_acquire)) {
    util::Logger::Info("[carillon] Running unattended; send SIGINT or SIGTERM to stop");
  }
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  util::Logger::Info("[carillon] Termination requested");
  loop.Stop();
  sink->Cleanup();
  return 0;
}
