// Repository: Carillon
// Component: Thread-Safe Logger
// Purpose: Timestamped log lines shared by the editor and playout threads.
// Copyright (c) 2025 Carillon

#ifndef CARILLON_UTIL_LOGGER_HPP_
#define CARILLON_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace carillon::util {

enum class LogLevel {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
};

const char* LogLevelToString(LogLevel level);

// Logger writes one whole line per call under a single static mutex, so a
// playout diagnostic never lands inside an operator prompt mid-line. Stream
// lines are prefixed with the local wall-clock second.
//
// Info  → stdout (startup, shutdown)
// Debug → stdout only when CARILLON_DEBUG env is set (ticks, edits)
// Warn  → stderr (event removed after a failed play)
// Error → stderr (failed plays, device faults)
//
// The editor owns stdout while the operator is typing; per-edit detail
// belongs at Debug.
//
// Test-only: a sink installed for a level receives every line at that level
// without the timestamp, Debug included whether or not CARILLON_DEBUG is set.
// Install nullptr to clear.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetSink(LogLevel level, Sink sink);
  static void SetInfoSink(Sink sink) { SetSink(LogLevel::kInfo, std::move(sink)); }
  static void SetWarnSink(Sink sink) { SetSink(LogLevel::kWarn, std::move(sink)); }
  static void SetErrorSink(Sink sink) { SetSink(LogLevel::kError, std::move(sink)); }

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static Sink sinks_[4];
};

}  // namespace carillon::util

#endif  // CARILLON_UTIL_LOGGER_HPP_
