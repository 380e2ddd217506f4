// Repository: Carillon
// Component: Thread-Safe Logger
// Purpose: Timestamped log lines shared by the editor and playout threads.
// Copyright (c) 2025 Carillon

#include "carillon/util/Logger.hpp"

#include <time.h>

#include <cstdlib>
#include <iostream>

namespace carillon::util {

namespace {

std::string LocalTimePrefix() {
  const time_t now = time(nullptr);
  struct tm local {};
  char buf[32];
  if (localtime_r(&now, &local) == nullptr ||
      strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S ", &local) == 0) {
    return "";
  }
  return buf;
}

}  // namespace

const char* LogLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo: return "INFO";
    case LogLevel::kWarn: return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "UNKNOWN";
}

std::mutex Logger::mutex_;
Logger::Sink Logger::sinks_[4];

void Logger::SetSink(LogLevel level, Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_[static_cast<int>(level)] = std::move(sink);
}

void Logger::Info(const std::string& line) { Emit(LogLevel::kInfo, line); }
void Logger::Debug(const std::string& line) { Emit(LogLevel::kDebug, line); }
void Logger::Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }
void Logger::Error(const std::string& line) { Emit(LogLevel::kError, line); }

void Logger::Emit(LogLevel level, const std::string& line) {
  const bool to_stream = level != LogLevel::kDebug || std::getenv("CARILLON_DEBUG") != nullptr;
  const std::string prefix = to_stream ? LocalTimePrefix() : std::string();

  std::lock_guard<std::mutex> lock(mutex_);
  const Sink& sink = sinks_[static_cast<int>(level)];
  if (sink) {
    sink(line);
  }
  if (!to_stream) {
    return;
  }
  std::ostream& out = (level == LogLevel::kWarn || level == LogLevel::kError) ? std::cerr
                                                                              : std::cout;
  out << prefix << line << '\n';
  out.flush();
}

}  // namespace carillon::util
