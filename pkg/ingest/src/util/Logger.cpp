// Repository: Triptych-ingest
// Component: Thread-Safe Logger
// Copyright (c) 2026 Triptych

#include "triptych/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace triptych::util {

std::mutex Logger::mutex_;
Logger::CaptureFn Logger::capture_;
std::atomic<bool> Logger::debug_enabled_{std::getenv("TRIPTYCH_DEBUG") != nullptr};

void Logger::Info(const std::string& line) { Write(Level::kInfo, line); }

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Write(Level::kDebug, line);
}

void Logger::Warn(const std::string& line) { Write(Level::kWarn, line); }

void Logger::Error(const std::string& line) { Write(Level::kError, line); }

void Logger::SetDebugEnabled(bool enabled) {
  debug_enabled_.store(enabled, std::memory_order_relaxed);
}

bool Logger::DebugEnabled() {
  return debug_enabled_.load(std::memory_order_relaxed);
}

void Logger::SetCapture(CaptureFn capture) {
  std::lock_guard<std::mutex> lock(mutex_);
  capture_ = std::move(capture);
}

const char* Logger::LevelName(Level level) {
  switch (level) {
    case Level::kDebug: return "debug";
    case Level::kInfo:  return "info";
    case Level::kWarn:  return "warn";
    case Level::kError: return "error";
  }
  return "unknown";
}

void Logger::Write(Level level, const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostream& out = (level == Level::kWarn || level == Level::kError) ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
  if (capture_) capture_(level, line);
}

}  // namespace triptych::util
