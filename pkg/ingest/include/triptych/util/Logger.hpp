// Repository: Triptych-ingest
// Component: Thread-Safe Logger
// Purpose: Serialized log output shared by gRPC handlers, merge workers and
//          their watchdog, the maintenance loop and the journal writer.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_UTIL_LOGGER_HPP_
#define TRIPTYCH_UTIL_LOGGER_HPP_

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace triptych::util {

// Every call writes one whole line under a single mutex and flushes it.
// Info and Debug go to stdout, Warn and Error to stderr. Debug output is off
// unless TRIPTYCH_DEBUG is set in the environment or the daemon runs with
// --debug.
//
// Lines read "[Component] EVENT key=value key=value". Merge failure details
// stay in these lines; clients only ever see the sanitized message.
class Logger {
 public:
  enum class Level { kDebug, kInfo, kWarn, kError };

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetDebugEnabled(bool enabled);
  static bool DebugEnabled();

  // Test-only: receives every emitted line with its level, after the console
  // write. Pass nullptr to clear.
  using CaptureFn = std::function<void(Level level, const std::string& line)>;
  static void SetCapture(CaptureFn capture);

  static const char* LevelName(Level level);

 private:
  static void Write(Level level, const std::string& line);

  static std::mutex mutex_;
  static CaptureFn capture_;
  static std::atomic<bool> debug_enabled_;
};

}  // namespace triptych::util

#endif  // TRIPTYCH_UTIL_LOGGER_HPP_
