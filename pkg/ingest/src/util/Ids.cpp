// Repository: Triptych-ingest
// Component: Identifier and timestamp helpers
// Copyright (c) 2026 Triptych

#include "triptych/util/Ids.hpp"

#include <cstdio>
#include <ctime>
#include <random>

namespace triptych::util {

std::string GenerateUuidV4() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  static thread_local std::uniform_int_distribution<int> dis(0, 15);
  const char* hexdig = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) out += '-';
    if (i == 12) out += '4';
    else if (i == 16) out += hexdig[8 + dis(gen) % 4];
    else out += hexdig[dis(gen)];
  }
  return out;
}

std::string FormatUtcIso8601(int64_t utc_ms) {
  if (utc_ms < 0) return "";
  time_t s = static_cast<time_t>(utc_ms / 1000);
  int frac_ms = static_cast<int>(utc_ms % 1000);
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) return "";
  char buf[64];
  int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

}  // namespace triptych::util
