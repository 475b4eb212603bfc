// Repository: Triptych-ingest
// Component: System time source
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_TIME_SYSTEM_TIME_SOURCE_HPP_
#define TRIPTYCH_TIME_SYSTEM_TIME_SOURCE_HPP_

#include <chrono>

#include "triptych/time/ITimeSource.hpp"

namespace triptych::time {

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace triptych::time

#endif  // TRIPTYCH_TIME_SYSTEM_TIME_SOURCE_HPP_
