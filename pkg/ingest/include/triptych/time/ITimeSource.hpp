// Repository: Triptych-ingest
// Component: Time source seam
// Purpose: Wall-clock access for timestamps, expiry and retention sweeps.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_TIME_ITIME_SOURCE_HPP_
#define TRIPTYCH_TIME_ITIME_SOURCE_HPP_

#include <cstdint>

namespace triptych::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace triptych::time

#endif  // TRIPTYCH_TIME_ITIME_SOURCE_HPP_
