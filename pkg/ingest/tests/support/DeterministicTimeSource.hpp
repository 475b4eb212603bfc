#pragma once
#include <atomic>
#include <cstdint>

#include "triptych/time/ITimeSource.hpp"

namespace triptych::tests {

// Manually advanced clock. Atomic because merge worker threads read it while
// the test thread advances it.
class DeterministicTimeSource : public time::ITimeSource {
public:
  explicit DeterministicTimeSource(int64_t start_ms = 1'760'000'000'000)
      : now_ms_(start_ms) {}

  int64_t NowUtcMs() const override {
    return now_ms_.load(std::memory_order_acquire);
  }

  void AdvanceMs(int64_t delta) {
    now_ms_.fetch_add(delta, std::memory_order_acq_rel);
  }

  void SetMs(int64_t value) {
    now_ms_.store(value, std::memory_order_release);
  }

private:
  std::atomic<int64_t> now_ms_;
};

}  // namespace triptych::tests
