// Repository: Triptych-ingest
// Component: Video Merger Interface
// Purpose: One-method capability the merge worker calls to concatenate the
//          assembled sources of a group into one output with segment timing.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_MERGE_IVIDEO_MERGER_HPP_
#define TRIPTYCH_MERGE_IVIDEO_MERGER_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "triptych/merge/MergeTypes.hpp"

namespace triptych::merge {

// Per-run view handed to the merger. Mergers poll ShouldAbort() between
// steps and return MergeOutcome::Cancelled() when it turns true; the worker
// decides whether that was a cancel or a timeout.
class MergeContext {
 public:
  using Clock = std::chrono::steady_clock;
  using ProgressFn = std::function<void(int32_t percent)>;

  MergeContext(std::shared_ptr<CancellationToken> token,
               Clock::time_point deadline,
               ProgressFn progress = nullptr)
      : token_(std::move(token)),
        deadline_(deadline),
        progress_(std::move(progress)) {}

  bool Cancelled() const { return token_ && token_->IsCancelled(); }
  bool TimedOut() const { return Clock::now() >= deadline_; }
  bool ShouldAbort() const { return Cancelled() || TimedOut(); }

  // Clamped to [0, 100].
  void ReportProgress(int32_t percent) {
    if (!progress_) return;
    if (percent < 0) percent = 0;
    if (percent > 100) percent = 100;
    progress_(percent);
  }

 private:
  std::shared_ptr<CancellationToken> token_;
  Clock::time_point deadline_;
  ProgressFn progress_;
};

class IVideoMerger {
 public:
  virtual ~IVideoMerger() = default;

  // Called on a merge worker thread, at most once per group. May throw; the
  // worker maps exceptions to MERGE_INTERNAL_ERROR.
  virtual MergeOutcome Run(const MergeJob& job, MergeContext& context) = 0;
};

}  // namespace triptych::merge

#endif  // TRIPTYCH_MERGE_IVIDEO_MERGER_HPP_
