// Repository: Triptych-ingest
// Component: MergeWorker
// Purpose: Pool of persistent threads that run merge jobs in FIFO order and
//          report exactly one outcome per job.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_MERGE_MERGE_WORKER_HPP_
#define TRIPTYCH_MERGE_MERGE_WORKER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "triptych/merge/IVideoMerger.hpp"
#include "triptych/merge/MergeTypes.hpp"

namespace triptych::merge {

// MergeWorker does not deduplicate: the caller's trigger latch guarantees one
// Submit per group.
//
// Outcome mapping per run:
//   token set (before or during the run)  -> kCancelled
//   merger threw (anything)               -> kFailed / MERGE_INTERNAL_ERROR
//   deadline passed                       -> kFailed / MERGE_TIMEOUT
//   success with malformed segment timing -> kFailed / MERGE_INTERNAL_ERROR
//   otherwise the merger's own outcome, with messages sanitized.
//
// A watchdog thread reports MERGE_TIMEOUT as soon as a running job's
// deadline passes, even while the merger is still stuck inside Run(). The
// worker thread stays busy until Run() returns and its late result is
// discarded.
class MergeWorker {
 public:
  using CompletionFn = std::function<void(const std::string& group_id, const MergeOutcome& outcome)>;
  using ProgressFn = std::function<void(const std::string& group_id, int32_t percent)>;
  using DelayHookFn = std::function<void()>;

  // merge_timeout_ms <= 0 disables the deadline.
  MergeWorker(std::shared_ptr<IVideoMerger> merger,
              int32_t thread_count,
              int64_t merge_timeout_ms);
  ~MergeWorker();

  MergeWorker(const MergeWorker&) = delete;
  MergeWorker& operator=(const MergeWorker&) = delete;

  // Non-blocking enqueue; wakes an idle thread. on_done runs exactly once,
  // on the worker thread after the merger returns or on the watchdog thread
  // when the deadline passes first.
  void Submit(MergeJob job,
              std::shared_ptr<CancellationToken> token,
              CompletionFn on_done,
              ProgressFn on_progress = nullptr);

  // Blocks until the queue is empty and no job is running.
  bool WaitIdle(std::chrono::milliseconds timeout);

  // Number of merger invocations so far.
  uint64_t RunCount() const { return run_count_.load(std::memory_order_acquire); }

  size_t PendingCount() const;

  // Drops queued jobs (their callbacks never run), cancels running ones and
  // joins the threads. Idempotent.
  void Shutdown();

  // Test-only: runs on the worker thread right before the merger is called.
  void SetDelayHook(DelayHookFn hook);

 private:
  struct Task {
    MergeJob job;
    std::shared_ptr<CancellationToken> token;
    CompletionFn on_done;
    ProgressFn on_progress;
    MergeContext::Clock::time_point deadline = MergeContext::Clock::time_point::max();
    // Claimed by whichever of worker and watchdog reports first.
    std::shared_ptr<std::atomic<bool>> reported;
  };

  void WorkerLoop();
  void WatchdogLoop();
  MergeOutcome Execute(Task& task);
  // True when this caller won the right to report the task's outcome.
  static bool ClaimReport(const Task& task);

  std::shared_ptr<IVideoMerger> merger_;
  const int64_t merge_timeout_ms_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<Task> queue_;
  std::condition_variable watchdog_cv_;
  std::vector<std::shared_ptr<Task>> running_;  // Guarded by mutex_
  size_t active_ = 0;                           // Guarded by mutex_
  bool shutdown_ = false;                       // Guarded by mutex_

  std::vector<std::thread> threads_;
  std::thread watchdog_;
  std::atomic<uint64_t> run_count_{0};

  DelayHookFn delay_hook_;  // Test-only
};

}  // namespace triptych::merge

#endif  // TRIPTYCH_MERGE_MERGE_WORKER_HPP_
