// Repository: Triptych-ingest
// Component: MergeWorker Implementation
// Copyright (c) 2026 Triptych

#include "triptych/merge/MergeWorker.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <stdexcept>

#include "triptych/util/Logger.hpp"

namespace triptych::merge {

using triptych::util::Logger;

MergeWorker::MergeWorker(std::shared_ptr<IVideoMerger> merger,
                         int32_t thread_count,
                         int64_t merge_timeout_ms)
    : merger_(std::move(merger)), merge_timeout_ms_(merge_timeout_ms) {
  if (!merger_) {
    throw std::invalid_argument("MergeWorker: merger is required");
  }
  const int32_t n = std::max<int32_t>(1, thread_count);
  threads_.reserve(static_cast<size_t>(n));
  for (int32_t i = 0; i < n; ++i) {
    threads_.emplace_back(&MergeWorker::WorkerLoop, this);
  }
  watchdog_ = std::thread(&MergeWorker::WatchdogLoop, this);
}

MergeWorker::~MergeWorker() {
  Shutdown();
}

void MergeWorker::Submit(MergeJob job,
                         std::shared_ptr<CancellationToken> token,
                         CompletionFn on_done,
                         ProgressFn on_progress) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      Logger::Warn("[MergeWorker] SUBMIT_AFTER_SHUTDOWN group=" + job.group_id);
      return;
    }
    Task task;
    task.job = std::move(job);
    task.token = token ? std::move(token) : std::make_shared<CancellationToken>();
    task.on_done = std::move(on_done);
    task.on_progress = std::move(on_progress);
    task.reported = std::make_shared<std::atomic<bool>>(false);
    queue_.push_back(std::move(task));
  }
  work_cv_.notify_one();
}

bool MergeWorker::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] {
    return queue_.empty() && active_ == 0;
  });
}

size_t MergeWorker::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void MergeWorker::Shutdown() {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ && threads_.empty()) return;
    shutdown_ = true;
    dropped = queue_.size();
    queue_.clear();
    for (const auto& task : running_) task->token->Cancel();
  }
  work_cv_.notify_all();
  watchdog_cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
  if (watchdog_.joinable()) watchdog_.join();
  idle_cv_.notify_all();
  if (dropped > 0) {
    Logger::Warn("[MergeWorker] SHUTDOWN dropped_jobs=" + std::to_string(dropped));
  }
}

void MergeWorker::SetDelayHook(DelayHookFn hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  delay_hook_ = std::move(hook);
}

// =============================================================================
// WorkerLoop - persistent thread, drains the queue in submission order
// =============================================================================

void MergeWorker::WorkerLoop() {
  while (true) {
    auto task = std::make_shared<Task>();
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      if (shutdown_) return;
      *task = std::move(queue_.front());
      queue_.pop_front();
      if (merge_timeout_ms_ > 0) {
        task->deadline =
            MergeContext::Clock::now() + std::chrono::milliseconds(merge_timeout_ms_);
      }
      ++active_;
      running_.push_back(task);
    }
    watchdog_cv_.notify_all();

    MergeOutcome outcome = Execute(*task);

    if (ClaimReport(*task)) {
      std::ostringstream oss;
      oss << "[MergeWorker] MERGE_FINISHED group=" << task->job.group_id
          << " outcome=" << MergeOutcomeKindName(outcome.kind);
      if (outcome.kind == MergeOutcome::Kind::kFailed) {
        oss << " code=" << outcome.error_code;
      }
      Logger::Info(oss.str());
      if (task->on_done) task->on_done(task->job.group_id, outcome);
    } else {
      Logger::Info("[MergeWorker] LATE_RESULT_DISCARDED group=" + task->job.group_id +
                   " outcome=" + MergeOutcomeKindName(outcome.kind));
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.erase(std::find(running_.begin(), running_.end(), task));
      --active_;
    }
    idle_cv_.notify_all();
  }
}

// =============================================================================
// WatchdogLoop - reports MERGE_TIMEOUT for runs stuck past their deadline
// =============================================================================

void MergeWorker::WatchdogLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!shutdown_) {
    const auto now = MergeContext::Clock::now();
    auto next_deadline = MergeContext::Clock::time_point::max();
    std::vector<std::shared_ptr<Task>> expired;
    for (const auto& task : running_) {
      if (task->reported->load(std::memory_order_acquire)) continue;
      if (task->token->IsCancelled()) continue;
      if (task->deadline <= now) {
        expired.push_back(task);
      } else if (task->deadline < next_deadline) {
        next_deadline = task->deadline;
      }
    }

    if (!expired.empty()) {
      lock.unlock();
      for (const auto& task : expired) {
        if (!ClaimReport(*task)) continue;
        std::ostringstream oss;
        oss << "merge exceeded " << merge_timeout_ms_ << " ms";
        Logger::Warn("[MergeWorker] MERGE_DEADLINE_PASSED group=" + task->job.group_id +
                     " timeout_ms=" + std::to_string(merge_timeout_ms_));
        if (task->on_done) {
          task->on_done(task->job.group_id, MergeOutcome::Failed(kMergeTimeoutCode, oss.str()));
        }
      }
      lock.lock();
      continue;
    }

    if (next_deadline == MergeContext::Clock::time_point::max()) {
      watchdog_cv_.wait(lock);
    } else {
      watchdog_cv_.wait_until(lock, next_deadline);
    }
  }
}

bool MergeWorker::ClaimReport(const Task& task) {
  bool expected = false;
  return task.reported->compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

MergeOutcome MergeWorker::Execute(Task& task) {
  const std::string group_id = task.job.group_id;
  MergeContext::ProgressFn progress;
  if (task.on_progress) {
    ProgressFn on_progress = task.on_progress;
    progress = [on_progress, group_id](int32_t percent) { on_progress(group_id, percent); };
  }
  MergeContext context(task.token, task.deadline, std::move(progress));

  if (context.Cancelled()) {
    Logger::Info("[MergeWorker] MERGE_SKIPPED_CANCELLED group=" + group_id);
    return MergeOutcome::Cancelled();
  }

  DelayHookFn hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hook = delay_hook_;
  }
  if (hook) hook();

  {
    std::ostringstream oss;
    oss << "[MergeWorker] MERGE_STARTED group=" << group_id
        << " sources=" << task.job.sources.size();
    Logger::Info(oss.str());
  }
  run_count_.fetch_add(1, std::memory_order_acq_rel);

  MergeOutcome outcome;
  try {
    outcome = merger_->Run(task.job, context);
  } catch (const std::exception& e) {
    if (context.Cancelled()) return MergeOutcome::Cancelled();
    Logger::Error("[MergeWorker] MERGER_THREW group=" + group_id + " what=" + e.what());
    return MergeOutcome::Failed(kMergeInternalErrorCode, "internal merge error");
  } catch (...) {
    if (context.Cancelled()) return MergeOutcome::Cancelled();
    Logger::Error("[MergeWorker] MERGER_THREW group=" + group_id);
    return MergeOutcome::Failed(kMergeInternalErrorCode, "internal merge error");
  }

  if (context.Cancelled()) return MergeOutcome::Cancelled();
  if (context.TimedOut()) {
    std::ostringstream oss;
    oss << "merge exceeded " << merge_timeout_ms_ << " ms";
    return MergeOutcome::Failed(kMergeTimeoutCode, oss.str());
  }
  switch (outcome.kind) {
    case MergeOutcome::Kind::kSucceeded: {
      const std::string problem = CheckMergeResult(task.job, outcome.result);
      if (!problem.empty()) {
        Logger::Error("[MergeWorker] INVALID_MERGE_RESULT group=" + group_id +
                      " reason=\"" + problem + "\"");
        return MergeOutcome::Failed(kMergeInternalErrorCode, "invalid merge result");
      }
      return outcome;
    }
    case MergeOutcome::Kind::kFailed:
      if (outcome.error_code.empty()) outcome.error_code = kMergeInternalErrorCode;
      outcome.error_message = SanitizeMergeMessage(outcome.error_message);
      return outcome;
    case MergeOutcome::Kind::kCancelled:
      break;
  }
  // The merger gave up although neither the token nor the deadline fired.
  Logger::Warn("[MergeWorker] MERGER_ABORTED_UNPROMPTED group=" + group_id);
  return MergeOutcome::Failed(kMergeInternalErrorCode, "merge aborted");
}

}  // namespace triptych::merge
