// Repository: Triptych-ingest
// Component: MergeWorker Contract Tests
// Purpose: One outcome per job; timeout, exception, cancellation and
//          message sanitization mapping.
// Copyright (c) 2026 Triptych

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "fixtures/LogCapture.h"
#include "fixtures/StubVideoMerger.h"
#include "triptych/merge/MergeWorker.hpp"

namespace triptych::merge {
namespace {

using tests::fixtures::LogCapture;
using tests::fixtures::StubVideoMerger;
using util::Logger;

// Collects outcomes delivered on worker threads.
class OutcomeRecorder {
 public:
  MergeWorker::CompletionFn Callback() {
    return [this](const std::string& group_id, const MergeOutcome& outcome) {
      std::lock_guard<std::mutex> lock(mutex_);
      group_ids_.push_back(group_id);
      outcomes_.push_back(outcome);
      cv_.notify_all();
    };
  }

  bool WaitFor(size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return outcomes_.size() >= n; });
  }

  std::vector<MergeOutcome> Outcomes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
  }

  std::vector<std::string> GroupIds() {
    std::lock_guard<std::mutex> lock(mutex_);
    return group_ids_;
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> group_ids_;
  std::vector<MergeOutcome> outcomes_;
};

MergeJob MakeJob(const std::string& group_id) {
  MergeJob job;
  job.group_id = group_id;
  job.owner_id = "user-1";
  const int64_t durations[] = {10000, 12000, 9000};
  for (int32_t i = 0; i < 3; ++i) {
    MergeSource source;
    source.statement_index = i;
    source.session_id = group_id + "-s" + std::to_string(i);
    source.locator = "mem://sources/" + source.session_id;
    source.declared_duration_ms = durations[i];
    source.mime_type = "video/mp4";
    job.sources.push_back(source);
  }
  return job;
}

constexpr auto kWait = std::chrono::milliseconds(5000);

TEST(MergeWorkerContract, NullMergerRejected) {
  EXPECT_THROW(MergeWorker(nullptr, 1, 1000), std::invalid_argument);
}

TEST(MergeWorkerContract, SuccessReportsSegmentsAndProgress) {
  auto merger = std::make_shared<StubVideoMerger>();
  MergeWorker worker(merger, 1, 0);
  OutcomeRecorder recorder;
  std::mutex progress_mutex;
  std::vector<int32_t> progress;

  worker.Submit(MakeJob("g1"), std::make_shared<CancellationToken>(), recorder.Callback(),
                [&](const std::string&, int32_t percent) {
                  std::lock_guard<std::mutex> lock(progress_mutex);
                  progress.push_back(percent);
                });
  ASSERT_TRUE(recorder.WaitFor(1, kWait));

  auto outcome = recorder.Outcomes()[0];
  ASSERT_EQ(outcome.kind, MergeOutcome::Kind::kSucceeded);
  ASSERT_EQ(outcome.result.segments.size(), 3u);
  EXPECT_EQ(outcome.result.segments[1].start_offset_ms, 10000);
  EXPECT_EQ(outcome.result.segments[1].end_offset_ms, 22000);
  EXPECT_EQ(outcome.result.total_duration_ms, 31000);
  EXPECT_EQ(worker.RunCount(), 1u);

  std::lock_guard<std::mutex> lock(progress_mutex);
  EXPECT_EQ(progress, (std::vector<int32_t>{50, 100}));
}

TEST(MergeWorkerContract, JobsRunInSubmissionOrderOnSingleThread) {
  auto merger = std::make_shared<StubVideoMerger>();
  MergeWorker worker(merger, 1, 0);
  OutcomeRecorder recorder;
  for (const char* id : {"a", "b", "c"}) {
    worker.Submit(MakeJob(id), nullptr, recorder.Callback());
  }
  ASSERT_TRUE(recorder.WaitFor(3, kWait));
  EXPECT_EQ(recorder.GroupIds(), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(worker.WaitIdle(kWait));
  EXPECT_EQ(worker.PendingCount(), 0u);
}

TEST(MergeWorkerContract, FailureMessageIsSanitized) {
  auto merger = std::make_shared<StubVideoMerger>();
  merger->SetMode(StubVideoMerger::Mode::kFail);
  merger->SetFailure("SOURCE_OPEN_FAILED",
                     "cannot open /var/lib/triptych/ingest/sources/abc for reading\nstack: frame 1");
  MergeWorker worker(merger, 1, 0);
  OutcomeRecorder recorder;

  worker.Submit(MakeJob("g1"), nullptr, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(1, kWait));
  auto outcome = recorder.Outcomes()[0];
  ASSERT_EQ(outcome.kind, MergeOutcome::Kind::kFailed);
  EXPECT_EQ(outcome.error_code, "SOURCE_OPEN_FAILED");
  EXPECT_EQ(outcome.error_message, "cannot open <path> for reading");
}

TEST(MergeWorkerContract, MissingFailureCodeBecomesInternalError) {
  auto merger = std::make_shared<StubVideoMerger>();
  merger->SetMode(StubVideoMerger::Mode::kFail);
  merger->SetFailure("", "");
  MergeWorker worker(merger, 1, 0);
  OutcomeRecorder recorder;

  worker.Submit(MakeJob("g1"), nullptr, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(1, kWait));
  auto outcome = recorder.Outcomes()[0];
  EXPECT_EQ(outcome.error_code, kMergeInternalErrorCode);
  EXPECT_EQ(outcome.error_message, "merge failed");
}

TEST(MergeWorkerContract, ExceptionBecomesInternalErrorWithoutDetails) {
  auto merger = std::make_shared<StubVideoMerger>();
  merger->SetMode(StubVideoMerger::Mode::kThrow);
  MergeWorker worker(merger, 1, 0);
  OutcomeRecorder recorder;

  worker.Submit(MakeJob("g1"), nullptr, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(1, kWait));
  auto outcome = recorder.Outcomes()[0];
  ASSERT_EQ(outcome.kind, MergeOutcome::Kind::kFailed);
  EXPECT_EQ(outcome.error_code, kMergeInternalErrorCode);
  EXPECT_EQ(outcome.error_message.find("/srv"), std::string::npos);

  // The worker thread survives and serves the next job.
  merger->SetMode(StubVideoMerger::Mode::kSucceed);
  worker.Submit(MakeJob("g2"), nullptr, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(2, kWait));
  EXPECT_EQ(recorder.Outcomes()[1].kind, MergeOutcome::Kind::kSucceeded);
}

TEST(MergeWorkerContract, NonStandardThrowBecomesInternalError) {
  auto merger = std::make_shared<StubVideoMerger>();
  merger->SetMode(StubVideoMerger::Mode::kThrowInt);
  LogCapture log;
  MergeWorker worker(merger, 1, 1000);
  OutcomeRecorder recorder;

  worker.Submit(MakeJob("g1"), nullptr, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(1, kWait));
  auto outcome = recorder.Outcomes()[0];
  ASSERT_EQ(outcome.kind, MergeOutcome::Kind::kFailed);
  EXPECT_EQ(outcome.error_code, kMergeInternalErrorCode);
  EXPECT_EQ(outcome.error_message, "internal merge error");
  auto threw = log.Find(Logger::Level::kError, "MERGER_THREW group=g1");
  ASSERT_EQ(threw.size(), 1u);
  EXPECT_EQ(threw[0].find("what="), std::string::npos) << threw[0];

  merger->SetMode(StubVideoMerger::Mode::kSucceed);
  worker.Submit(MakeJob("g2"), nullptr, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(2, kWait));
  EXPECT_EQ(recorder.Outcomes()[1].kind, MergeOutcome::Kind::kSucceeded);
}

TEST(MergeWorkerContract, MalformedResultBecomesInternalError) {
  auto merger = std::make_shared<StubVideoMerger>();
  merger->SetResultEditor([](MergeResult& result) { result.segments.pop_back(); });
  MergeWorker worker(merger, 1, 0);
  OutcomeRecorder recorder;

  worker.Submit(MakeJob("g1"), nullptr, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(1, kWait));
  auto outcome = recorder.Outcomes()[0];
  ASSERT_EQ(outcome.kind, MergeOutcome::Kind::kFailed);
  EXPECT_EQ(outcome.error_code, kMergeInternalErrorCode);
  EXPECT_EQ(outcome.error_message, "invalid merge result");
}

TEST(MergeWorkerContract, CooperativeTimeout) {
  auto merger = std::make_shared<StubVideoMerger>();
  merger->SetMode(StubVideoMerger::Mode::kBlock);
  MergeWorker worker(merger, 1, 50);
  OutcomeRecorder recorder;

  worker.Submit(MakeJob("g1"), nullptr, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(1, kWait));
  auto outcome = recorder.Outcomes()[0];
  ASSERT_EQ(outcome.kind, MergeOutcome::Kind::kFailed);
  EXPECT_EQ(outcome.error_code, kMergeTimeoutCode);
}

TEST(MergeWorkerContract, LateSuccessPastDeadlineIsTimeout) {
  auto merger = std::make_shared<StubVideoMerger>();
  merger->SetMode(StubVideoMerger::Mode::kSlowIgnoringAbort);
  merger->SetHoldMs(120);
  MergeWorker worker(merger, 1, 30);
  OutcomeRecorder recorder;

  worker.Submit(MakeJob("g1"), nullptr, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(1, kWait));
  EXPECT_EQ(recorder.Outcomes()[0].error_code, kMergeTimeoutCode);
}

TEST(MergeWorkerContract, DeadlineIsReportedWhileMergerIsStillRunning) {
  auto merger = std::make_shared<StubVideoMerger>();
  merger->SetMode(StubVideoMerger::Mode::kSlowIgnoringAbort);
  merger->SetHoldMs(800);
  LogCapture log;
  MergeWorker worker(merger, 1, 50);
  OutcomeRecorder recorder;

  const auto submitted = std::chrono::steady_clock::now();
  worker.Submit(MakeJob("g1"), nullptr, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(1, std::chrono::milliseconds(400)));
  EXPECT_LT(std::chrono::steady_clock::now() - submitted, std::chrono::milliseconds(800));
  EXPECT_EQ(merger->FinishedCount(), 0);
  auto outcome = recorder.Outcomes()[0];
  ASSERT_EQ(outcome.kind, MergeOutcome::Kind::kFailed);
  EXPECT_EQ(outcome.error_code, kMergeTimeoutCode);

  // The late success is dropped; the job still reports exactly once.
  ASSERT_TRUE(worker.WaitIdle(kWait));
  EXPECT_EQ(merger->FinishedCount(), 1);
  EXPECT_EQ(recorder.Outcomes().size(), 1u);
  EXPECT_EQ(log.Find(Logger::Level::kWarn, "MERGE_DEADLINE_PASSED group=g1").size(), 1u);
  EXPECT_EQ(log.Find(Logger::Level::kInfo, "LATE_RESULT_DISCARDED group=g1").size(), 1u);
}

TEST(MergeWorkerContract, TokenCancelledBeforeRunSkipsMerger) {
  auto merger = std::make_shared<StubVideoMerger>();
  MergeWorker worker(merger, 1, 0);
  OutcomeRecorder recorder;
  auto token = std::make_shared<CancellationToken>();
  token->Cancel();

  worker.Submit(MakeJob("g1"), token, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(1, kWait));
  EXPECT_EQ(recorder.Outcomes()[0].kind, MergeOutcome::Kind::kCancelled);
  EXPECT_EQ(merger->RunCount(), 0);
  EXPECT_EQ(worker.RunCount(), 0u);
}

TEST(MergeWorkerContract, TokenCancelledDuringRunIsCancelled) {
  auto merger = std::make_shared<StubVideoMerger>();
  merger->SetMode(StubVideoMerger::Mode::kBlock);
  MergeWorker worker(merger, 1, 0);
  OutcomeRecorder recorder;
  auto token = std::make_shared<CancellationToken>();

  worker.Submit(MakeJob("g1"), token, recorder.Callback());
  ASSERT_TRUE(merger->WaitStarted(kWait));
  token->Cancel();
  ASSERT_TRUE(recorder.WaitFor(1, kWait));
  EXPECT_EQ(recorder.Outcomes()[0].kind, MergeOutcome::Kind::kCancelled);
}

TEST(MergeWorkerContract, DelayHookRunsBeforeMerger) {
  auto merger = std::make_shared<StubVideoMerger>();
  MergeWorker worker(merger, 1, 0);
  OutcomeRecorder recorder;
  int runs_seen_by_hook = -1;
  worker.SetDelayHook([&] { runs_seen_by_hook = merger->RunCount(); });

  worker.Submit(MakeJob("g1"), nullptr, recorder.Callback());
  ASSERT_TRUE(recorder.WaitFor(1, kWait));
  EXPECT_EQ(runs_seen_by_hook, 0);
  EXPECT_EQ(merger->RunCount(), 1);
}

TEST(MergeWorkerContract, ShutdownDropsQueuedAndCancelsRunning) {
  auto merger = std::make_shared<StubVideoMerger>();
  merger->SetMode(StubVideoMerger::Mode::kBlock);
  auto worker = std::make_unique<MergeWorker>(merger, 1, 0);
  OutcomeRecorder recorder;

  worker->Submit(MakeJob("running"), nullptr, recorder.Callback());
  ASSERT_TRUE(merger->WaitStarted(kWait));
  worker->Submit(MakeJob("queued"), nullptr, recorder.Callback());
  EXPECT_EQ(worker->PendingCount(), 1u);

  worker->Shutdown();
  worker->Shutdown();
  auto outcomes = recorder.Outcomes();
  ASSERT_EQ(outcomes.size(), 1u);
  EXPECT_EQ(recorder.GroupIds()[0], "running");
  EXPECT_EQ(outcomes[0].kind, MergeOutcome::Kind::kCancelled);
  EXPECT_EQ(merger->RunCount(), 1);

  worker->Submit(MakeJob("late"), nullptr, recorder.Callback());
  EXPECT_EQ(worker->PendingCount(), 0u);
}

TEST(MergeTypesContract, SanitizeCapsLengthAndKeepsFirstLine) {
  const std::string long_line(500, 'x');
  EXPECT_LE(SanitizeMergeMessage(long_line).size(), 200u);
  EXPECT_EQ(SanitizeMergeMessage("first line\nsecond line"), "first line");
  EXPECT_EQ(SanitizeMergeMessage("bad C:\\media\\a.mp4 input"), "bad <path> input");
  EXPECT_EQ(SanitizeMergeMessage("   "), "merge failed");
}

TEST(MergeTypesContract, CheckMergeResultRejectsMalformedTiming) {
  const MergeJob job = MakeJob("g1");
  MergeResult good;
  good.output_locator = "stub://merged/g1.mp4";
  good.total_duration_ms = 31000;
  good.segments = {{0, 0, 10000}, {1, 10000, 22000}, {2, 22000, 31000}};
  EXPECT_EQ(CheckMergeResult(job, good), "");

  MergeResult shuffled = good;
  std::swap(shuffled.segments[0], shuffled.segments[2]);
  EXPECT_EQ(CheckMergeResult(job, shuffled), "");

  MergeResult no_locator = good;
  no_locator.output_locator.clear();
  EXPECT_NE(CheckMergeResult(job, no_locator), "");

  MergeResult two = good;
  two.segments.pop_back();
  EXPECT_NE(CheckMergeResult(job, two), "");

  MergeResult duplicate = good;
  duplicate.segments[2].statement_index = 1;
  EXPECT_NE(CheckMergeResult(job, duplicate), "");

  MergeResult out_of_range = good;
  out_of_range.segments[2].statement_index = 7;
  EXPECT_NE(CheckMergeResult(job, out_of_range), "");

  MergeResult overlapping = good;
  overlapping.segments[1].start_offset_ms = 9000;
  EXPECT_NE(CheckMergeResult(job, overlapping), "");

  MergeResult empty_span = good;
  empty_span.segments[2].end_offset_ms = 22000;
  EXPECT_NE(CheckMergeResult(job, empty_span), "");
}

TEST(MergeTypesContract, GroupRecordRoundTripsThroughJsonLine) {
  MergeGroupRecord rec;
  rec.group_id = "g1";
  rec.owner_id = "user \"quoted\"";
  rec.slots[0] = {"s0", true};
  rec.slots[1] = {"s1", false};
  rec.slots[2] = {"s2", true};
  rec.status = GroupStatus::kCompleted;
  rec.merge_triggered = true;
  rec.merge_progress_percent = 100;
  rec.has_result = true;
  rec.result.output_locator = "/tmp/out/g1.mp4";
  rec.result.total_duration_ms = 31000;
  rec.result.segments = {{0, 0, 10000}, {1, 10000, 22000}, {2, 22000, 31000}};
  rec.created_utc_ms = 1;
  rec.updated_utc_ms = 2;

  MergeGroupRecord back;
  ASSERT_TRUE(MergeGroupRecord::FromJsonLine(rec.ToJsonLine(), back));
  EXPECT_EQ(back.owner_id, rec.owner_id);
  EXPECT_EQ(back.slots[1].session_id, "s1");
  EXPECT_FALSE(back.slots[1].ready);
  EXPECT_TRUE(back.slots[2].ready);
  EXPECT_EQ(back.status, GroupStatus::kCompleted);
  EXPECT_TRUE(back.merge_triggered);
  ASSERT_EQ(back.result.segments.size(), 3u);
  EXPECT_EQ(back.result.segments[2].start_offset_ms, 22000);
  EXPECT_EQ(back.result.output_locator, "/tmp/out/g1.mp4");

  EXPECT_FALSE(MergeGroupRecord::FromJsonLine("{\"group_id\":\"g1\"", back));
}

}  // namespace
}  // namespace triptych::merge
