// Repository: Triptych-ingest
// Component: Merge Group Cancellation Contract Tests
// Purpose: Member cancellation and slot replacement, whole-group
//          cancellation (including mid-merge), and retention sweeps.
// Copyright (c) 2026 Triptych

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "fixtures/GroupUploadHarness.h"
#include "triptych/merge/MergeGroupOrchestrator.hpp"

namespace triptych::merge {
namespace {

using events::UploadEventType;
using tests::fixtures::Declare;
using tests::fixtures::GroupUploadHarness;
using tests::fixtures::MakeContent;
using tests::fixtures::StubVideoMerger;
using upload::SessionStatus;
using upload::UploadError;

constexpr auto kSettleTimeout = std::chrono::milliseconds(5000);
constexpr int64_t kVideoSize = 200000;  // 4 chunks of 64 KiB

class MergeGroupCancellationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (uint32_t i = 0; i < 3; ++i) contents_.push_back(MakeContent(kVideoSize, i + 10));
    InitiateFresh();
  }

  void InitiateFresh() {
    std::vector<upload::VideoDeclaration> videos = {
        Declare(kVideoSize, 10000), Declare(kVideoSize, 12000), Declare(kVideoSize, 9000)};
    group_ = h_.groups->Initiate("user-1", videos);
    ASSERT_TRUE(group_.ok) << group_.detail;
  }

  const std::string& Sid(size_t index) const { return group_.slots[index].session_id; }

  upload::CompleteResult CompleteSlot(size_t index) {
    return h_.UploadAndComplete(Sid(index), contents_[index], "user-1");
  }

  SessionStatus StatusOf(const std::string& session_id) const {
    auto snap = h_.sessions->Snapshot(session_id);
    EXPECT_TRUE(snap.has_value());
    return snap ? snap->record.status : SessionStatus::kPending;
  }

  GroupStatus GroupStatusNow() const {
    return h_.groups->Status(group_.group_id, "user-1").view.record.status;
  }

  std::string CreateStandalone(const std::string& owner = "user-1",
                               int64_t duration_ms = 12000) {
    auto created = h_.sessions->Create(owner, Declare(kVideoSize, duration_ms));
    EXPECT_TRUE(created.ok) << created.detail;
    return created.session_id;
  }

  GroupUploadHarness h_;
  std::vector<storage::Bytes> contents_;
  InitiateGroupResult group_;
};

// =============================================================================
// Partial cancel and ReplaceSlot
// =============================================================================

TEST_F(MergeGroupCancellationTest, CancelledMemberBlocksSlotButGroupKeepsWaiting) {
  ASSERT_TRUE(CompleteSlot(0).ok);
  ASSERT_TRUE(CompleteSlot(2).ok);

  auto cancelled = h_.groups->CancelMember(Sid(1), "user-1");
  ASSERT_TRUE(cancelled.ok) << cancelled.detail;
  EXPECT_FALSE(cancelled.already_terminal);
  EXPECT_EQ(StatusOf(Sid(1)), SessionStatus::kCancelled);

  auto status = h_.groups->Status(group_.group_id, "user-1");
  ASSERT_TRUE(status.ok);
  EXPECT_EQ(status.view.record.status, GroupStatus::kAwaitingUploads);
  EXPECT_TRUE(status.view.slots[0].ready);
  EXPECT_FALSE(status.view.slots[1].ready);
  EXPECT_TRUE(status.view.slots[1].blocked);
  EXPECT_TRUE(status.view.slots[2].ready);

  // Completed siblings are untouched and nothing was merged.
  EXPECT_EQ(StatusOf(Sid(0)), SessionStatus::kCompleted);
  EXPECT_EQ(h_.merger->RunCount(), 0);

  auto late = h_.sessions->Complete(Sid(1), std::nullopt, "user-1");
  EXPECT_FALSE(late.ok);
  EXPECT_EQ(late.error, UploadError::kInvalidState);
  EXPECT_EQ(h_.sessions->PutChunk(Sid(1), 0, storage::ToBytes("x"), "user-1").error,
            UploadError::kInvalidState);
}

TEST_F(MergeGroupCancellationTest, CancelMemberOnTerminalSessionIsNoOp) {
  ASSERT_TRUE(CompleteSlot(0).ok);
  auto result = h_.groups->CancelMember(Sid(0), "user-1");
  EXPECT_TRUE(result.ok);
  EXPECT_TRUE(result.already_terminal);
  EXPECT_EQ(StatusOf(Sid(0)), SessionStatus::kCompleted);
  EXPECT_TRUE(h_.groups->Status(group_.group_id, "user-1").view.slots[0].ready);

  EXPECT_EQ(h_.groups->CancelMember(Sid(1), "user-2").error, UploadError::kAccessDenied);
  EXPECT_EQ(h_.groups->CancelMember("no-such-session", "user-1").error, UploadError::kNotFound);
}

TEST_F(MergeGroupCancellationTest, ReplacementUploadCompletesTheGroup) {
  ASSERT_TRUE(CompleteSlot(0).ok);
  ASSERT_TRUE(CompleteSlot(2).ok);
  ASSERT_TRUE(h_.groups->CancelMember(Sid(1), "user-1").ok);
  const std::string old_session = Sid(1);

  const std::string replacement = CreateStandalone();
  auto replaced = h_.groups->ReplaceSlot(group_.group_id, 1, replacement, "user-1");
  ASSERT_TRUE(replaced.ok) << replaced.detail;
  EXPECT_EQ(replaced.replaced_session_id, old_session);
  EXPECT_FALSE(replaced.slot_ready);
  EXPECT_FALSE(replaced.merge_triggered);

  auto old_snap = h_.sessions->Snapshot(old_session);
  ASSERT_TRUE(old_snap.has_value());
  EXPECT_TRUE(old_snap->record.group_id.empty());
  auto new_snap = h_.sessions->Snapshot(replacement);
  ASSERT_TRUE(new_snap.has_value());
  EXPECT_EQ(new_snap->record.group_id, group_.group_id);
  EXPECT_EQ(new_snap->record.statement_index, 1);

  auto events = h_.sink->Events();
  bool saw_replace = false;
  for (const auto& e : events) {
    if (e.type != UploadEventType::kSlotReplaced) continue;
    saw_replace = true;
    EXPECT_EQ(e.session_id, replacement);
    EXPECT_EQ(e.statement_index, 1);
    EXPECT_EQ(e.detail, "replaced=" + old_session);
  }
  EXPECT_TRUE(saw_replace);

  // A completion from the displaced session no longer counts.
  EXPECT_FALSE(h_.groups->OnSessionCompleted(group_.group_id, old_session));

  auto done = h_.UploadAndComplete(replacement, contents_[1], "user-1");
  ASSERT_TRUE(done.ok) << done.detail;
  EXPECT_TRUE(done.merge_triggered);
  ASSERT_TRUE(h_.groups->WaitForMergeSettled(group_.group_id, kSettleTimeout));
  EXPECT_EQ(GroupStatusNow(), GroupStatus::kCompleted);

  auto jobs = h_.merger->Jobs();
  ASSERT_EQ(jobs.size(), 1u);
  ASSERT_EQ(jobs[0].sources.size(), 3u);
  EXPECT_EQ(jobs[0].sources[1].session_id, replacement);
}

TEST_F(MergeGroupCancellationTest, ReplacingWithCompletedSessionTriggersImmediately) {
  ASSERT_TRUE(CompleteSlot(0).ok);
  ASSERT_TRUE(CompleteSlot(1).ok);
  ASSERT_TRUE(h_.groups->CancelMember(Sid(2), "user-1").ok);

  const std::string replacement = CreateStandalone("user-1", 9000);
  ASSERT_TRUE(h_.UploadAndComplete(replacement, contents_[2], "user-1").ok);
  EXPECT_EQ(h_.merger->RunCount(), 0);

  auto replaced = h_.groups->ReplaceSlot(group_.group_id, 2, replacement, "user-1");
  ASSERT_TRUE(replaced.ok) << replaced.detail;
  EXPECT_TRUE(replaced.slot_ready);
  EXPECT_TRUE(replaced.merge_triggered);
  ASSERT_TRUE(h_.groups->WaitForMergeSettled(group_.group_id, kSettleTimeout));
  EXPECT_EQ(GroupStatusNow(), GroupStatus::kCompleted);
  EXPECT_EQ(h_.merger->RunCount(), 1);
}

TEST_F(MergeGroupCancellationTest, ReplaceSlotRejections) {
  ASSERT_TRUE(CompleteSlot(0).ok);
  ASSERT_TRUE(h_.groups->CancelMember(Sid(1), "user-1").ok);
  const std::string replacement = CreateStandalone();

  EXPECT_EQ(h_.groups->ReplaceSlot("no-such-group", 1, replacement, "user-1").error,
            UploadError::kNotFound);
  EXPECT_EQ(h_.groups->ReplaceSlot(group_.group_id, 1, replacement, "user-2").error,
            UploadError::kAccessDenied);
  EXPECT_EQ(h_.groups->ReplaceSlot(group_.group_id, 3, replacement, "user-1").error,
            UploadError::kIndexOutOfRange);
  EXPECT_EQ(h_.groups->ReplaceSlot(group_.group_id, -1, replacement, "user-1").error,
            UploadError::kIndexOutOfRange);
  EXPECT_EQ(h_.groups->ReplaceSlot(group_.group_id, 1, Sid(1), "user-1").error,
            UploadError::kInvalidState);

  // Completed and pending members are not replaceable.
  EXPECT_EQ(h_.groups->ReplaceSlot(group_.group_id, 0, replacement, "user-1").error,
            UploadError::kInvalidState);
  EXPECT_EQ(h_.groups->ReplaceSlot(group_.group_id, 2, replacement, "user-1").error,
            UploadError::kInvalidState);

  // The replacement must be usable and belong to the caller.
  const std::string foreign = CreateStandalone("user-2");
  EXPECT_EQ(h_.groups->ReplaceSlot(group_.group_id, 1, foreign, "user-1").error,
            UploadError::kAccessDenied);
  const std::string dead = CreateStandalone();
  ASSERT_TRUE(h_.sessions->Cancel(dead, "user-1").ok);
  EXPECT_EQ(h_.groups->ReplaceSlot(group_.group_id, 1, dead, "user-1").error,
            UploadError::kInvalidState);
  EXPECT_EQ(h_.groups->ReplaceSlot(group_.group_id, 1, "no-such-session", "user-1").error,
            UploadError::kNotFound);

  // A member of another group cannot be moved.
  std::vector<upload::VideoDeclaration> videos = {
      Declare(kVideoSize, 10000), Declare(kVideoSize, 12000), Declare(kVideoSize, 9000)};
  auto other = h_.groups->Initiate("user-1", videos);
  ASSERT_TRUE(other.ok) << other.detail;
  EXPECT_EQ(h_.groups->ReplaceSlot(group_.group_id, 1, other.slots[0].session_id, "user-1").error,
            UploadError::kInvalidState);

  // None of the rejections touched the slot.
  auto status = h_.groups->Status(group_.group_id, "user-1");
  EXPECT_EQ(status.view.slots[1].session_id, Sid(1));
  EXPECT_EQ(h_.sink->Count(UploadEventType::kSlotReplaced), 0u);

  ASSERT_TRUE(h_.groups->ReplaceSlot(group_.group_id, 1, replacement, "user-1").ok);
}

// =============================================================================
// Group cancel
// =============================================================================

TEST_F(MergeGroupCancellationTest, GroupCancelResetsEveryMember) {
  ASSERT_TRUE(CompleteSlot(0).ok);
  ASSERT_TRUE(CompleteSlot(1).ok);

  auto result = h_.groups->Cancel(group_.group_id, "user-1");
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_FALSE(result.already_cancelled);
  ASSERT_EQ(result.members.size(), 3u);
  EXPECT_EQ(result.members[0].outcome, "force_reset");
  EXPECT_EQ(result.members[1].outcome, "force_reset");
  EXPECT_EQ(result.members[2].outcome, "cancelled");
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(result.members[i].statement_index, static_cast<int32_t>(i));
    EXPECT_EQ(result.members[i].session_id, Sid(i));
    EXPECT_EQ(StatusOf(Sid(i)), SessionStatus::kCancelled);
    EXPECT_TRUE(h_.sessions->SourceLocator(Sid(i)).empty());
  }
  EXPECT_EQ(GroupStatusNow(), GroupStatus::kCancelled);

  // The last member can no longer complete, so the group never merges.
  ASSERT_FALSE(h_.UploadAll(Sid(2), contents_[2], "user-1"));
  auto late = h_.sessions->Complete(Sid(2), std::nullopt, "user-1");
  EXPECT_EQ(late.error, UploadError::kInvalidState);
  EXPECT_FALSE(h_.groups->OnSessionCompleted(group_.group_id, Sid(0)));
  EXPECT_EQ(h_.merger->RunCount(), 0);

  auto events = h_.sink->Events();
  size_t group_cancelled = 0;
  for (const auto& e : events) {
    if (e.type == UploadEventType::kGroupCancelled) {
      ++group_cancelled;
      EXPECT_EQ(e.detail, "from=awaiting_uploads");
    }
  }
  EXPECT_EQ(group_cancelled, 1u);
  EXPECT_EQ(h_.sink->Count(UploadEventType::kSessionCancelled), 3u);
}

TEST_F(MergeGroupCancellationTest, SecondCancelReportsAlreadyCancelled) {
  ASSERT_TRUE(h_.groups->CancelMember(Sid(0), "user-1").ok);
  auto first = h_.groups->Cancel(group_.group_id, "user-1");
  ASSERT_TRUE(first.ok);
  EXPECT_EQ(first.members[0].outcome, "already_terminal");

  auto second = h_.groups->Cancel(group_.group_id, "user-1");
  EXPECT_TRUE(second.ok);
  EXPECT_TRUE(second.already_cancelled);
  EXPECT_TRUE(second.members.empty());
  EXPECT_EQ(h_.sink->Count(UploadEventType::kGroupCancelled), 1u);

  EXPECT_EQ(h_.groups->ReplaceSlot(group_.group_id, 0, CreateStandalone(), "user-1").error,
            UploadError::kInvalidState);
}

TEST_F(MergeGroupCancellationTest, CancelChecksOwnerAndExistence) {
  EXPECT_EQ(h_.groups->Cancel(group_.group_id, "user-2").error, UploadError::kAccessDenied);
  EXPECT_EQ(h_.groups->Cancel("no-such-group", "user-1").error, UploadError::kNotFound);
  EXPECT_EQ(GroupStatusNow(), GroupStatus::kAwaitingUploads);
}

TEST_F(MergeGroupCancellationTest, CancelDuringMergeDiscardsTheOutcome) {
  h_.merger->SetMode(StubVideoMerger::Mode::kBlock);
  for (size_t i = 0; i < 3; ++i) ASSERT_TRUE(CompleteSlot(i).ok);
  ASSERT_TRUE(h_.merger->WaitStarted(kSettleTimeout));
  ASSERT_EQ(GroupStatusNow(), GroupStatus::kMerging);

  auto result = h_.groups->Cancel(group_.group_id, "user-1");
  ASSERT_TRUE(result.ok) << result.detail;
  for (const auto& member : result.members) EXPECT_EQ(member.outcome, "force_reset");
  EXPECT_TRUE(h_.groups->WaitForMergeSettled(group_.group_id, std::chrono::milliseconds(10)));

  // Joining the workers guarantees the aborted run has reported back.
  h_.Teardown();
  EXPECT_EQ(h_.merger->RunCount(), 1);
  EXPECT_EQ(h_.sink->Count(UploadEventType::kMergeCompleted), 0u);
  EXPECT_EQ(h_.sink->Count(UploadEventType::kMergeFailed), 0u);

  MergeGroupRecord rec;
  auto bytes = h_.store->Get(MergeGroupOrchestrator::RecordKey(group_.group_id));
  ASSERT_TRUE(bytes.has_value());
  ASSERT_TRUE(MergeGroupRecord::FromJsonLine(storage::ToString(*bytes), rec));
  EXPECT_EQ(rec.status, GroupStatus::kCancelled);
  EXPECT_FALSE(rec.has_result);
}

TEST_F(MergeGroupCancellationTest, FinishedGroupsCannotBeCancelled) {
  for (size_t i = 0; i < 3; ++i) ASSERT_TRUE(CompleteSlot(i).ok);
  ASSERT_TRUE(h_.groups->WaitForMergeSettled(group_.group_id, kSettleTimeout));
  ASSERT_EQ(GroupStatusNow(), GroupStatus::kCompleted);

  auto completed = h_.groups->Cancel(group_.group_id, "user-1");
  EXPECT_FALSE(completed.ok);
  EXPECT_EQ(completed.error, UploadError::kInvalidState);
  EXPECT_EQ(StatusOf(Sid(0)), SessionStatus::kCompleted);

  h_.merger->SetMode(StubVideoMerger::Mode::kFail);
  InitiateFresh();
  for (size_t i = 0; i < 3; ++i) ASSERT_TRUE(CompleteSlot(i).ok);
  ASSERT_TRUE(h_.groups->WaitForMergeSettled(group_.group_id, kSettleTimeout));
  ASSERT_EQ(GroupStatusNow(), GroupStatus::kFailed);
  EXPECT_EQ(h_.groups->Cancel(group_.group_id, "user-1").error, UploadError::kInvalidState);
}

// =============================================================================
// Retention
// =============================================================================

TEST_F(MergeGroupCancellationTest, IdleGroupIsAbandonedThenCollected) {
  const int64_t retention = h_.session_policy.retention_ms;
  ASSERT_TRUE(CompleteSlot(0).ok);

  h_.clock->AdvanceMs(retention - 1000);
  EXPECT_EQ(h_.groups->CollectGarbage(), 0u);
  EXPECT_EQ(GroupStatusNow(), GroupStatus::kAwaitingUploads);

  h_.clock->AdvanceMs(2000);
  EXPECT_EQ(h_.groups->CollectGarbage(), 0u);
  auto rec = h_.groups->Status(group_.group_id, "user-1").view.record;
  EXPECT_EQ(rec.status, GroupStatus::kCancelled);
  EXPECT_EQ(rec.error_code, "GROUP_ABANDONED");
  for (size_t i = 0; i < 3; ++i) EXPECT_EQ(StatusOf(Sid(i)), SessionStatus::kCancelled);

  h_.clock->AdvanceMs(retention + 1);
  EXPECT_EQ(h_.groups->CollectGarbage(), 1u);
  EXPECT_EQ(h_.groups->GroupCount(), 0u);
  EXPECT_EQ(h_.groups->Status(group_.group_id, "user-1").error, UploadError::kNotFound);
  EXPECT_EQ(h_.sessions->SessionCount(), 0u);
  EXPECT_FALSE(h_.store->Get(MergeGroupOrchestrator::RecordKey(group_.group_id)).has_value());
}

TEST_F(MergeGroupCancellationTest, UploadActivityDefersAbandonment) {
  h_.session_policy.session_timeout_ms = h_.session_policy.retention_ms * 4;
  h_.Build();
  InitiateFresh();
  const int64_t retention = h_.session_policy.retention_ms;

  h_.clock->AdvanceMs(retention - 1000);
  storage::Bytes first(contents_[1].begin(),
                       contents_[1].begin() + tests::fixtures::kHarnessChunkSize);
  ASSERT_TRUE(h_.sessions->PutChunk(Sid(1), 0, first, "user-1").ok);

  h_.clock->AdvanceMs(2000);
  h_.groups->CollectGarbage();
  EXPECT_EQ(GroupStatusNow(), GroupStatus::kAwaitingUploads);
}

TEST_F(MergeGroupCancellationTest, CompletedGroupIsRetainedUntilWindowPasses) {
  for (size_t i = 0; i < 3; ++i) ASSERT_TRUE(CompleteSlot(i).ok);
  ASSERT_TRUE(h_.groups->WaitForMergeSettled(group_.group_id, kSettleTimeout));

  h_.clock->AdvanceMs(h_.session_policy.retention_ms);
  EXPECT_EQ(h_.groups->CollectGarbage(), 0u);
  EXPECT_EQ(GroupStatusNow(), GroupStatus::kCompleted);

  h_.clock->AdvanceMs(1);
  EXPECT_EQ(h_.groups->CollectGarbage(), 1u);
  EXPECT_EQ(h_.groups->GroupCount(), 0u);
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_FALSE(h_.sessions->Snapshot(Sid(i)).has_value());
  }
}

}  // namespace
}  // namespace triptych::merge
