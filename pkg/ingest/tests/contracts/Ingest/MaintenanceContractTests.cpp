// Repository: Triptych-ingest
// Component: Maintenance Loop Contract Tests
// Purpose: Sweep statistics for expiry and retention, and the periodic
//          thread lifecycle.
// Copyright (c) 2026 Triptych

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "fixtures/GroupUploadHarness.h"
#include "triptych/runtime/MaintenanceLoop.hpp"

namespace triptych::runtime {
namespace {

using events::UploadEventType;
using merge::GroupStatus;
using tests::fixtures::Declare;
using tests::fixtures::GroupUploadHarness;
using tests::fixtures::MakeContent;
using upload::SessionStatus;

constexpr int64_t kVideoSize = 100000;  // 2 chunks

class MaintenanceContractTest : public ::testing::Test {
 protected:
  std::string CreateStandalone() {
    auto created = h_.sessions->Create("user-1", Declare(kVideoSize, 5000));
    EXPECT_TRUE(created.ok) << created.detail;
    return created.session_id;
  }

  merge::InitiateGroupResult CompletedGroup() {
    std::vector<upload::VideoDeclaration> videos = {
        Declare(kVideoSize, 5000), Declare(kVideoSize, 6000), Declare(kVideoSize, 7000)};
    auto group = h_.groups->Initiate("user-1", videos);
    EXPECT_TRUE(group.ok) << group.detail;
    for (size_t i = 0; i < group.slots.size(); ++i) {
      auto done = h_.UploadAndComplete(group.slots[i].session_id,
                                       MakeContent(kVideoSize, static_cast<uint32_t>(i + 40)),
                                       "user-1");
      EXPECT_TRUE(done.ok) << done.detail;
    }
    EXPECT_TRUE(h_.groups->WaitForMergeSettled(group.group_id, std::chrono::milliseconds(5000)));
    return group;
  }

  GroupUploadHarness h_;
};

TEST_F(MaintenanceContractTest, RunOnceExpiresThenCollects) {
  MaintenanceLoop loop(h_.sessions, h_.groups, 60 * 1000);
  const std::string idle = CreateStandalone();
  auto group = CompletedGroup();

  SweepStats quiet = loop.RunOnce();
  EXPECT_EQ(quiet.sessions_expired, 0u);
  EXPECT_EQ(quiet.sessions_collected, 0u);
  EXPECT_EQ(quiet.groups_collected, 0u);

  h_.clock->AdvanceMs(h_.session_policy.session_timeout_ms + 1);
  SweepStats expired = loop.RunOnce();
  EXPECT_EQ(expired.sessions_expired, 1u);
  EXPECT_EQ(expired.groups_collected, 0u);
  auto snap = h_.sessions->Snapshot(idle);
  ASSERT_TRUE(snap.has_value());
  EXPECT_EQ(snap->record.status, SessionStatus::kCancelled);
  EXPECT_EQ(snap->record.error_detail, "SESSION_EXPIRED");
  EXPECT_EQ(h_.sink->CountFor(UploadEventType::kSessionCancelled, idle), 1u);

  // Completed group members never expire.
  EXPECT_EQ(h_.groups->Status(group.group_id, "user-1").view.record.status,
            GroupStatus::kCompleted);

  h_.clock->AdvanceMs(h_.session_policy.retention_ms + 1);
  SweepStats collected = loop.RunOnce();
  EXPECT_EQ(collected.sessions_expired, 0u);
  EXPECT_EQ(collected.sessions_collected, 1u);
  EXPECT_EQ(collected.groups_collected, 1u);
  EXPECT_EQ(h_.sessions->SessionCount(), 0u);
  EXPECT_EQ(h_.groups->GroupCount(), 0u);
  EXPECT_TRUE(h_.store->ListKeys("records/").empty());
}

TEST_F(MaintenanceContractTest, BackgroundThreadSweepsUntilStopped) {
  MaintenanceLoop loop(h_.sessions, h_.groups, 10);
  const std::string idle = CreateStandalone();
  h_.clock->AdvanceMs(h_.session_policy.session_timeout_ms + 1);

  loop.Start();
  loop.Start();  // second start is ignored
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  SessionStatus status = SessionStatus::kPending;
  while (std::chrono::steady_clock::now() < deadline) {
    auto snap = h_.sessions->Snapshot(idle);
    if (snap && snap->record.status == SessionStatus::kCancelled) {
      status = snap->record.status;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_EQ(status, SessionStatus::kCancelled);

  loop.Stop();
  loop.Stop();

  // Nothing sweeps after Stop().
  const std::string later = CreateStandalone();
  h_.clock->AdvanceMs(h_.session_policy.session_timeout_ms + 1);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  auto snap = h_.sessions->Snapshot(later);
  ASSERT_TRUE(snap.has_value());
  EXPECT_EQ(snap->record.status, SessionStatus::kPending);
}

}  // namespace
}  // namespace triptych::runtime
