// Repository: Triptych-ingest
// Component: Upload event journal unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "events/EventSpool.hpp"
#include "triptych/events/EventEmitter.hpp"
#include "support/DeterministicTimeSource.hpp"

namespace triptych::events {
namespace {

namespace fs = std::filesystem;

std::string MakeTempJournalDir(const std::string& name) {
  fs::path dir = fs::temp_directory_path() /
                 ("triptych_journal_test_" + std::to_string(getpid()) + "_" + name);
  fs::remove_all(dir);
  return dir.string();
}

UploadEvent MakeEvent(uint64_t sequence, const std::string& owner = "user-1") {
  UploadEvent event;
  event.sequence = sequence;
  event.type = UploadEventType::kSessionCompleted;
  event.owner_id = owner;
  event.group_id = "g1";
  event.session_id = "s" + std::to_string(sequence);
  event.statement_index = static_cast<int32_t>(sequence % 3);
  event.emitted_utc_ms = 1760000000000 + static_cast<int64_t>(sequence);
  event.detail = "sha256=\"quoted\"";
  return event;
}

// -----------------------------------------------------------------------------
// Append 5 events, reopen, ReplayFrom(3) returns seq 4 and 5
// -----------------------------------------------------------------------------
TEST(EventSpoolTest, AppendAndReplayFromAfterRestart) {
  const std::string dir = MakeTempJournalDir("replay");
  {
    EventSpool spool(dir);
    for (uint64_t seq = 1; seq <= 5; ++seq) spool.Append(MakeEvent(seq));
    ASSERT_TRUE(spool.Flush(std::chrono::milliseconds(2000)));
  }

  EventSpool reopened(dir);
  EXPECT_EQ(reopened.LastSequence(), 5u);
  auto replayed = reopened.ReplayFrom(3);
  ASSERT_EQ(replayed.size(), 2u);
  EXPECT_EQ(replayed[0].sequence, 4u);
  EXPECT_EQ(replayed[1].sequence, 5u);
  EXPECT_EQ(replayed[1].session_id, "s5");
  EXPECT_EQ(replayed[1].detail, "sha256=\"quoted\"");
  EXPECT_EQ(replayed[1].type, UploadEventType::kSessionCompleted);
  fs::remove_all(dir);
}

// -----------------------------------------------------------------------------
// Truncated final line (crash mid-write) is skipped, prior records intact
// -----------------------------------------------------------------------------
TEST(EventSpoolTest, TruncatedTailIgnored) {
  const std::string dir = MakeTempJournalDir("corrupt");
  std::string path;
  {
    EventSpool spool(dir);
    path = spool.JournalPath();
    spool.Append(MakeEvent(1));
    spool.Append(MakeEvent(2));
    ASSERT_TRUE(spool.Flush(std::chrono::milliseconds(2000)));
  }
  {
    std::ofstream append(path, std::ios::app);
    append << "{\"sequence\":3,\"type\":\"SESSION_COMP";
  }

  EventSpool reopened(dir);
  auto replayed = reopened.ReplayFrom(0);
  ASSERT_EQ(replayed.size(), 2u);
  EXPECT_EQ(replayed[1].sequence, 2u);
  EXPECT_EQ(reopened.LastSequence(), 2u);
  fs::remove_all(dir);
}

TEST(EventSpoolTest, SequenceGapThrows) {
  const std::string dir = MakeTempJournalDir("gap");
  EventSpool spool(dir);
  spool.Append(MakeEvent(1));
  EXPECT_THROW(spool.Append(MakeEvent(3)), std::runtime_error);
  fs::remove_all(dir);
}

// -----------------------------------------------------------------------------
// Emitter sequences continue from the journal after a restart
// -----------------------------------------------------------------------------
TEST(EventSpoolTest, EmitterResumesAfterJournalSequence) {
  const std::string dir = MakeTempJournalDir("resume");
  auto clock = std::make_shared<tests::DeterministicTimeSource>();
  {
    auto spool = std::make_shared<EventSpool>(dir);
    EventEmitter emitter(clock, spool->LastSequence());
    emitter.AddSink(spool);
    emitter.Emit(UploadEventType::kGroupCreated, "user-1", "g1", "");
    emitter.Emit(UploadEventType::kSessionCreated, "user-1", "g1", "s1", 0);
    ASSERT_TRUE(spool->Flush(std::chrono::milliseconds(2000)));
  }

  auto spool = std::make_shared<EventSpool>(dir);
  EventEmitter emitter(clock, spool->LastSequence());
  emitter.AddSink(spool);
  emitter.Emit(UploadEventType::kMergeTriggered, "user-1", "g1", "");
  ASSERT_TRUE(spool->Flush(std::chrono::milliseconds(2000)));

  auto all = spool->ReplayFrom(0);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[2].sequence, 3u);
  EXPECT_EQ(all[2].type, UploadEventType::kMergeTriggered);
  fs::remove_all(dir);
}

}  // namespace
}  // namespace triptych::events
