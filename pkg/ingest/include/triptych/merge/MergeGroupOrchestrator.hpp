// Repository: Triptych-ingest
// Component: Merge Group Orchestrator
// Purpose: Owns the three-slot merge groups. Detects group readiness, fires
//          the merge exactly once, records the outcome, aggregates status and
//          propagates cancellation to member sessions.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_MERGE_MERGE_GROUP_ORCHESTRATOR_HPP_
#define TRIPTYCH_MERGE_MERGE_GROUP_ORCHESTRATOR_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "triptych/events/EventEmitter.hpp"
#include "triptych/merge/IVideoMerger.hpp"
#include "triptych/merge/MergeTypes.hpp"
#include "triptych/merge/MergeWorker.hpp"
#include "triptych/storage/IKeyValueStore.hpp"
#include "triptych/time/ITimeSource.hpp"
#include "triptych/upload/UploadConfig.hpp"
#include "triptych/upload/UploadSessionManager.hpp"
#include "triptych/upload/UploadTypes.hpp"

namespace triptych::merge {

using upload::UploadError;

// =============================================================================
// Operation results
// =============================================================================

struct InitiatedSlot {
  int32_t statement_index = -1;
  std::string session_id;
  int64_t chunk_size = 0;
  int64_t chunk_count = 0;
};

struct InitiateGroupResult {
  bool ok = false;
  UploadError error = UploadError::kNone;
  std::string detail;
  std::string group_id;
  std::vector<InitiatedSlot> slots;

  static InitiateGroupResult Failure(UploadError err, std::string detail = "") {
    InitiateGroupResult r;
    r.error = err;
    r.detail = std::move(detail);
    return r;
  }
};

struct SlotStatus {
  int32_t statement_index = -1;
  std::string session_id;
  upload::SessionStatus session_status = upload::SessionStatus::kPending;
  double progress_percent = 0.0;
  bool ready = false;
  // Member is cancelled or failed; the slot needs ReplaceSlot to progress.
  bool blocked = false;
};

struct GroupStatusView {
  MergeGroupRecord record;
  std::vector<SlotStatus> slots;
  double aggregate_progress_percent = 0.0;  // mean of the slot progresses
};

struct GroupStatusResult {
  bool ok = false;
  UploadError error = UploadError::kNone;
  std::string detail;
  GroupStatusView view;

  static GroupStatusResult Failure(UploadError err, std::string detail = "") {
    GroupStatusResult r;
    r.error = err;
    r.detail = std::move(detail);
    return r;
  }
};

struct MemberCancelOutcome {
  int32_t statement_index = -1;
  std::string session_id;
  std::string outcome;  // "cancelled", "force_reset", "already_terminal", "missing"
};

struct CancelGroupResult {
  bool ok = false;
  UploadError error = UploadError::kNone;
  std::string detail;
  bool already_cancelled = false;
  std::vector<MemberCancelOutcome> members;

  static CancelGroupResult Failure(UploadError err, std::string detail = "") {
    CancelGroupResult r;
    r.error = err;
    r.detail = std::move(detail);
    return r;
  }
};

struct ReplaceSlotResult {
  bool ok = false;
  UploadError error = UploadError::kNone;
  std::string detail;
  std::string replaced_session_id;
  bool slot_ready = false;
  bool merge_triggered = false;

  static ReplaceSlotResult Failure(UploadError err, std::string detail = "") {
    ReplaceSlotResult r;
    r.error = err;
    r.detail = std::move(detail);
    return r;
  }
};

// =============================================================================
// MergeGroupOrchestrator
// =============================================================================
//
// Each group has its own mutex. That mutex guards the slot readiness flags,
// the status and the trigger latch together, so the check-and-set that fires
// the merge is one critical section and unrelated groups never contend.
//
// The merge worker writes the final group state (under the group mutex)
// before its run is considered finished; Status() and WaitForMergeSettled()
// therefore never observe a stale "merging" once the outcome is known.
class MergeGroupOrchestrator {
 public:
  // Registers itself as the session manager's completion listener and owns
  // the merge worker pool.
  MergeGroupOrchestrator(std::shared_ptr<storage::IKeyValueStore> store,
                         std::shared_ptr<upload::UploadSessionManager> sessions,
                         std::shared_ptr<IVideoMerger> merger,
                         std::shared_ptr<events::EventEmitter> events,
                         std::shared_ptr<time::ITimeSource> time_source,
                         upload::MergePolicy merge_policy,
                         upload::SessionPolicy session_policy);
  ~MergeGroupOrchestrator();

  MergeGroupOrchestrator(const MergeGroupOrchestrator&) = delete;
  MergeGroupOrchestrator& operator=(const MergeGroupOrchestrator&) = delete;

  // Validates the request, then creates three sessions and the group. On any
  // failure every session created so far is erased and no group exists.
  InitiateGroupResult Initiate(const std::string& owner_id,
                               const std::vector<upload::VideoDeclaration>& videos);

  // Completion listener. Marks the slot ready and fires the merge when all
  // slots are ready. Returns true only for the call that fired it.
  bool OnSessionCompleted(const std::string& group_id, const std::string& session_id);

  GroupStatusResult Status(const std::string& group_id, const std::string& requester_id) const;

  // Blocks until the group is no longer merging. Returns false on timeout.
  bool WaitForMergeSettled(const std::string& group_id, std::chrono::milliseconds timeout) const;

  // Completed and failed groups cannot be cancelled (kInvalidState).
  CancelGroupResult Cancel(const std::string& group_id, const std::string& requester_id);

  // Cancels one member session; the group keeps waiting for a replacement.
  upload::CancelSessionResult CancelMember(const std::string& session_id,
                                           const std::string& requester_id);

  ReplaceSlotResult ReplaceSlot(const std::string& group_id,
                                int32_t statement_index,
                                const std::string& new_session_id,
                                const std::string& requester_id);

  // Cancels awaiting groups idle past retention (GROUP_ABANDONED) and erases
  // terminal groups idle past retention together with their members.
  size_t CollectGarbage();

  // Reloads group records. Call after UploadSessionManager::Restore().
  // Groups found merging are failed with MERGE_INTERRUPTED; awaiting groups
  // whose members all completed are re-triggered.
  size_t Restore();

  size_t GroupCount() const;

  MergeWorker& Worker() { return *worker_; }

  static std::string RecordKey(const std::string& group_id);

 private:
  struct GroupEntry {
    mutable std::mutex mutex;
    mutable std::condition_variable settled_cv;
    MergeGroupRecord record;
    std::shared_ptr<CancellationToken> token = std::make_shared<CancellationToken>();
    bool erased = false;
  };

  std::shared_ptr<GroupEntry> Find(const std::string& group_id) const;
  std::vector<std::shared_ptr<GroupEntry>> AllEntries() const;

  void OnMergeFinished(const std::string& group_id, const MergeOutcome& outcome);
  void OnMergeProgress(const std::string& group_id, int32_t percent);

  // Check-and-set of the trigger latch. On success *job is filled and the
  // caller submits it after releasing the group mutex.
  bool TryTriggerLocked(GroupEntry& entry, MergeJob* job);
  void SubmitJob(const std::shared_ptr<GroupEntry>& entry, MergeJob job);

  std::vector<MemberCancelOutcome> CancelMembersLocked(GroupEntry& entry);
  void PersistLocked(const GroupEntry& entry);
  void EmitLocked(events::UploadEventType type, const MergeGroupRecord& record,
                  const std::string& session_id = "", int32_t statement_index = -1,
                  const std::string& detail = "");
  int64_t LastActivityLocked(const GroupEntry& entry) const;

  std::shared_ptr<storage::IKeyValueStore> store_;
  std::shared_ptr<upload::UploadSessionManager> sessions_;
  std::shared_ptr<events::EventEmitter> events_;
  std::shared_ptr<time::ITimeSource> time_source_;
  const upload::MergePolicy merge_policy_;
  const upload::SessionPolicy session_policy_;

  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<GroupEntry>> groups_;

  std::unique_ptr<MergeWorker> worker_;
};

}  // namespace triptych::merge

#endif  // TRIPTYCH_MERGE_MERGE_GROUP_ORCHESTRATOR_HPP_
