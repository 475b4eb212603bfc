// Repository: Triptych-ingest
// Component: Merge Group Orchestrator Implementation
// Copyright (c) 2026 Triptych

#include "triptych/merge/MergeGroupOrchestrator.hpp"

#include <algorithm>
#include <array>
#include <sstream>

#include "triptych/util/Ids.hpp"
#include "triptych/util/Logger.hpp"
#include "triptych/validation/GroupRequestValidator.hpp"

namespace triptych::merge {

using events::UploadEventType;
using triptych::util::Logger;
using upload::SessionStatus;

namespace {

constexpr const char* kGroupAbandonedCode = "GROUP_ABANDONED";

bool IsBlocked(SessionStatus status) {
  return status == SessionStatus::kCancelled || status == SessionStatus::kFailed;
}

}  // namespace

MergeGroupOrchestrator::MergeGroupOrchestrator(
    std::shared_ptr<storage::IKeyValueStore> store,
    std::shared_ptr<upload::UploadSessionManager> sessions,
    std::shared_ptr<IVideoMerger> merger,
    std::shared_ptr<events::EventEmitter> events,
    std::shared_ptr<time::ITimeSource> time_source,
    upload::MergePolicy merge_policy,
    upload::SessionPolicy session_policy)
    : store_(std::move(store)),
      sessions_(std::move(sessions)),
      events_(std::move(events)),
      time_source_(std::move(time_source)),
      merge_policy_(merge_policy),
      session_policy_(session_policy) {
  worker_ = std::make_unique<MergeWorker>(std::move(merger), merge_policy_.worker_threads,
                                          merge_policy_.merge_timeout_ms);
  sessions_->SetCompletionListener(
      [this](const std::string& group_id, const std::string& session_id) {
        return OnSessionCompleted(group_id, session_id);
      });
}

MergeGroupOrchestrator::~MergeGroupOrchestrator() {
  sessions_->SetCompletionListener(nullptr);
  worker_->Shutdown();
}

std::string MergeGroupOrchestrator::RecordKey(const std::string& group_id) {
  return "records/groups/" + group_id;
}

std::shared_ptr<MergeGroupOrchestrator::GroupEntry> MergeGroupOrchestrator::Find(
    const std::string& group_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = groups_.find(group_id);
  if (it == groups_.end()) return nullptr;
  return it->second;
}

std::vector<std::shared_ptr<MergeGroupOrchestrator::GroupEntry>>
MergeGroupOrchestrator::AllEntries() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::vector<std::shared_ptr<GroupEntry>> out;
  out.reserve(groups_.size());
  for (const auto& kv : groups_) out.push_back(kv.second);
  return out;
}

size_t MergeGroupOrchestrator::GroupCount() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return groups_.size();
}

// =============================================================================
// Initiate
// =============================================================================

InitiateGroupResult MergeGroupOrchestrator::Initiate(
    const std::string& owner_id, const std::vector<upload::VideoDeclaration>& videos) {
  if (owner_id.empty()) {
    return InitiateGroupResult::Failure(UploadError::kAccessDenied, "owner id required");
  }
  auto issues = validation::ValidateGroupDeclarations(videos, sessions_->Limits());
  if (!issues.empty()) {
    return InitiateGroupResult::Failure(UploadError::kInvalidMetadata,
                                        validation::FormatIssues(issues));
  }

  const std::string group_id = util::GenerateUuidV4();
  std::vector<std::string> created;
  auto rollback = [this, &created]() {
    for (const auto& id : created) sessions_->Erase(id);
  };

  InitiateGroupResult result;
  for (size_t i = 0; i < videos.size(); ++i) {
    auto session = sessions_->Create(owner_id, videos[i], /*publish=*/false);
    if (!session.ok) {
      rollback();
      std::ostringstream oss;
      oss << "video " << i << ": " << session.detail;
      Logger::Warn("[MergeGroupOrchestrator] INITIATE_ROLLED_BACK owner=" + owner_id +
                   " error=" + upload::UploadErrorName(session.error));
      return InitiateGroupResult::Failure(session.error, oss.str());
    }
    created.push_back(session.session_id);

    const auto statement_index = static_cast<int32_t>(i);
    auto attach = sessions_->AttachToGroup(session.session_id, group_id, statement_index, owner_id);
    if (!attach.ok) {
      rollback();
      return InitiateGroupResult::Failure(attach.error, attach.detail);
    }

    InitiatedSlot slot;
    slot.statement_index = statement_index;
    slot.session_id = session.session_id;
    slot.chunk_size = session.chunk_size;
    slot.chunk_count = session.chunk_count;
    result.slots.push_back(slot);
  }

  const int64_t now = time_source_->NowUtcMs();
  auto entry = std::make_shared<GroupEntry>();
  MergeGroupRecord& rec = entry->record;
  rec.group_id = group_id;
  rec.owner_id = owner_id;
  for (size_t i = 0; i < rec.slots.size(); ++i) rec.slots[i].session_id = created[i];
  rec.status = GroupStatus::kAwaitingUploads;
  rec.created_utc_ms = now;
  rec.updated_utc_ms = now;

  if (!store_->Put(RecordKey(group_id), storage::ToBytes(rec.ToJsonLine()))) {
    rollback();
    return InitiateGroupResult::Failure(UploadError::kStorageError,
                                        "group record could not be stored");
  }
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    groups_.emplace(group_id, entry);
  }

  {
    std::ostringstream oss;
    oss << "[MergeGroupOrchestrator] GROUP_CREATED group=" << group_id << " owner=" << owner_id
        << " sessions=" << created[0] << "," << created[1] << "," << created[2];
    Logger::Info(oss.str());
  }
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    EmitLocked(UploadEventType::kGroupCreated, rec);
  }
  for (const auto& id : created) sessions_->PublishCreated(id);

  result.ok = true;
  result.group_id = group_id;
  return result;
}

// =============================================================================
// Trigger
// =============================================================================

bool MergeGroupOrchestrator::OnSessionCompleted(const std::string& group_id,
                                                const std::string& session_id) {
  auto entry = Find(group_id);
  if (!entry) {
    Logger::Warn("[MergeGroupOrchestrator] COMPLETION_FOR_UNKNOWN_GROUP group=" + group_id +
                 " session=" + session_id);
    return false;
  }

  MergeJob job;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->erased) return false;
    MergeGroupRecord& rec = entry->record;
    auto slot = std::find_if(rec.slots.begin(), rec.slots.end(),
                             [&](const GroupSlot& s) { return s.session_id == session_id; });
    if (slot == rec.slots.end()) {
      // Slot was re-associated to another session in the meantime.
      Logger::Debug("[MergeGroupOrchestrator] STALE_COMPLETION group=" + group_id +
                    " session=" + session_id);
      return false;
    }
    if (rec.status == GroupStatus::kCancelled) {
      // Completion raced the group cancel; finish the reset it missed.
      sessions_->ForceCancel(session_id);
      return false;
    }
    if (rec.status != GroupStatus::kAwaitingUploads) return false;
    if (!slot->ready) {
      slot->ready = true;
      rec.updated_utc_ms = time_source_->NowUtcMs();
      PersistLocked(*entry);
    }
    if (!TryTriggerLocked(*entry, &job)) return false;
  }
  SubmitJob(entry, std::move(job));
  return true;
}

bool MergeGroupOrchestrator::TryTriggerLocked(GroupEntry& entry, MergeJob* job) {
  MergeGroupRecord& rec = entry.record;
  if (rec.status != GroupStatus::kAwaitingUploads || rec.merge_triggered) return false;
  if (!rec.AllSlotsReady()) return false;

  MergeJob candidate;
  candidate.group_id = rec.group_id;
  candidate.owner_id = rec.owner_id;
  for (size_t i = 0; i < rec.slots.size(); ++i) {
    const std::string& session_id = rec.slots[i].session_id;
    MergeSource source;
    source.statement_index = static_cast<int32_t>(i);
    source.session_id = session_id;
    source.locator = sessions_->SourceLocator(session_id);
    auto snap = sessions_->Snapshot(session_id);
    if (source.locator.empty() || !snap) {
      // A ready slot whose assembled source vanished; nothing can be merged.
      rec.slots[i].ready = false;
      rec.updated_utc_ms = time_source_->NowUtcMs();
      PersistLocked(entry);
      Logger::Error("[MergeGroupOrchestrator] SOURCE_MISSING group=" + rec.group_id +
                    " session=" + session_id);
      return false;
    }
    source.declared_duration_ms = snap->record.declared_duration_ms;
    source.mime_type = snap->record.mime_type;
    candidate.sources.push_back(std::move(source));
  }

  const int64_t now = time_source_->NowUtcMs();
  rec.merge_triggered = true;
  rec.status = GroupStatus::kMerging;
  rec.merge_progress_percent = 0;
  rec.triggered_utc_ms = now;
  rec.updated_utc_ms = now;
  PersistLocked(entry);
  EmitLocked(UploadEventType::kMergeTriggered, rec);
  Logger::Info("[MergeGroupOrchestrator] MERGE_TRIGGERED group=" + rec.group_id);

  *job = std::move(candidate);
  return true;
}

void MergeGroupOrchestrator::SubmitJob(const std::shared_ptr<GroupEntry>& entry, MergeJob job) {
  std::shared_ptr<CancellationToken> token;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    token = entry->token;
  }
  worker_->Submit(
      std::move(job), std::move(token),
      [this](const std::string& group_id, const MergeOutcome& outcome) {
        OnMergeFinished(group_id, outcome);
      },
      [this](const std::string& group_id, int32_t percent) {
        OnMergeProgress(group_id, percent);
      });
}

// =============================================================================
// Worker callbacks
// =============================================================================

void MergeGroupOrchestrator::OnMergeFinished(const std::string& group_id,
                                             const MergeOutcome& outcome) {
  auto entry = Find(group_id);
  if (!entry) return;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    MergeGroupRecord& rec = entry->record;
    if (entry->erased || rec.status != GroupStatus::kMerging) {
      Logger::Debug(std::string("[MergeGroupOrchestrator] OUTCOME_IGNORED group=") + group_id +
                    " status=" + GroupStatusName(rec.status) +
                    " outcome=" + MergeOutcomeKindName(outcome.kind));
    } else if (outcome.kind == MergeOutcome::Kind::kCancelled) {
      // Only worker shutdown gets here; the group stays merging and the next
      // Restore() fails it as interrupted.
      Logger::Warn("[MergeGroupOrchestrator] MERGE_ABANDONED_ON_SHUTDOWN group=" + group_id);
    } else {
      const int64_t now = time_source_->NowUtcMs();
      rec.finished_utc_ms = now;
      rec.updated_utc_ms = now;
      if (outcome.kind == MergeOutcome::Kind::kSucceeded) {
        rec.status = GroupStatus::kCompleted;
        rec.merge_progress_percent = 100;
        rec.has_result = true;
        rec.result = outcome.result;
        std::sort(rec.result.segments.begin(), rec.result.segments.end(),
                  [](const SegmentTiming& a, const SegmentTiming& b) {
                    return a.statement_index < b.statement_index;
                  });
        PersistLocked(*entry);
        EmitLocked(UploadEventType::kMergeCompleted, rec, "", -1, rec.result.output_locator);
        // The merged output supersedes the member sources.
        for (const auto& slot : rec.slots) sessions_->ReleaseSource(slot.session_id);
      } else {
        rec.status = GroupStatus::kFailed;
        rec.error_code = outcome.error_code;
        rec.error_message = SanitizeMergeMessage(outcome.error_message);
        PersistLocked(*entry);
        EmitLocked(UploadEventType::kMergeFailed, rec, "", -1, rec.error_code);
      }
      std::ostringstream oss;
      oss << "[MergeGroupOrchestrator] MERGE_SETTLED group=" << group_id
          << " status=" << GroupStatusName(rec.status);
      Logger::Info(oss.str());
    }
  }
  entry->settled_cv.notify_all();
}

void MergeGroupOrchestrator::OnMergeProgress(const std::string& group_id, int32_t percent) {
  auto entry = Find(group_id);
  if (!entry) return;
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->record.status != GroupStatus::kMerging) return;
  entry->record.merge_progress_percent =
      std::max(entry->record.merge_progress_percent, percent);
}

// =============================================================================
// Status
// =============================================================================

GroupStatusResult MergeGroupOrchestrator::Status(const std::string& group_id,
                                                 const std::string& requester_id) const {
  auto entry = Find(group_id);
  if (!entry) return GroupStatusResult::Failure(UploadError::kNotFound, "unknown group");

  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->erased) return GroupStatusResult::Failure(UploadError::kNotFound, "unknown group");
  const MergeGroupRecord& rec = entry->record;
  if (rec.owner_id != requester_id) {
    return GroupStatusResult::Failure(UploadError::kAccessDenied, "group belongs to another user");
  }

  GroupStatusResult result;
  result.ok = true;
  result.view.record = rec;
  double total = 0.0;
  for (size_t i = 0; i < rec.slots.size(); ++i) {
    SlotStatus slot;
    slot.statement_index = static_cast<int32_t>(i);
    slot.session_id = rec.slots[i].session_id;
    slot.ready = rec.slots[i].ready;
    auto snap = sessions_->Snapshot(slot.session_id);
    if (snap) {
      slot.session_status = snap->record.status;
      slot.progress_percent = snap->progress_percent;
      slot.blocked = IsBlocked(snap->record.status);
    } else {
      slot.session_status = SessionStatus::kCancelled;
      slot.blocked = true;
    }
    total += slot.progress_percent;
    result.view.slots.push_back(slot);
  }
  result.view.aggregate_progress_percent = total / static_cast<double>(rec.slots.size());
  return result;
}

bool MergeGroupOrchestrator::WaitForMergeSettled(const std::string& group_id,
                                                 std::chrono::milliseconds timeout) const {
  auto entry = Find(group_id);
  if (!entry) return false;
  std::unique_lock<std::mutex> lock(entry->mutex);
  return entry->settled_cv.wait_for(lock, timeout, [&entry] {
    return entry->erased || entry->record.status != GroupStatus::kMerging;
  });
}

// =============================================================================
// Cancellation
// =============================================================================

CancelGroupResult MergeGroupOrchestrator::Cancel(const std::string& group_id,
                                                 const std::string& requester_id) {
  auto entry = Find(group_id);
  if (!entry) return CancelGroupResult::Failure(UploadError::kNotFound, "unknown group");

  CancelGroupResult result;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    MergeGroupRecord& rec = entry->record;
    if (entry->erased) return CancelGroupResult::Failure(UploadError::kNotFound, "unknown group");
    if (rec.owner_id != requester_id) {
      return CancelGroupResult::Failure(UploadError::kAccessDenied, "group belongs to another user");
    }
    if (rec.status == GroupStatus::kCancelled) {
      result.ok = true;
      result.already_cancelled = true;
      return result;
    }
    if (rec.status == GroupStatus::kCompleted || rec.status == GroupStatus::kFailed) {
      return CancelGroupResult::Failure(UploadError::kInvalidState,
                                        std::string("group is ") + GroupStatusName(rec.status));
    }

    const GroupStatus previous = rec.status;
    rec.status = GroupStatus::kCancelled;
    rec.updated_utc_ms = time_source_->NowUtcMs();
    rec.finished_utc_ms = rec.updated_utc_ms;
    entry->token->Cancel();
    PersistLocked(*entry);

    result.members = CancelMembersLocked(*entry);
    EmitLocked(UploadEventType::kGroupCancelled, rec, "", -1,
               std::string("from=") + GroupStatusName(previous));
    Logger::Info(std::string("[MergeGroupOrchestrator] GROUP_CANCELLED group=") + group_id +
                 " from=" + GroupStatusName(previous));
    result.ok = true;
  }
  entry->settled_cv.notify_all();
  return result;
}

std::vector<MemberCancelOutcome> MergeGroupOrchestrator::CancelMembersLocked(GroupEntry& entry) {
  std::vector<MemberCancelOutcome> outcomes;
  MergeGroupRecord& rec = entry.record;
  for (size_t i = 0; i < rec.slots.size(); ++i) {
    MemberCancelOutcome member;
    member.statement_index = static_cast<int32_t>(i);
    member.session_id = rec.slots[i].session_id;
    auto forced = sessions_->ForceCancel(member.session_id);
    if (!forced.found) {
      member.outcome = "missing";
    } else if (forced.previous_status == SessionStatus::kCancelled) {
      member.outcome = "already_terminal";
    } else if (forced.previous_status == SessionStatus::kCompleted) {
      member.outcome = "force_reset";
    } else {
      member.outcome = "cancelled";
    }
    rec.slots[i].ready = false;
    outcomes.push_back(member);
  }
  PersistLocked(entry);
  return outcomes;
}

upload::CancelSessionResult MergeGroupOrchestrator::CancelMember(const std::string& session_id,
                                                                 const std::string& requester_id) {
  auto snap = sessions_->Snapshot(session_id);
  std::shared_ptr<GroupEntry> entry;
  if (snap && !snap->record.group_id.empty()) entry = Find(snap->record.group_id);
  if (!entry) return sessions_->Cancel(session_id, requester_id);

  std::lock_guard<std::mutex> lock(entry->mutex);
  auto result = sessions_->Cancel(session_id, requester_id);
  if (!result.ok || result.already_terminal || entry->erased) return result;

  MergeGroupRecord& rec = entry->record;
  for (auto& slot : rec.slots) {
    if (slot.session_id == session_id) slot.ready = false;
  }
  rec.updated_utc_ms = time_source_->NowUtcMs();
  PersistLocked(*entry);
  Logger::Info("[MergeGroupOrchestrator] MEMBER_CANCELLED group=" + rec.group_id +
               " session=" + session_id);
  return result;
}

// =============================================================================
// ReplaceSlot
// =============================================================================

ReplaceSlotResult MergeGroupOrchestrator::ReplaceSlot(const std::string& group_id,
                                                      int32_t statement_index,
                                                      const std::string& new_session_id,
                                                      const std::string& requester_id) {
  auto entry = Find(group_id);
  if (!entry) return ReplaceSlotResult::Failure(UploadError::kNotFound, "unknown group");

  ReplaceSlotResult result;
  MergeJob job;
  bool fire = false;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    MergeGroupRecord& rec = entry->record;
    if (entry->erased) return ReplaceSlotResult::Failure(UploadError::kNotFound, "unknown group");
    if (rec.owner_id != requester_id) {
      return ReplaceSlotResult::Failure(UploadError::kAccessDenied, "group belongs to another user");
    }
    if (rec.status != GroupStatus::kAwaitingUploads) {
      return ReplaceSlotResult::Failure(UploadError::kInvalidState,
                                        std::string("group is ") + GroupStatusName(rec.status));
    }
    if (statement_index < 0 || statement_index >= upload::kStatementsPerGroup) {
      std::ostringstream oss;
      oss << "statement index " << statement_index << " outside [0, "
          << upload::kStatementsPerGroup << ")";
      return ReplaceSlotResult::Failure(UploadError::kIndexOutOfRange, oss.str());
    }

    GroupSlot& slot = rec.slots[static_cast<size_t>(statement_index)];
    const std::string old_session_id = slot.session_id;
    if (new_session_id == old_session_id) {
      return ReplaceSlotResult::Failure(UploadError::kInvalidState,
                                        "session already occupies the slot");
    }
    auto current = sessions_->Snapshot(old_session_id);
    if (current && !IsBlocked(current->record.status)) {
      return ReplaceSlotResult::Failure(
          UploadError::kInvalidState,
          std::string("slot session is ") + upload::SessionStatusName(current->record.status));
    }

    auto attach = sessions_->AttachToGroup(new_session_id, group_id, statement_index, requester_id);
    if (!attach.ok) return ReplaceSlotResult::Failure(attach.error, attach.detail);
    sessions_->DetachFromGroup(old_session_id, group_id);

    slot.session_id = new_session_id;
    slot.ready = attach.status == SessionStatus::kCompleted;
    rec.updated_utc_ms = time_source_->NowUtcMs();
    PersistLocked(*entry);
    EmitLocked(UploadEventType::kSlotReplaced, rec, new_session_id, statement_index,
               "replaced=" + old_session_id);
    {
      std::ostringstream oss;
      oss << "[MergeGroupOrchestrator] SLOT_REPLACED group=" << group_id
          << " index=" << statement_index << " old=" << old_session_id
          << " new=" << new_session_id << " ready=" << (slot.ready ? "true" : "false");
      Logger::Info(oss.str());
    }

    result.ok = true;
    result.replaced_session_id = old_session_id;
    result.slot_ready = slot.ready;
    fire = TryTriggerLocked(*entry, &job);
  }
  if (fire) SubmitJob(entry, std::move(job));
  result.merge_triggered = fire;
  return result;
}

// =============================================================================
// Maintenance
// =============================================================================

int64_t MergeGroupOrchestrator::LastActivityLocked(const GroupEntry& entry) const {
  int64_t last = entry.record.updated_utc_ms;
  for (const auto& slot : entry.record.slots) {
    auto snap = sessions_->Snapshot(slot.session_id);
    if (snap) last = std::max(last, snap->record.updated_utc_ms);
  }
  return last;
}

size_t MergeGroupOrchestrator::CollectGarbage() {
  if (session_policy_.retention_ms <= 0) return 0;
  const int64_t now = time_source_->NowUtcMs();
  std::vector<std::shared_ptr<GroupEntry>> doomed;

  for (const auto& entry : AllEntries()) {
    bool abandoned = false;
    {
      std::lock_guard<std::mutex> lock(entry->mutex);
      if (entry->erased) continue;
      MergeGroupRecord& rec = entry->record;
      if (IsTerminal(rec.status)) {
        if (now - rec.updated_utc_ms > session_policy_.retention_ms) doomed.push_back(entry);
        continue;
      }
      if (rec.status != GroupStatus::kAwaitingUploads) continue;
      if (now - LastActivityLocked(*entry) <= session_policy_.retention_ms) continue;

      rec.status = GroupStatus::kCancelled;
      rec.error_code = kGroupAbandonedCode;
      rec.error_message = "no upload activity within retention window";
      rec.updated_utc_ms = now;
      rec.finished_utc_ms = now;
      entry->token->Cancel();
      PersistLocked(*entry);
      CancelMembersLocked(*entry);
      EmitLocked(UploadEventType::kGroupCancelled, rec, "", -1, kGroupAbandonedCode);
      abandoned = true;
    }
    if (abandoned) {
      entry->settled_cv.notify_all();
      Logger::Info("[MergeGroupOrchestrator] GROUP_ABANDONED group=" + entry->record.group_id);
    }
  }

  for (const auto& entry : doomed) {
    std::array<GroupSlot, upload::kStatementsPerGroup> slots;
    std::string group_id;
    {
      std::lock_guard<std::mutex> lock(entry->mutex);
      entry->erased = true;
      slots = entry->record.slots;
      group_id = entry->record.group_id;
    }
    entry->settled_cv.notify_all();
    {
      std::lock_guard<std::mutex> lock(registry_mutex_);
      groups_.erase(group_id);
    }
    for (const auto& slot : slots) sessions_->Erase(slot.session_id);
    if (!store_->Delete(RecordKey(group_id))) {
      Logger::Warn("[MergeGroupOrchestrator] RECORD_DELETE_FAILED group=" + group_id);
    }
  }
  if (!doomed.empty()) {
    Logger::Info("[MergeGroupOrchestrator] GROUPS_COLLECTED count=" +
                 std::to_string(doomed.size()));
  }
  return doomed.size();
}

size_t MergeGroupOrchestrator::Restore() {
  size_t restored = 0;
  std::vector<std::pair<std::shared_ptr<GroupEntry>, MergeJob>> to_submit;

  for (const auto& key : store_->ListKeys("records/groups/")) {
    auto bytes = store_->Get(key);
    auto entry = std::make_shared<GroupEntry>();
    if (!bytes || !MergeGroupRecord::FromJsonLine(storage::ToString(*bytes), entry->record)) {
      Logger::Warn("[MergeGroupOrchestrator] RESTORE_SKIPPED key=" + key);
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(registry_mutex_);
      groups_[entry->record.group_id] = entry;
    }
    ++restored;

    std::lock_guard<std::mutex> lock(entry->mutex);
    MergeGroupRecord& rec = entry->record;
    if (rec.status == GroupStatus::kMerging) {
      // The worker run did not survive the restart.
      const int64_t now = time_source_->NowUtcMs();
      rec.status = GroupStatus::kFailed;
      rec.error_code = kMergeInterruptedCode;
      rec.error_message = "merge interrupted by service restart";
      rec.updated_utc_ms = now;
      rec.finished_utc_ms = now;
      PersistLocked(*entry);
      EmitLocked(UploadEventType::kMergeFailed, rec, "", -1, kMergeInterruptedCode);
      Logger::Warn("[MergeGroupOrchestrator] MERGE_INTERRUPTED group=" + rec.group_id);
      continue;
    }
    if (rec.status != GroupStatus::kAwaitingUploads) continue;

    // A completion notification may have been lost with the process.
    bool changed = false;
    for (auto& slot : rec.slots) {
      auto snap = sessions_->Snapshot(slot.session_id);
      const bool completed = snap && snap->record.status == SessionStatus::kCompleted;
      if (slot.ready != completed) {
        slot.ready = completed;
        changed = true;
      }
    }
    if (changed) PersistLocked(*entry);
    MergeJob job;
    if (TryTriggerLocked(*entry, &job)) to_submit.emplace_back(entry, std::move(job));
  }

  for (auto& pending : to_submit) SubmitJob(pending.first, std::move(pending.second));
  Logger::Info("[MergeGroupOrchestrator] GROUPS_RESTORED count=" + std::to_string(restored) +
               " retriggered=" + std::to_string(to_submit.size()));
  return restored;
}

// =============================================================================
// Helpers (group mutex held)
// =============================================================================

void MergeGroupOrchestrator::PersistLocked(const GroupEntry& entry) {
  const auto& rec = entry.record;
  if (!store_->Put(RecordKey(rec.group_id), storage::ToBytes(rec.ToJsonLine()))) {
    Logger::Warn(std::string("[MergeGroupOrchestrator] PERSIST_FAILED group=") + rec.group_id +
                 " status=" + GroupStatusName(rec.status));
  }
}

void MergeGroupOrchestrator::EmitLocked(UploadEventType type, const MergeGroupRecord& record,
                                        const std::string& session_id, int32_t statement_index,
                                        const std::string& detail) {
  if (!events_) return;
  events_->Emit(type, record.owner_id, record.group_id, session_id, statement_index, detail);
}

}  // namespace triptych::merge
