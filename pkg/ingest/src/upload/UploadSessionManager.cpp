// Repository: Triptych-ingest
// Component: Upload Session Manager Implementation
// Copyright (c) 2026 Triptych

#include "triptych/upload/UploadSessionManager.hpp"

#include <algorithm>
#include <sstream>

#include "triptych/upload/ContentHasher.hpp"
#include "triptych/util/Ids.hpp"
#include "triptych/util/Logger.hpp"
#include "triptych/validation/GroupRequestValidator.hpp"

namespace triptych::upload {

using events::UploadEventType;
using triptych::util::Logger;

namespace {

double ProgressPercent(size_t present, int64_t count) {
  if (count <= 0) return 0.0;
  return 100.0 * static_cast<double>(present) / static_cast<double>(count);
}

}  // namespace

UploadSessionManager::UploadSessionManager(std::shared_ptr<storage::IKeyValueStore> store,
                                           std::shared_ptr<ChunkStore> chunks,
                                           std::shared_ptr<events::EventEmitter> events,
                                           std::shared_ptr<time::ITimeSource> time_source,
                                           UploadLimits limits,
                                           SessionPolicy policy)
    : store_(std::move(store)),
      chunks_(std::move(chunks)),
      events_(std::move(events)),
      time_source_(std::move(time_source)),
      limits_(std::move(limits)),
      policy_(policy) {}

std::string UploadSessionManager::RecordKey(const std::string& session_id) {
  return "records/sessions/" + session_id;
}

std::string UploadSessionManager::SourceKey(const std::string& session_id) {
  return "sources/" + session_id;
}

void UploadSessionManager::SetCompletionListener(CompletionListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  completion_listener_ = std::move(listener);
}

std::shared_ptr<UploadSessionManager::SessionEntry> UploadSessionManager::Find(
    const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return nullptr;
  return it->second;
}

std::vector<std::shared_ptr<UploadSessionManager::SessionEntry>>
UploadSessionManager::AllEntries() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::vector<std::shared_ptr<SessionEntry>> out;
  out.reserve(sessions_.size());
  for (const auto& kv : sessions_) out.push_back(kv.second);
  return out;
}

// =============================================================================
// Create
// =============================================================================

CreateSessionResult UploadSessionManager::Create(const std::string& owner_id,
                                                 const VideoDeclaration& video,
                                                 bool publish) {
  if (owner_id.empty()) {
    return CreateSessionResult::Failure(UploadError::kAccessDenied, "owner id required");
  }
  auto issues = validation::ValidateVideoDeclaration(video, limits_);
  if (!issues.empty()) {
    return CreateSessionResult::Failure(UploadError::kInvalidMetadata,
                                        validation::FormatIssues(issues));
  }

  const int64_t now = time_source_->NowUtcMs();
  auto entry = std::make_shared<SessionEntry>();
  UploadSessionRecord& rec = entry->record;
  rec.session_id = util::GenerateUuidV4();
  rec.owner_id = owner_id;
  rec.declared_size = video.declared_size;
  rec.chunk_size = limits_.chunk_size_bytes;
  rec.declared_chunk_count = video.declared_chunk_count;
  rec.mime_type = video.mime_type;
  rec.declared_duration_ms = video.declared_duration_ms;
  rec.declared_hash = video.declared_hash.value_or("");
  rec.status = SessionStatus::kPending;
  rec.created_utc_ms = now;
  rec.updated_utc_ms = now;

  {
    // Quota count and insert under one registry lock so concurrent creates
    // by the same owner cannot both pass the check.
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (policy_.max_active_sessions_per_owner > 0) {
      int32_t active = 0;
      for (const auto& kv : sessions_) {
        std::lock_guard<std::mutex> session_lock(kv.second->mutex);
        const auto& other = kv.second->record;
        if (other.owner_id == owner_id && !IsTerminal(other.status)) ++active;
      }
      if (active >= policy_.max_active_sessions_per_owner) {
        std::ostringstream oss;
        oss << "owner has " << active << " active uploads (limit "
            << policy_.max_active_sessions_per_owner << ")";
        return CreateSessionResult::Failure(UploadError::kQuotaExceeded, oss.str());
      }
    }
    sessions_.emplace(rec.session_id, entry);
  }

  std::unique_lock<std::mutex> session_lock(entry->mutex);
  if (!chunks_->Open(rec.session_id, rec.declared_chunk_count) ||
      !store_->Put(RecordKey(rec.session_id), storage::ToBytes(rec.ToJsonLine()))) {
    chunks_->Delete(rec.session_id);
    entry->erased = true;
    const std::string session_id = rec.session_id;
    // Registry lock is never taken while a session lock is held.
    session_lock.unlock();
    {
      std::lock_guard<std::mutex> lock(registry_mutex_);
      sessions_.erase(session_id);
    }
    return CreateSessionResult::Failure(UploadError::kStorageError,
                                        "session record could not be stored");
  }

  {
    std::ostringstream oss;
    oss << "[UploadSessionManager] SESSION_CREATED session=" << rec.session_id
        << " owner=" << owner_id << " size=" << rec.declared_size
        << " chunks=" << rec.declared_chunk_count << " mime=" << rec.mime_type;
    Logger::Debug(oss.str());
  }
  if (publish) EmitLocked(UploadEventType::kSessionCreated, rec);

  CreateSessionResult result;
  result.ok = true;
  result.session_id = rec.session_id;
  result.chunk_size = rec.chunk_size;
  result.chunk_count = rec.declared_chunk_count;
  return result;
}

// =============================================================================
// PutChunk
// =============================================================================

PutChunkResult UploadSessionManager::PutChunk(const std::string& session_id,
                                              int64_t index,
                                              const Bytes& bytes,
                                              const std::string& requester_id,
                                              const std::optional<std::string>& chunk_hash) {
  auto entry = Find(session_id);
  if (!entry) return PutChunkResult::Failure(UploadError::kNotFound, "unknown session");

  std::lock_guard<std::mutex> lock(entry->mutex);
  UploadSessionRecord& rec = entry->record;
  if (entry->erased) return PutChunkResult::Failure(UploadError::kNotFound, "unknown session");
  if (rec.owner_id != requester_id) {
    return PutChunkResult::Failure(UploadError::kAccessDenied, "session belongs to another user");
  }

  const int64_t now = time_source_->NowUtcMs();
  if (!IsTerminal(rec.status) && IsExpiredLocked(*entry, now)) {
    CancelLocked(*entry, UploadErrorName(UploadError::kSessionExpired), now);
    EmitLocked(UploadEventType::kSessionCancelled, rec, UploadErrorName(UploadError::kSessionExpired));
    return PutChunkResult::Failure(UploadError::kSessionExpired, "upload session timed out");
  }
  if (IsTerminal(rec.status)) {
    return PutChunkResult::Failure(UploadError::kInvalidState,
                                   std::string("session is ") + SessionStatusName(rec.status));
  }
  if (index < 0 || index >= rec.declared_chunk_count) {
    std::ostringstream oss;
    oss << "index " << index << " outside [0, " << rec.declared_chunk_count << ")";
    return PutChunkResult::Failure(UploadError::kIndexOutOfRange, oss.str());
  }
  const int64_t expected_len = ExpectedChunkLength(rec.declared_size, rec.chunk_size, index);
  if (static_cast<int64_t>(bytes.size()) != expected_len) {
    std::ostringstream oss;
    oss << "chunk " << index << " has " << bytes.size() << " bytes, expected " << expected_len;
    return PutChunkResult::Failure(UploadError::kChunkSizeMismatch, oss.str());
  }
  if (chunk_hash && !chunk_hash->empty()) {
    if (!DigestsMatch(Sha256Hex(bytes), *chunk_hash)) {
      std::ostringstream oss;
      oss << "chunk " << index << " hash mismatch";
      return PutChunkResult::Failure(UploadError::kIntegrityError, oss.str());
    }
  }

  const UploadError write = chunks_->Put(session_id, index, bytes);
  if (write != UploadError::kNone && write != UploadError::kDuplicate) {
    std::ostringstream oss;
    oss << "chunk " << index << " could not be stored";
    return PutChunkResult::Failure(UploadError::kStorageError, oss.str());
  }

  rec.updated_utc_ms = now;
  if (rec.status == SessionStatus::kPending) {
    rec.status = SessionStatus::kUploading;
    PersistLocked(*entry);
  }

  const size_t present = chunks_->ListPresent(session_id).size();
  PutChunkResult result;
  result.ok = true;
  result.duplicate = (write == UploadError::kDuplicate);
  result.received_chunks = static_cast<int64_t>(present);
  result.chunk_count = rec.declared_chunk_count;
  result.progress_percent = ProgressPercent(present, rec.declared_chunk_count);
  result.status = rec.status;
  return result;
}

// =============================================================================
// Complete
// =============================================================================

CompleteResult UploadSessionManager::Complete(const std::string& session_id,
                                              const std::optional<std::string>& declared_hash,
                                              const std::string& requester_id) {
  auto entry = Find(session_id);
  if (!entry) return CompleteResult::Failure(UploadError::kNotFound, "unknown session");

  CompleteResult result;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    UploadSessionRecord& rec = entry->record;
    if (entry->erased) return CompleteResult::Failure(UploadError::kNotFound, "unknown session");
    if (rec.owner_id != requester_id) {
      return CompleteResult::Failure(UploadError::kAccessDenied, "session belongs to another user");
    }

    if (rec.status == SessionStatus::kCompleted) {
      result.ok = true;
      result.already_completed = true;
      result.status = rec.status;
      result.computed_hash = rec.computed_hash;
      result.group_id = rec.group_id;
      return result;
    }

    const int64_t now = time_source_->NowUtcMs();
    if (!IsTerminal(rec.status) && IsExpiredLocked(*entry, now)) {
      CancelLocked(*entry, UploadErrorName(UploadError::kSessionExpired), now);
      EmitLocked(UploadEventType::kSessionCancelled, rec, UploadErrorName(UploadError::kSessionExpired));
      return CompleteResult::Failure(UploadError::kSessionExpired, "upload session timed out");
    }
    if (IsTerminal(rec.status)) {
      return CompleteResult::Failure(UploadError::kInvalidState,
                                     std::string("session is ") + SessionStatusName(rec.status));
    }

    auto assembled = chunks_->Assemble(session_id);
    if (!assembled.ok) {
      if (assembled.error == UploadError::kIncomplete) {
        std::ostringstream oss;
        oss << assembled.missing_indices.size() << " of " << rec.declared_chunk_count
            << " chunks missing";
        auto failure = CompleteResult::Failure(UploadError::kIncomplete, oss.str());
        failure.missing_indices = std::move(assembled.missing_indices);
        failure.status = rec.status;
        return failure;
      }
      return CompleteResult::Failure(UploadError::kStorageError, "chunks could not be read");
    }

    const std::string computed = Sha256Hex(assembled.bytes);
    if (computed.empty()) {
      return CompleteResult::Failure(UploadError::kStorageError, "content digest unavailable");
    }
    const std::string expected =
        (declared_hash && !declared_hash->empty()) ? *declared_hash : rec.declared_hash;
    rec.computed_hash = computed;

    const bool size_ok = static_cast<int64_t>(assembled.bytes.size()) == rec.declared_size;
    if (!size_ok || (!expected.empty() && !DigestsMatch(expected, computed))) {
      rec.status = SessionStatus::kFailed;
      rec.error_detail = size_ok ? "content hash mismatch" : "assembled size mismatch";
      rec.updated_utc_ms = now;
      chunks_->Delete(session_id);
      PersistLocked(*entry);
      EmitLocked(UploadEventType::kSessionFailed, rec, rec.error_detail);
      std::ostringstream oss;
      if (size_ok) {
        oss << "declared hash " << expected << " does not match computed " << computed;
      } else {
        oss << "assembled " << assembled.bytes.size() << " bytes, declared " << rec.declared_size;
      }
      auto failure = CompleteResult::Failure(UploadError::kIntegrityError, oss.str());
      failure.status = rec.status;
      failure.computed_hash = computed;
      return failure;
    }

    if (!store_->Put(SourceKey(session_id), assembled.bytes)) {
      return CompleteResult::Failure(UploadError::kStorageError,
                                     "assembled video could not be stored");
    }
    chunks_->Delete(session_id);
    rec.source_key = SourceKey(session_id);
    rec.status = SessionStatus::kCompleted;
    rec.completed_utc_ms = now;
    rec.updated_utc_ms = now;
    rec.error_detail.clear();
    PersistLocked(*entry);
    EmitLocked(UploadEventType::kSessionCompleted, rec);

    result.ok = true;
    result.status = rec.status;
    result.computed_hash = computed;
    result.group_id = rec.group_id;
  }

  // Group notification runs outside the session lock (lock order is
  // group -> session).
  if (!result.group_id.empty()) {
    CompletionListener listener;
    {
      std::lock_guard<std::mutex> lock(listener_mutex_);
      listener = completion_listener_;
    }
    if (listener) result.merge_triggered = listener(result.group_id, session_id);
  }
  return result;
}

// =============================================================================
// Cancel / ForceCancel
// =============================================================================

CancelSessionResult UploadSessionManager::Cancel(const std::string& session_id,
                                                 const std::string& requester_id) {
  auto entry = Find(session_id);
  if (!entry) return CancelSessionResult::Failure(UploadError::kNotFound, "unknown session");

  std::lock_guard<std::mutex> lock(entry->mutex);
  UploadSessionRecord& rec = entry->record;
  if (entry->erased) return CancelSessionResult::Failure(UploadError::kNotFound, "unknown session");
  if (rec.owner_id != requester_id) {
    return CancelSessionResult::Failure(UploadError::kAccessDenied, "session belongs to another user");
  }

  CancelSessionResult result;
  result.ok = true;
  if (IsTerminal(rec.status)) {
    result.already_terminal = true;
    result.status = rec.status;
    return result;
  }
  CancelLocked(*entry, "cancelled by owner", time_source_->NowUtcMs());
  EmitLocked(UploadEventType::kSessionCancelled, rec, "client");
  result.status = rec.status;
  return result;
}

ForceCancelResult UploadSessionManager::ForceCancel(const std::string& session_id) {
  ForceCancelResult result;
  auto entry = Find(session_id);
  if (!entry) return result;

  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->erased) return result;
  UploadSessionRecord& rec = entry->record;
  result.found = true;
  result.previous_status = rec.status;
  if (rec.status == SessionStatus::kCancelled) return result;

  const bool was_completed = rec.status == SessionStatus::kCompleted;
  CancelLocked(*entry, "cancelled with group", time_source_->NowUtcMs());
  EmitLocked(UploadEventType::kSessionCancelled, rec, was_completed ? "force_reset" : "group");
  return result;
}

// =============================================================================
// Status
// =============================================================================

SessionStatusResult UploadSessionManager::Status(const std::string& session_id,
                                                 const std::string& requester_id) const {
  auto entry = Find(session_id);
  if (!entry) return SessionStatusResult::Failure(UploadError::kNotFound, "unknown session");

  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->erased) return SessionStatusResult::Failure(UploadError::kNotFound, "unknown session");
  if (entry->record.owner_id != requester_id) {
    return SessionStatusResult::Failure(UploadError::kAccessDenied, "session belongs to another user");
  }
  SessionStatusResult result;
  result.ok = true;
  result.snapshot = SnapshotLocked(*entry);
  return result;
}

std::optional<SessionSnapshot> UploadSessionManager::Snapshot(const std::string& session_id) const {
  auto entry = Find(session_id);
  if (!entry) return std::nullopt;
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->erased) return std::nullopt;
  return SnapshotLocked(*entry);
}

SessionSnapshot UploadSessionManager::SnapshotLocked(const SessionEntry& entry) const {
  SessionSnapshot snap;
  snap.record = entry.record;
  const int64_t count = entry.record.declared_chunk_count;
  if (entry.record.status == SessionStatus::kCompleted) {
    // Chunks are gone once assembled; every index counts as present.
    for (int64_t i = 0; i < count; ++i) snap.present_indices.push_back(i);
    snap.progress_percent = 100.0;
    return snap;
  }
  const auto present = chunks_->ListPresent(entry.record.session_id);
  for (int64_t i = 0; i < count; ++i) {
    if (present.count(i) != 0) snap.present_indices.push_back(i);
    else snap.missing_indices.push_back(i);
  }
  snap.progress_percent = ProgressPercent(present.size(), count);
  return snap;
}

// =============================================================================
// Group linkage
// =============================================================================

AttachResult UploadSessionManager::AttachToGroup(const std::string& session_id,
                                                 const std::string& group_id,
                                                 int32_t statement_index,
                                                 const std::string& owner_id) {
  auto entry = Find(session_id);
  if (!entry) return AttachResult::Failure(UploadError::kNotFound, "unknown session");

  std::lock_guard<std::mutex> lock(entry->mutex);
  UploadSessionRecord& rec = entry->record;
  if (entry->erased) return AttachResult::Failure(UploadError::kNotFound, "unknown session");
  if (rec.owner_id != owner_id) {
    return AttachResult::Failure(UploadError::kAccessDenied, "session belongs to another user");
  }
  if (!rec.group_id.empty() && rec.group_id != group_id) {
    return AttachResult::Failure(UploadError::kInvalidState, "session already belongs to a group");
  }
  if (rec.status == SessionStatus::kFailed || rec.status == SessionStatus::kCancelled) {
    return AttachResult::Failure(UploadError::kInvalidState,
                                 std::string("session is ") + SessionStatusName(rec.status));
  }
  rec.group_id = group_id;
  rec.statement_index = statement_index;
  rec.updated_utc_ms = time_source_->NowUtcMs();
  PersistLocked(*entry);

  AttachResult result;
  result.ok = true;
  result.status = rec.status;
  return result;
}

void UploadSessionManager::DetachFromGroup(const std::string& session_id,
                                           const std::string& group_id) {
  auto entry = Find(session_id);
  if (!entry) return;
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->erased || entry->record.group_id != group_id) return;
  entry->record.group_id.clear();
  entry->record.statement_index = -1;
  entry->record.updated_utc_ms = time_source_->NowUtcMs();
  PersistLocked(*entry);
}

void UploadSessionManager::PublishCreated(const std::string& session_id) {
  auto entry = Find(session_id);
  if (!entry) return;
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->erased) return;
  EmitLocked(UploadEventType::kSessionCreated, entry->record);
}

std::string UploadSessionManager::SourceLocator(const std::string& session_id) const {
  auto entry = Find(session_id);
  if (!entry) return "";
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->erased || entry->record.status != SessionStatus::kCompleted ||
      entry->record.source_key.empty()) {
    return "";
  }
  return store_->Locate(entry->record.source_key);
}

void UploadSessionManager::ReleaseSource(const std::string& session_id) {
  auto entry = Find(session_id);
  if (!entry) return;
  std::lock_guard<std::mutex> lock(entry->mutex);
  UploadSessionRecord& rec = entry->record;
  if (entry->erased || rec.status != SessionStatus::kCompleted || rec.source_key.empty()) {
    return;
  }
  if (!store_->Delete(rec.source_key)) {
    Logger::Warn("[UploadSessionManager] SOURCE_DELETE_FAILED session=" + session_id);
    return;
  }
  rec.source_key.clear();
  PersistLocked(*entry);
  Logger::Debug("[UploadSessionManager] SOURCE_RELEASED session=" + session_id);
}

// =============================================================================
// Removal, sweeps and restore
// =============================================================================

void UploadSessionManager::Erase(const std::string& session_id) {
  std::shared_ptr<SessionEntry> entry;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return;
    entry = it->second;
    sessions_.erase(it);
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  entry->erased = true;
  chunks_->Delete(session_id);
  if (!store_->Delete(SourceKey(session_id)) || !store_->Delete(RecordKey(session_id))) {
    Logger::Warn("[UploadSessionManager] ERASE_INCOMPLETE session=" + session_id);
  }
  Logger::Debug("[UploadSessionManager] SESSION_ERASED session=" + session_id);
}

size_t UploadSessionManager::ExpireStale() {
  const int64_t now = time_source_->NowUtcMs();
  size_t expired = 0;
  for (const auto& entry : AllEntries()) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->erased || IsTerminal(entry->record.status)) continue;
    if (!IsExpiredLocked(*entry, now)) continue;
    CancelLocked(*entry, UploadErrorName(UploadError::kSessionExpired), now);
    EmitLocked(UploadEventType::kSessionCancelled, entry->record,
               UploadErrorName(UploadError::kSessionExpired));
    ++expired;
  }
  if (expired > 0) {
    Logger::Info("[UploadSessionManager] SESSIONS_EXPIRED count=" + std::to_string(expired));
  }
  return expired;
}

size_t UploadSessionManager::CollectTerminal() {
  if (policy_.retention_ms <= 0) return 0;
  const int64_t now = time_source_->NowUtcMs();
  std::vector<std::string> doomed;
  for (const auto& entry : AllEntries()) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    const auto& rec = entry->record;
    if (entry->erased || !rec.group_id.empty() || !IsTerminal(rec.status)) continue;
    if (now - rec.updated_utc_ms > policy_.retention_ms) doomed.push_back(rec.session_id);
  }
  for (const auto& id : doomed) Erase(id);
  return doomed.size();
}

size_t UploadSessionManager::Restore() {
  const int64_t now = time_source_->NowUtcMs();
  size_t restored = 0;
  for (const auto& key : store_->ListKeys("records/sessions/")) {
    auto bytes = store_->Get(key);
    auto entry = std::make_shared<SessionEntry>();
    if (!bytes || !UploadSessionRecord::FromJsonLine(storage::ToString(*bytes), entry->record)) {
      Logger::Warn("[UploadSessionManager] RESTORE_SKIPPED key=" + key);
      continue;
    }
    UploadSessionRecord& rec = entry->record;
    if (!IsTerminal(rec.status)) {
      chunks_->Restore(rec.session_id, rec.declared_chunk_count);
      // Expiry restarts from the restore point.
      rec.updated_utc_ms = std::max(rec.updated_utc_ms, now);
    }
    std::lock_guard<std::mutex> lock(registry_mutex_);
    sessions_[rec.session_id] = std::move(entry);
    ++restored;
  }
  Logger::Info("[UploadSessionManager] SESSIONS_RESTORED count=" + std::to_string(restored));
  return restored;
}

size_t UploadSessionManager::SessionCount() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return sessions_.size();
}

// =============================================================================
// Helpers (entry mutex held)
// =============================================================================

bool UploadSessionManager::IsExpiredLocked(const SessionEntry& entry, int64_t now_ms) const {
  return policy_.session_timeout_ms > 0 &&
         now_ms - entry.record.updated_utc_ms > policy_.session_timeout_ms;
}

void UploadSessionManager::PersistLocked(const SessionEntry& entry) {
  const auto& rec = entry.record;
  if (!store_->Put(RecordKey(rec.session_id), storage::ToBytes(rec.ToJsonLine()))) {
    Logger::Warn("[UploadSessionManager] PERSIST_FAILED session=" + rec.session_id +
                 " status=" + SessionStatusName(rec.status));
  }
}

void UploadSessionManager::CancelLocked(SessionEntry& entry, const std::string& reason,
                                        int64_t now_ms) {
  UploadSessionRecord& rec = entry.record;
  rec.status = SessionStatus::kCancelled;
  rec.error_detail = reason;
  rec.updated_utc_ms = now_ms;
  PersistLocked(entry);

  chunks_->Delete(rec.session_id);
  if (!rec.source_key.empty()) {
    if (!store_->Delete(rec.source_key)) {
      Logger::Warn("[UploadSessionManager] SOURCE_DELETE_FAILED session=" + rec.session_id);
    }
    rec.source_key.clear();
    PersistLocked(entry);
  }
}

void UploadSessionManager::EmitLocked(UploadEventType type, const UploadSessionRecord& record,
                                      const std::string& detail) {
  if (!events_) return;
  events_->Emit(type, record.owner_id, record.group_id, record.session_id,
                record.statement_index, detail);
}

}  // namespace triptych::upload
