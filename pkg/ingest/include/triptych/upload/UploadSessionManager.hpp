// Repository: Triptych-ingest
// Component: Upload Session Manager
// Purpose: Lifecycle of one video's chunked upload: creation, chunk
//          ingestion, integrity verification, completion, cancellation
//          and status. Notifies the owning merge group on completion.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_UPLOAD_UPLOAD_SESSION_MANAGER_HPP_
#define TRIPTYCH_UPLOAD_UPLOAD_SESSION_MANAGER_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "triptych/events/EventEmitter.hpp"
#include "triptych/storage/IKeyValueStore.hpp"
#include "triptych/time/ITimeSource.hpp"
#include "triptych/upload/ChunkStore.hpp"
#include "triptych/upload/UploadConfig.hpp"
#include "triptych/upload/UploadTypes.hpp"

namespace triptych::upload {

// UploadSessionManager owns every UploadSession.
//
// Sessions live in a registry keyed by id; each record carries its own
// mutex, so chunk writes, completion and cancellation serialize per session
// while unrelated sessions proceed in parallel. The registry mutex guards
// lookups and inserts only.
//
// Lock order: group (MergeGroupOrchestrator) -> session -> chunk index set.
// The completion listener is invoked after the session lock is released.
class UploadSessionManager {
 public:
  // Called once per successful completion of a session that belongs to a
  // group. Returns true when that notification fired the group's merge
  // trigger.
  using CompletionListener =
      std::function<bool(const std::string& group_id, const std::string& session_id)>;

  UploadSessionManager(std::shared_ptr<storage::IKeyValueStore> store,
                       std::shared_ptr<ChunkStore> chunks,
                       std::shared_ptr<events::EventEmitter> events,
                       std::shared_ptr<time::ITimeSource> time_source,
                       UploadLimits limits,
                       SessionPolicy policy);

  UploadSessionManager(const UploadSessionManager&) = delete;
  UploadSessionManager& operator=(const UploadSessionManager&) = delete;

  void SetCompletionListener(CompletionListener listener);

  // ===========================================================================
  // Client operations
  // ===========================================================================

  // Validates the declaration (kInvalidMetadata lists every violation) and
  // the owner's active-session quota (kQuotaExceeded). With publish=false
  // the session_created event is withheld until PublishCreated().
  CreateSessionResult Create(const std::string& owner_id,
                             const VideoDeclaration& video,
                             bool publish = true);

  // Check order: NotFound, AccessDenied, SessionExpired, InvalidState,
  // IndexOutOfRange, ChunkSizeMismatch, IntegrityError (chunk_hash),
  // StorageError. A re-sent index succeeds with duplicate=true.
  PutChunkResult PutChunk(const std::string& session_id,
                          int64_t index,
                          const Bytes& bytes,
                          const std::string& requester_id,
                          const std::optional<std::string>& chunk_hash = std::nullopt);

  // Idempotent on a completed session (already_completed, no side effects).
  // declared_hash overrides the hash given at creation.
  CompleteResult Complete(const std::string& session_id,
                          const std::optional<std::string>& declared_hash,
                          const std::string& requester_id);

  // No-op success (already_terminal) on completed, failed or cancelled.
  CancelSessionResult Cancel(const std::string& session_id,
                             const std::string& requester_id);

  SessionStatusResult Status(const std::string& session_id,
                             const std::string& requester_id) const;

  // ===========================================================================
  // Privileged / internal operations (not reachable by clients)
  // ===========================================================================

  // Resets any status, completed included, to cancelled and deletes chunk
  // and assembled data. Used only by group cancellation.
  ForceCancelResult ForceCancel(const std::string& session_id);

  // Links the session to a group slot. Fails if the session is owned by
  // someone else, already belongs to another group, or is failed/cancelled.
  // The returned status is read under the same lock that sets the link.
  AttachResult AttachToGroup(const std::string& session_id,
                             const std::string& group_id,
                             int32_t statement_index,
                             const std::string& owner_id);

  // Clears the link if it still points at group_id.
  void DetachFromGroup(const std::string& session_id, const std::string& group_id);

  void PublishCreated(const std::string& session_id);

  // Removes the session with all stored data and its record. Emits nothing.
  // Used to roll back a partially created group and by retention sweeps.
  void Erase(const std::string& session_id);

  std::optional<SessionSnapshot> Snapshot(const std::string& session_id) const;

  // Store locator of the assembled source; empty unless completed.
  std::string SourceLocator(const std::string& session_id) const;

  // Deletes the assembled source of a completed session once the merged
  // output has superseded it. The session stays completed.
  void ReleaseSource(const std::string& session_id);

  // Cancels pending/uploading sessions idle longer than session_timeout_ms.
  size_t ExpireStale();

  // Erases standalone terminal sessions idle longer than retention_ms.
  // Group members are collected with their group.
  size_t CollectTerminal();

  // Reloads persisted session records and rebuilds chunk index sets.
  size_t Restore();

  size_t SessionCount() const;

  const UploadLimits& Limits() const { return limits_; }

  static std::string RecordKey(const std::string& session_id);
  static std::string SourceKey(const std::string& session_id);

 private:
  struct SessionEntry {
    mutable std::mutex mutex;
    UploadSessionRecord record;
    bool erased = false;  // set under mutex when removed from the registry
  };

  std::shared_ptr<SessionEntry> Find(const std::string& session_id) const;
  std::vector<std::shared_ptr<SessionEntry>> AllEntries() const;

  SessionSnapshot SnapshotLocked(const SessionEntry& entry) const;
  bool IsExpiredLocked(const SessionEntry& entry, int64_t now_ms) const;
  void PersistLocked(const SessionEntry& entry);
  // Flips to cancelled, then releases chunk and assembled data.
  void CancelLocked(SessionEntry& entry, const std::string& reason, int64_t now_ms);
  void EmitLocked(events::UploadEventType type, const UploadSessionRecord& record,
                  const std::string& detail = "");

  std::shared_ptr<storage::IKeyValueStore> store_;
  std::shared_ptr<ChunkStore> chunks_;
  std::shared_ptr<events::EventEmitter> events_;
  std::shared_ptr<time::ITimeSource> time_source_;
  const UploadLimits limits_;
  const SessionPolicy policy_;

  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<SessionEntry>> sessions_;

  std::mutex listener_mutex_;
  CompletionListener completion_listener_;
};

}  // namespace triptych::upload

#endif  // TRIPTYCH_UPLOAD_UPLOAD_SESSION_MANAGER_HPP_
