// Repository: Triptych-ingest
// Component: Upload Types
// Purpose: Session status, error kinds, persisted session record and the
//          result structs returned by the upload session manager.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_UPLOAD_UPLOAD_TYPES_HPP_
#define TRIPTYCH_UPLOAD_UPLOAD_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace triptych::upload {

// =============================================================================
// Session Status
// pending -> uploading -> completed
// pending|uploading -> failed      (integrity mismatch)
// pending|uploading -> cancelled   (client cancel, expiry)
// completed -> cancelled           (ForceCancel from a group cancel only)
// =============================================================================

enum class SessionStatus {
  kPending,
  kUploading,
  kCompleted,
  kFailed,
  kCancelled,
};

const char* SessionStatusName(SessionStatus status);
bool ParseSessionStatus(const std::string& name, SessionStatus* out);

inline bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kCompleted ||
         status == SessionStatus::kFailed ||
         status == SessionStatus::kCancelled;
}

// =============================================================================
// Error kinds
// Every kind has a stable numeric code and name that reach clients verbatim.
// =============================================================================

enum class UploadError {
  kNone = 0,
  kInvalidMetadata,
  kIndexOutOfRange,
  kDuplicate,
  kInvalidState,
  kIncomplete,
  kIntegrityError,
  kAccessDenied,
  kNotFound,
  kMergeFailure,
  // Duplicate trigger attempts are absorbed by the group latch; never
  // returned from a public operation.
  kAlreadyTriggered,
  kChunkSizeMismatch,
  kQuotaExceeded,
  kSessionExpired,
  kStorageError,
};

int UploadErrorCode(UploadError error);
const char* UploadErrorName(UploadError error);

// =============================================================================
// Declarations and records
// =============================================================================

struct VideoDeclaration {
  int64_t declared_size = 0;
  int64_t declared_chunk_count = 0;
  std::string mime_type;
  int64_t declared_duration_ms = 0;
  std::optional<std::string> declared_hash;  // SHA-256 hex
};

// ceil(size / chunk_size); 0 for non-positive inputs.
inline int64_t ExpectedChunkCount(int64_t size, int64_t chunk_size) {
  if (size <= 0 || chunk_size <= 0) return 0;
  return size / chunk_size + (size % chunk_size != 0 ? 1 : 0);
}

// Byte length chunk `index` must have: chunk_size for all but the last.
inline int64_t ExpectedChunkLength(int64_t size, int64_t chunk_size, int64_t index) {
  const int64_t count = ExpectedChunkCount(size, chunk_size);
  if (index < 0 || index >= count) return -1;
  if (index < count - 1) return chunk_size;
  return size - chunk_size * (count - 1);
}

// Persisted form of one upload session (records/sessions/<id>).
// The set of received indices is not stored here; it is rebuilt from the
// chunk keys present in the store.
struct UploadSessionRecord {
  std::string session_id;
  std::string owner_id;
  int64_t declared_size = 0;
  int64_t chunk_size = 0;
  int64_t declared_chunk_count = 0;
  std::string mime_type;
  int64_t declared_duration_ms = 0;
  std::string declared_hash;   // empty = none declared at creation
  std::string computed_hash;   // set on completion attempt
  SessionStatus status = SessionStatus::kPending;
  std::string group_id;        // empty = standalone session
  int32_t statement_index = -1;
  std::string source_key;      // assembled bytes, set on completion
  std::string error_detail;
  int64_t created_utc_ms = 0;
  int64_t updated_utc_ms = 0;
  int64_t completed_utc_ms = 0;

  std::string ToJsonLine() const;
  static bool FromJsonLine(const std::string& line, UploadSessionRecord& out);
};

struct SessionSnapshot {
  UploadSessionRecord record;
  std::vector<int64_t> present_indices;
  std::vector<int64_t> missing_indices;
  double progress_percent = 0.0;
};

// =============================================================================
// Operation results
// =============================================================================

struct CreateSessionResult {
  bool ok = false;
  UploadError error = UploadError::kNone;
  std::string detail;
  std::string session_id;
  int64_t chunk_size = 0;
  int64_t chunk_count = 0;

  static CreateSessionResult Failure(UploadError err, std::string detail = "") {
    CreateSessionResult r;
    r.error = err;
    r.detail = std::move(detail);
    return r;
  }
};

struct PutChunkResult {
  bool ok = false;
  UploadError error = UploadError::kNone;
  std::string detail;
  // Index was already present; the write replaced it.
  bool duplicate = false;
  int64_t received_chunks = 0;
  int64_t chunk_count = 0;
  double progress_percent = 0.0;
  SessionStatus status = SessionStatus::kPending;

  static PutChunkResult Failure(UploadError err, std::string detail = "") {
    PutChunkResult r;
    r.error = err;
    r.detail = std::move(detail);
    return r;
  }
};

struct CompleteResult {
  bool ok = false;
  UploadError error = UploadError::kNone;
  std::string detail;
  bool already_completed = false;
  // True when the group notification issued by this call fired the merge
  // trigger.
  bool merge_triggered = false;
  std::vector<int64_t> missing_indices;
  SessionStatus status = SessionStatus::kPending;
  std::string computed_hash;
  std::string group_id;

  static CompleteResult Failure(UploadError err, std::string detail = "") {
    CompleteResult r;
    r.error = err;
    r.detail = std::move(detail);
    return r;
  }
};

struct CancelSessionResult {
  bool ok = false;
  UploadError error = UploadError::kNone;
  std::string detail;
  bool already_terminal = false;
  SessionStatus status = SessionStatus::kCancelled;

  static CancelSessionResult Failure(UploadError err, std::string detail = "") {
    CancelSessionResult r;
    r.error = err;
    r.detail = std::move(detail);
    return r;
  }
};

struct ForceCancelResult {
  bool found = false;
  SessionStatus previous_status = SessionStatus::kPending;
};

struct SessionStatusResult {
  bool ok = false;
  UploadError error = UploadError::kNone;
  std::string detail;
  SessionSnapshot snapshot;

  static SessionStatusResult Failure(UploadError err, std::string detail = "") {
    SessionStatusResult r;
    r.error = err;
    r.detail = std::move(detail);
    return r;
  }
};

struct AttachResult {
  bool ok = false;
  UploadError error = UploadError::kNone;
  std::string detail;
  // Status at the instant of attachment.
  SessionStatus status = SessionStatus::kPending;

  static AttachResult Failure(UploadError err, std::string detail = "") {
    AttachResult r;
    r.error = err;
    r.detail = std::move(detail);
    return r;
  }
};

}  // namespace triptych::upload

#endif  // TRIPTYCH_UPLOAD_UPLOAD_TYPES_HPP_
