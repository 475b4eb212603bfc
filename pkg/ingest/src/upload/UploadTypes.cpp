// Repository: Triptych-ingest
// Component: Upload Types
// Copyright (c) 2026 Triptych

#include "triptych/upload/UploadTypes.hpp"

#include <sstream>

#include "triptych/util/JsonLine.hpp"

namespace triptych::upload {

using triptych::util::JsonEscape;
using triptych::util::ParseJsonInt64Value;
using triptych::util::ParseJsonStringValue;

const char* SessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::kPending:   return "pending";
    case SessionStatus::kUploading: return "uploading";
    case SessionStatus::kCompleted: return "completed";
    case SessionStatus::kFailed:    return "failed";
    case SessionStatus::kCancelled: return "cancelled";
  }
  return "unknown";
}

bool ParseSessionStatus(const std::string& name, SessionStatus* out) {
  static const SessionStatus kAll[] = {
      SessionStatus::kPending, SessionStatus::kUploading, SessionStatus::kCompleted,
      SessionStatus::kFailed, SessionStatus::kCancelled};
  for (SessionStatus s : kAll) {
    if (name == SessionStatusName(s)) {
      *out = s;
      return true;
    }
  }
  return false;
}

int UploadErrorCode(UploadError error) {
  switch (error) {
    case UploadError::kNone:              return 0;
    case UploadError::kInvalidMetadata:   return 1001;
    case UploadError::kIndexOutOfRange:   return 1002;
    case UploadError::kDuplicate:         return 1003;
    case UploadError::kInvalidState:      return 1004;
    case UploadError::kIncomplete:        return 1005;
    case UploadError::kIntegrityError:    return 1006;
    case UploadError::kAccessDenied:      return 1007;
    case UploadError::kNotFound:          return 1008;
    case UploadError::kMergeFailure:      return 1009;
    case UploadError::kAlreadyTriggered:  return 1010;
    case UploadError::kChunkSizeMismatch: return 1011;
    case UploadError::kQuotaExceeded:     return 1012;
    case UploadError::kSessionExpired:    return 1013;
    case UploadError::kStorageError:      return 1014;
  }
  return -1;
}

const char* UploadErrorName(UploadError error) {
  switch (error) {
    case UploadError::kNone:              return "OK";
    case UploadError::kInvalidMetadata:   return "INVALID_METADATA";
    case UploadError::kIndexOutOfRange:   return "INDEX_OUT_OF_RANGE";
    case UploadError::kDuplicate:         return "DUPLICATE_CHUNK";
    case UploadError::kInvalidState:      return "INVALID_STATE";
    case UploadError::kIncomplete:        return "INCOMPLETE";
    case UploadError::kIntegrityError:    return "INTEGRITY_ERROR";
    case UploadError::kAccessDenied:      return "ACCESS_DENIED";
    case UploadError::kNotFound:          return "NOT_FOUND";
    case UploadError::kMergeFailure:      return "MERGE_FAILURE";
    case UploadError::kAlreadyTriggered:  return "ALREADY_TRIGGERED";
    case UploadError::kChunkSizeMismatch: return "CHUNK_SIZE_MISMATCH";
    case UploadError::kQuotaExceeded:     return "QUOTA_EXCEEDED";
    case UploadError::kSessionExpired:    return "SESSION_EXPIRED";
    case UploadError::kStorageError:      return "STORAGE_ERROR";
  }
  return "UNKNOWN";
}

std::string UploadSessionRecord::ToJsonLine() const {
  std::ostringstream o;
  o << "{\"session_id\":\"" << JsonEscape(session_id) << "\""
    << ",\"owner_id\":\"" << JsonEscape(owner_id) << "\""
    << ",\"declared_size\":" << declared_size
    << ",\"chunk_size\":" << chunk_size
    << ",\"declared_chunk_count\":" << declared_chunk_count
    << ",\"mime_type\":\"" << JsonEscape(mime_type) << "\""
    << ",\"declared_duration_ms\":" << declared_duration_ms
    << ",\"declared_hash\":\"" << JsonEscape(declared_hash) << "\""
    << ",\"computed_hash\":\"" << JsonEscape(computed_hash) << "\""
    << ",\"status\":\"" << SessionStatusName(status) << "\""
    << ",\"group_id\":\"" << JsonEscape(group_id) << "\""
    << ",\"statement_index\":" << statement_index
    << ",\"source_key\":\"" << JsonEscape(source_key) << "\""
    << ",\"error_detail\":\"" << JsonEscape(error_detail) << "\""
    << ",\"created_utc_ms\":" << created_utc_ms
    << ",\"updated_utc_ms\":" << updated_utc_ms
    << ",\"completed_utc_ms\":" << completed_utc_ms
    << "}";
  return o.str();
}

bool UploadSessionRecord::FromJsonLine(const std::string& line, UploadSessionRecord& out) {
  if (!util::LooksLikeJsonObject(line)) return false;
  size_t pos = 0;
  std::string status_name;
  int64_t statement_index = -1;
  if (!ParseJsonStringValue(line, "session_id", &pos, &out.session_id)) return false;
  if (!ParseJsonStringValue(line, "owner_id", &pos, &out.owner_id)) return false;
  if (!ParseJsonInt64Value(line, "declared_size", &pos, &out.declared_size)) return false;
  if (!ParseJsonInt64Value(line, "chunk_size", &pos, &out.chunk_size)) return false;
  if (!ParseJsonInt64Value(line, "declared_chunk_count", &pos, &out.declared_chunk_count)) return false;
  if (!ParseJsonStringValue(line, "mime_type", &pos, &out.mime_type)) return false;
  if (!ParseJsonInt64Value(line, "declared_duration_ms", &pos, &out.declared_duration_ms)) return false;
  if (!ParseJsonStringValue(line, "declared_hash", &pos, &out.declared_hash)) return false;
  if (!ParseJsonStringValue(line, "computed_hash", &pos, &out.computed_hash)) return false;
  if (!ParseJsonStringValue(line, "status", &pos, &status_name)) return false;
  if (!ParseSessionStatus(status_name, &out.status)) return false;
  if (!ParseJsonStringValue(line, "group_id", &pos, &out.group_id)) return false;
  if (!ParseJsonInt64Value(line, "statement_index", &pos, &statement_index)) return false;
  out.statement_index = static_cast<int32_t>(statement_index);
  if (!ParseJsonStringValue(line, "source_key", &pos, &out.source_key)) return false;
  if (!ParseJsonStringValue(line, "error_detail", &pos, &out.error_detail)) return false;
  if (!ParseJsonInt64Value(line, "created_utc_ms", &pos, &out.created_utc_ms)) return false;
  if (!ParseJsonInt64Value(line, "updated_utc_ms", &pos, &out.updated_utc_ms)) return false;
  if (!ParseJsonInt64Value(line, "completed_utc_ms", &pos, &out.completed_utc_ms)) return false;
  return true;
}

}  // namespace triptych::upload
