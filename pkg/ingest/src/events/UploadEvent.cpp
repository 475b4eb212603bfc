// Repository: Triptych-ingest
// Component: Upload events
// Copyright (c) 2026 Triptych

#include "triptych/events/UploadEvent.hpp"

#include <sstream>

#include "triptych/util/JsonLine.hpp"

namespace triptych::events {

using triptych::util::JsonEscape;

const char* UploadEventTypeName(UploadEventType type) {
  switch (type) {
    case UploadEventType::kSessionCreated:   return "SESSION_CREATED";
    case UploadEventType::kSessionCompleted: return "SESSION_COMPLETED";
    case UploadEventType::kSessionFailed:    return "SESSION_FAILED";
    case UploadEventType::kSessionCancelled: return "SESSION_CANCELLED";
    case UploadEventType::kGroupCreated:     return "GROUP_CREATED";
    case UploadEventType::kMergeTriggered:   return "MERGE_TRIGGERED";
    case UploadEventType::kMergeCompleted:   return "MERGE_COMPLETED";
    case UploadEventType::kMergeFailed:      return "MERGE_FAILED";
    case UploadEventType::kGroupCancelled:   return "GROUP_CANCELLED";
    case UploadEventType::kSlotReplaced:     return "SLOT_REPLACED";
  }
  return "UNKNOWN";
}

bool ParseUploadEventType(const std::string& name, UploadEventType* out) {
  static const UploadEventType kAll[] = {
      UploadEventType::kSessionCreated, UploadEventType::kSessionCompleted,
      UploadEventType::kSessionFailed,  UploadEventType::kSessionCancelled,
      UploadEventType::kGroupCreated,   UploadEventType::kMergeTriggered,
      UploadEventType::kMergeCompleted, UploadEventType::kMergeFailed,
      UploadEventType::kGroupCancelled, UploadEventType::kSlotReplaced};
  for (UploadEventType t : kAll) {
    if (name == UploadEventTypeName(t)) {
      *out = t;
      return true;
    }
  }
  return false;
}

std::string UploadEvent::ToJsonLine() const {
  std::ostringstream o;
  o << "{\"sequence\":" << sequence
    << ",\"type\":\"" << UploadEventTypeName(type) << "\""
    << ",\"owner_id\":\"" << JsonEscape(owner_id) << "\""
    << ",\"group_id\":\"" << JsonEscape(group_id) << "\""
    << ",\"session_id\":\"" << JsonEscape(session_id) << "\""
    << ",\"statement_index\":" << statement_index
    << ",\"emitted_utc_ms\":" << emitted_utc_ms
    << ",\"detail\":\"" << JsonEscape(detail) << "\""
    << "}";
  return o.str();
}

bool UploadEvent::FromJsonLine(const std::string& line, UploadEvent& out) {
  if (!util::LooksLikeJsonObject(line)) return false;
  size_t pos = 0;
  std::string type_name;
  int64_t statement_index = -1;
  if (!util::ParseJsonUint64Value(line, "sequence", &pos, &out.sequence)) return false;
  if (!util::ParseJsonStringValue(line, "type", &pos, &type_name)) return false;
  if (!ParseUploadEventType(type_name, &out.type)) return false;
  if (!util::ParseJsonStringValue(line, "owner_id", &pos, &out.owner_id)) return false;
  if (!util::ParseJsonStringValue(line, "group_id", &pos, &out.group_id)) return false;
  if (!util::ParseJsonStringValue(line, "session_id", &pos, &out.session_id)) return false;
  if (!util::ParseJsonInt64Value(line, "statement_index", &pos, &statement_index)) return false;
  out.statement_index = static_cast<int32_t>(statement_index);
  if (!util::ParseJsonInt64Value(line, "emitted_utc_ms", &pos, &out.emitted_utc_ms)) return false;
  if (!util::ParseJsonStringValue(line, "detail", &pos, &out.detail)) return false;
  return true;
}

}  // namespace triptych::events
