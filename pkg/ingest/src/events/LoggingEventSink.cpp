// Repository: Triptych-ingest
// Component: Logging event sink
// Copyright (c) 2026 Triptych

#include "triptych/events/LoggingEventSink.hpp"

#include <sstream>

#include "triptych/util/Logger.hpp"

namespace triptych::events {

using triptych::util::Logger;

void LoggingEventSink::OnEvent(const UploadEvent& event) {
  std::ostringstream oss;
  oss << "[UploadEvent] " << UploadEventTypeName(event.type)
      << " seq=" << event.sequence
      << " owner=" << event.owner_id;
  if (!event.group_id.empty()) oss << " group=" << event.group_id;
  if (!event.session_id.empty()) oss << " session=" << event.session_id;
  if (event.statement_index >= 0) oss << " statement=" << event.statement_index;
  if (!event.detail.empty()) oss << " detail=" << event.detail;

  switch (event.type) {
    case UploadEventType::kSessionFailed:
    case UploadEventType::kMergeFailed:
    case UploadEventType::kSessionCancelled:
    case UploadEventType::kGroupCancelled:
      Logger::Warn(oss.str());
      break;
    default:
      Logger::Info(oss.str());
      break;
  }
}

}  // namespace triptych::events
