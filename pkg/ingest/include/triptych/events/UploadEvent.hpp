// Repository: Triptych-ingest
// Component: Upload events
// Purpose: State-transition events published by the session manager and
//          the merge orchestrator, and the sink interface that receives them.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_EVENTS_UPLOAD_EVENT_HPP_
#define TRIPTYCH_EVENTS_UPLOAD_EVENT_HPP_

#include <cstdint>
#include <string>

namespace triptych::events {

enum class UploadEventType {
  kSessionCreated,
  kSessionCompleted,
  kSessionFailed,
  kSessionCancelled,
  kGroupCreated,
  kMergeTriggered,
  kMergeCompleted,
  kMergeFailed,
  kGroupCancelled,
  kSlotReplaced,
};

const char* UploadEventTypeName(UploadEventType type);
bool ParseUploadEventType(const std::string& name, UploadEventType* out);

struct UploadEvent {
  uint64_t sequence = 0;  // assigned by EventEmitter, strictly increasing
  UploadEventType type = UploadEventType::kSessionCreated;
  std::string owner_id;
  std::string group_id;
  std::string session_id;
  int32_t statement_index = -1;
  int64_t emitted_utc_ms = 0;
  std::string detail;

  // Single-line JSON (one line of the event journal).
  std::string ToJsonLine() const;
  // Returns false if the line is corrupt or truncated.
  static bool FromJsonLine(const std::string& line, UploadEvent& out);
};

// Sinks are called synchronously from the emitting thread, sometimes while
// a session or group lock is held. Implementations must not block for long
// and must never call back into the session manager or orchestrator.
class IEventSink {
 public:
  virtual ~IEventSink() = default;
  virtual void OnEvent(const UploadEvent& event) = 0;
};

}  // namespace triptych::events

#endif  // TRIPTYCH_EVENTS_UPLOAD_EVENT_HPP_
