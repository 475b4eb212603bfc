// Repository: Triptych-ingest
// Component: Logging event sink
// Purpose: One log line per upload event.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_EVENTS_LOGGING_EVENT_SINK_HPP_
#define TRIPTYCH_EVENTS_LOGGING_EVENT_SINK_HPP_

#include "triptych/events/UploadEvent.hpp"

namespace triptych::events {

// Failures and cancellations go to Warn, everything else to Info.
class LoggingEventSink : public IEventSink {
 public:
  void OnEvent(const UploadEvent& event) override;
};

}  // namespace triptych::events

#endif  // TRIPTYCH_EVENTS_LOGGING_EVENT_SINK_HPP_
