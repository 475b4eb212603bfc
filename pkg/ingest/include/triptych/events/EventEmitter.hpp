// Repository: Triptych-ingest
// Component: Event emitter
// Purpose: Stamps upload events with a sequence number and timestamp and
//          fans them out to the registered sinks.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_EVENTS_EVENT_EMITTER_HPP_
#define TRIPTYCH_EVENTS_EVENT_EMITTER_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "triptych/events/UploadEvent.hpp"
#include "triptych/time/ITimeSource.hpp"

namespace triptych::events {

class EventEmitter {
 public:
  // last_sequence: highest sequence already published (e.g. recovered from
  // the journal), so numbering continues across restarts.
  explicit EventEmitter(std::shared_ptr<time::ITimeSource> time_source,
                        uint64_t last_sequence = 0);

  EventEmitter(const EventEmitter&) = delete;
  EventEmitter& operator=(const EventEmitter&) = delete;

  void AddSink(std::shared_ptr<IEventSink> sink);

  // Assigns sequence and emitted_utc_ms, then delivers to every sink in
  // registration order. Sequence assignment and delivery happen under one
  // mutex so every sink observes strictly increasing sequences.
  uint64_t Emit(UploadEvent event);

  uint64_t Emit(UploadEventType type,
                const std::string& owner_id,
                const std::string& group_id,
                const std::string& session_id,
                int32_t statement_index = -1,
                const std::string& detail = "");

  uint64_t LastSequence() const;

 private:
  std::shared_ptr<time::ITimeSource> time_source_;
  mutable std::mutex mutex_;
  uint64_t sequence_;
  std::vector<std::shared_ptr<IEventSink>> sinks_;
};

}  // namespace triptych::events

#endif  // TRIPTYCH_EVENTS_EVENT_EMITTER_HPP_
