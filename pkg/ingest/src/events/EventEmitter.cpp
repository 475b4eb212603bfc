// Repository: Triptych-ingest
// Component: Event emitter
// Copyright (c) 2026 Triptych

#include "triptych/events/EventEmitter.hpp"

#include <exception>

#include "triptych/util/Logger.hpp"

namespace triptych::events {

using triptych::util::Logger;

EventEmitter::EventEmitter(std::shared_ptr<time::ITimeSource> time_source,
                           uint64_t last_sequence)
    : time_source_(std::move(time_source)), sequence_(last_sequence) {}

void EventEmitter::AddSink(std::shared_ptr<IEventSink> sink) {
  if (!sink) return;
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.push_back(std::move(sink));
}

uint64_t EventEmitter::Emit(UploadEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  event.sequence = ++sequence_;
  event.emitted_utc_ms = time_source_->NowUtcMs();
  for (const auto& sink : sinks_) {
    // A failing sink must not abort the state transition that emitted the
    // event; the failure is logged and delivery continues.
    try {
      sink->OnEvent(event);
    } catch (const std::exception& e) {
      Logger::Error(std::string("[EventEmitter] SINK_FAILED type=") +
                    UploadEventTypeName(event.type) +
                    " seq=" + std::to_string(event.sequence) + " error=" + e.what());
    }
  }
  return event.sequence;
}

uint64_t EventEmitter::Emit(UploadEventType type,
                            const std::string& owner_id,
                            const std::string& group_id,
                            const std::string& session_id,
                            int32_t statement_index,
                            const std::string& detail) {
  UploadEvent event;
  event.type = type;
  event.owner_id = owner_id;
  event.group_id = group_id;
  event.session_id = session_id;
  event.statement_index = statement_index;
  event.detail = detail;
  return Emit(std::move(event));
}

uint64_t EventEmitter::LastSequence() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sequence_;
}

}  // namespace triptych::events
