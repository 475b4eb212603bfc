// Repository: Triptych-ingest
// Component: Recording Event Sink
// Purpose: Captures emitted upload events for contract test verification.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_TESTS_FIXTURES_RECORDING_EVENT_SINK_H_
#define TRIPTYCH_TESTS_FIXTURES_RECORDING_EVENT_SINK_H_

#include <mutex>
#include <string>
#include <vector>

#include "triptych/events/UploadEvent.hpp"

namespace triptych::tests::fixtures
{

  class RecordingEventSink : public events::IEventSink
  {
  public:
    void OnEvent(const events::UploadEvent &event) override
    {
      std::lock_guard<std::mutex> lock(mutex_);
      events_.push_back(event);
    }

    std::vector<events::UploadEvent> Events() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return events_;
    }

    size_t Count(events::UploadEventType type) const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      size_t n = 0;
      for (const auto &e : events_)
      {
        if (e.type == type)
          ++n;
      }
      return n;
    }

    // Count of events of the given type for one session.
    size_t CountFor(events::UploadEventType type, const std::string &session_id) const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      size_t n = 0;
      for (const auto &e : events_)
      {
        if (e.type == type && e.session_id == session_id)
          ++n;
      }
      return n;
    }

    void Clear()
    {
      std::lock_guard<std::mutex> lock(mutex_);
      events_.clear();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<events::UploadEvent> events_;
  };

} // namespace triptych::tests::fixtures

#endif // TRIPTYCH_TESTS_FIXTURES_RECORDING_EVENT_SINK_H_
