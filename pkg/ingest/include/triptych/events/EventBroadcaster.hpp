// Repository: Triptych-ingest
// Component: Event broadcaster
// Purpose: Fans upload events out to live subscribers (the SubscribeEvents
//          stream) through bounded per-subscriber queues.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_EVENTS_EVENT_BROADCASTER_HPP_
#define TRIPTYCH_EVENTS_EVENT_BROADCASTER_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "triptych/events/UploadEvent.hpp"

namespace triptych::events {

class EventBroadcaster : public IEventSink {
 public:
  static constexpr size_t kDefaultQueueCapacity = 256;

  // One subscriber's queue. When full, the oldest event is dropped so a
  // slow stream never blocks the emitting request thread.
  class Subscription {
    // Only the broadcaster can mint one, so subscriptions are always
    // registered with it.
    class Key {
      friend class EventBroadcaster;
      Key() {}
    };

   public:
    Subscription(Key key, std::string owner_filter, size_t capacity);

    // Next event, waiting up to timeout. nullopt on timeout or once closed
    // and drained.
    std::optional<UploadEvent> WaitNext(std::chrono::milliseconds timeout);

    uint64_t DroppedCount() const;
    bool IsClosed() const;

   private:
    friend class EventBroadcaster;

    void Push(const UploadEvent& event);
    void Close();

    const std::string owner_filter_;  // empty = every owner
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<UploadEvent> queue_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
  };

  explicit EventBroadcaster(size_t queue_capacity = kDefaultQueueCapacity);
  ~EventBroadcaster() override;

  EventBroadcaster(const EventBroadcaster&) = delete;
  EventBroadcaster& operator=(const EventBroadcaster&) = delete;

  std::shared_ptr<Subscription> Subscribe(const std::string& owner_filter);
  void Unsubscribe(const std::shared_ptr<Subscription>& subscription);

  // Closes every subscription; pending WaitNext calls return.
  void CloseAll();

  void OnEvent(const UploadEvent& event) override;

  size_t SubscriberCount() const;

 private:
  const size_t queue_capacity_;
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Subscription>> subscribers_;
};

}  // namespace triptych::events

#endif  // TRIPTYCH_EVENTS_EVENT_BROADCASTER_HPP_
