// Repository: Triptych-ingest
// Component: Event broadcaster
// Copyright (c) 2026 Triptych

#include "triptych/events/EventBroadcaster.hpp"

#include <algorithm>

namespace triptych::events {

// =============================================================================
// Subscription
// =============================================================================

EventBroadcaster::Subscription::Subscription(Key /*key*/, std::string owner_filter,
                                             size_t capacity)
    : owner_filter_(std::move(owner_filter)), capacity_(capacity) {}

std::optional<UploadEvent> EventBroadcaster::Subscription::WaitNext(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) return std::nullopt;
  UploadEvent event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

uint64_t EventBroadcaster::Subscription::DroppedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

bool EventBroadcaster::Subscription::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

void EventBroadcaster::Subscription::Push(const UploadEvent& event) {
  if (!owner_filter_.empty() && event.owner_id != owner_filter_) return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
}

void EventBroadcaster::Subscription::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

// =============================================================================
// EventBroadcaster
// =============================================================================

EventBroadcaster::EventBroadcaster(size_t queue_capacity)
    : queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity) {}

EventBroadcaster::~EventBroadcaster() {
  CloseAll();
}

std::shared_ptr<EventBroadcaster::Subscription> EventBroadcaster::Subscribe(
    const std::string& owner_filter) {
  auto sub = std::make_shared<Subscription>(Subscription::Key(), owner_filter, queue_capacity_);
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.push_back(sub);
  return sub;
}

void EventBroadcaster::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  if (!subscription) return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(
        std::remove(subscribers_.begin(), subscribers_.end(), subscription),
        subscribers_.end());
  }
  subscription->Close();
}

void EventBroadcaster::CloseAll() {
  std::vector<std::shared_ptr<Subscription>> subs;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    subs.swap(subscribers_);
  }
  for (const auto& sub : subs) sub->Close();
}

void EventBroadcaster::OnEvent(const UploadEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& sub : subscribers_) sub->Push(event);
}

size_t EventBroadcaster::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

}  // namespace triptych::events
