// Repository: Triptych-ingest
// Component: Upload event journal (durable, crash-resilient)
// Purpose: Append-only JSONL journal of upload events written by a
//          dedicated thread; replayed to late SubscribeEvents callers.
// Copyright (c) 2026 Triptych

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "triptych/events/UploadEvent.hpp"

namespace triptych::events {

// Path: <journal_dir>/events.jsonl
class EventSpool : public IEventSink {
 public:
  static constexpr int kFlushIntervalMs = 250;
  static constexpr size_t kFlushRecordsMax = 50;

  // Creates journal_dir if missing (throws std::runtime_error if it cannot)
  // and recovers the last persisted sequence from an existing journal.
  explicit EventSpool(const std::string& journal_dir);
  ~EventSpool() override;

  EventSpool(const EventSpool&) = delete;
  EventSpool& operator=(const EventSpool&) = delete;

  // Enqueues for write. Sequences must be contiguous; a gap throws
  // std::runtime_error.
  void Append(const UploadEvent& event);

  void OnEvent(const UploadEvent& event) override { Append(event); }

  // Blocks until everything appended so far is on disk or timeout expires.
  bool Flush(std::chrono::milliseconds timeout);

  // Events with sequence > after_sequence, in journal order. A corrupt or
  // truncated line (crash mid-write) is skipped.
  std::vector<UploadEvent> ReplayFrom(uint64_t after_sequence) const;

  // Highest sequence appended (or recovered from disk at construction).
  uint64_t LastSequence() const;

  const std::string& JournalPath() const { return journal_path_; }

 private:
  void WriterLoop();

  std::string journal_dir_;
  std::string journal_path_;

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable written_cv_;
  std::vector<UploadEvent> write_queue_;
  uint64_t last_appended_sequence_ = 0;
  uint64_t last_written_sequence_ = 0;
  bool shutdown_ = false;
  std::thread writer_thread_;
};

}  // namespace triptych::events
