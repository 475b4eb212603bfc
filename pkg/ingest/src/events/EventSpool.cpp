// Repository: Triptych-ingest
// Component: Upload event journal implementation
// Copyright (c) 2026 Triptych

#include "events/EventSpool.hpp"

#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>

#include "triptych/util/Logger.hpp"

namespace triptych::events {

using triptych::util::Logger;

EventSpool::EventSpool(const std::string& journal_dir)
    : journal_dir_(journal_dir),
      journal_path_(journal_dir + "/events.jsonl") {
  if (mkdir(journal_dir_.c_str(), 0755) != 0 && errno != EEXIST) {
    throw std::runtime_error("EventSpool: cannot create directory " + journal_dir_);
  }

  // Seed sequence tracking from an existing journal (restart).
  for (const auto& event : ReplayFrom(0)) {
    if (event.sequence > last_appended_sequence_) last_appended_sequence_ = event.sequence;
  }
  last_written_sequence_ = last_appended_sequence_;

  writer_thread_ = std::thread(&EventSpool::WriterLoop, this);
}

EventSpool::~EventSpool() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    shutdown_ = true;
  }
  queue_cv_.notify_all();
  if (writer_thread_.joinable()) writer_thread_.join();
}

void EventSpool::Append(const UploadEvent& event) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (last_appended_sequence_ != 0 && event.sequence != last_appended_sequence_ + 1) {
      throw std::runtime_error("EventSpool: sequence gap detected (expected " +
                               std::to_string(last_appended_sequence_ + 1) + ", got " +
                               std::to_string(event.sequence) + ")");
    }
    last_appended_sequence_ = event.sequence;
    write_queue_.push_back(event);
    if (write_queue_.size() < kFlushRecordsMax) return;
  }
  queue_cv_.notify_one();
}

bool EventSpool::Flush(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  const uint64_t target = last_appended_sequence_;
  queue_cv_.notify_one();
  return written_cv_.wait_for(lock, timeout, [this, target] {
    return last_written_sequence_ >= target;
  });
}

uint64_t EventSpool::LastSequence() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return last_appended_sequence_;
}

void EventSpool::WriterLoop() {
  while (true) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, std::chrono::milliseconds(kFlushIntervalMs), [this] {
      return shutdown_ || !write_queue_.empty();
    });
    if (shutdown_ && write_queue_.empty()) break;
    std::vector<UploadEvent> batch;
    batch.swap(write_queue_);
    lock.unlock();

    if (batch.empty()) continue;

    bool ok = false;
    {
      std::ofstream of(journal_path_, std::ios::app);
      if (of) {
        for (const auto& event : batch) of << event.ToJsonLine() << '\n';
        of.flush();
        ok = static_cast<bool>(of);
      }
    }
    if (!ok) {
      Logger::Error("[EventSpool] JOURNAL_WRITE_FAILED path=" + journal_path_ +
                    " dropped=" + std::to_string(batch.size()));
    }

    lock.lock();
    // Dropped batches still advance the cursor so Flush() callers do not
    // wait on events that will never be written.
    last_written_sequence_ = batch.back().sequence;
    lock.unlock();
    written_cv_.notify_all();
  }
}

std::vector<UploadEvent> EventSpool::ReplayFrom(uint64_t after_sequence) const {
  std::ifstream in(journal_path_);
  if (!in) return {};

  std::vector<UploadEvent> result;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    UploadEvent event;
    if (!UploadEvent::FromJsonLine(line, event)) continue;
    if (event.sequence > after_sequence) result.push_back(std::move(event));
  }
  return result;
}

}  // namespace triptych::events
