// Repository: Triptych-ingest
// Component: Maintenance Loop Implementation
// Copyright (c) 2026 Triptych

#include "triptych/runtime/MaintenanceLoop.hpp"

#include <chrono>
#include <sstream>

#include "triptych/util/Logger.hpp"

namespace triptych::runtime {

using triptych::util::Logger;

MaintenanceLoop::MaintenanceLoop(std::shared_ptr<upload::UploadSessionManager> sessions,
                                 std::shared_ptr<merge::MergeGroupOrchestrator> groups,
                                 int64_t interval_ms)
    : sessions_(std::move(sessions)),
      groups_(std::move(groups)),
      interval_ms_(interval_ms > 0 ? interval_ms : 1000) {}

MaintenanceLoop::~MaintenanceLoop() {
  Stop();
}

void MaintenanceLoop::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) return;
  stop_ = false;
  thread_ = std::thread(&MaintenanceLoop::Loop, this);
}

void MaintenanceLoop::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

SweepStats MaintenanceLoop::RunOnce() {
  SweepStats stats;
  stats.sessions_expired = sessions_->ExpireStale();
  // Groups first: they erase their own members.
  stats.groups_collected = groups_->CollectGarbage();
  stats.sessions_collected = sessions_->CollectTerminal();
  if (stats.sessions_expired + stats.sessions_collected + stats.groups_collected > 0) {
    std::ostringstream oss;
    oss << "[MaintenanceLoop] SWEEP expired=" << stats.sessions_expired
        << " sessions_collected=" << stats.sessions_collected
        << " groups_collected=" << stats.groups_collected;
    Logger::Info(oss.str());
  }
  return stats;
}

void MaintenanceLoop::Loop() {
  Logger::Info("[MaintenanceLoop] STARTED interval_ms=" + std::to_string(interval_ms_));
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_) {
    if (cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_), [this] { return stop_; })) {
      break;
    }
    lock.unlock();
    RunOnce();
    lock.lock();
  }
  Logger::Info("[MaintenanceLoop] STOPPED");
}

}  // namespace triptych::runtime
