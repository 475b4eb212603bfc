// Repository: Triptych-ingest
// Component: Maintenance Loop
// Purpose: Periodic sweep thread: expires idle sessions, collects retained
//          terminal sessions and groups.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_RUNTIME_MAINTENANCE_LOOP_HPP_
#define TRIPTYCH_RUNTIME_MAINTENANCE_LOOP_HPP_

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "triptych/merge/MergeGroupOrchestrator.hpp"
#include "triptych/upload/UploadSessionManager.hpp"

namespace triptych::runtime {

struct SweepStats {
  size_t sessions_expired = 0;
  size_t sessions_collected = 0;
  size_t groups_collected = 0;
};

class MaintenanceLoop {
 public:
  MaintenanceLoop(std::shared_ptr<upload::UploadSessionManager> sessions,
                  std::shared_ptr<merge::MergeGroupOrchestrator> groups,
                  int64_t interval_ms);
  ~MaintenanceLoop();

  MaintenanceLoop(const MaintenanceLoop&) = delete;
  MaintenanceLoop& operator=(const MaintenanceLoop&) = delete;

  void Start();
  void Stop();

  // One sweep on the calling thread.
  SweepStats RunOnce();

 private:
  void Loop();

  std::shared_ptr<upload::UploadSessionManager> sessions_;
  std::shared_ptr<merge::MergeGroupOrchestrator> groups_;
  const int64_t interval_ms_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_ = false;  // Guarded by mutex_
  std::thread thread_;
};

}  // namespace triptych::runtime

#endif  // TRIPTYCH_RUNTIME_MAINTENANCE_LOOP_HPP_
