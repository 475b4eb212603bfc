// Repository: Triptych-ingest
// Component: Ingest Runtime
// Purpose: Builds and owns the full component graph (store, event sinks,
//          session manager, orchestrator, interface, maintenance) from an
//          IngestConfig, and restores persisted state at startup.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_RUNTIME_INGEST_RUNTIME_HPP_
#define TRIPTYCH_RUNTIME_INGEST_RUNTIME_HPP_

#include <memory>

#include "triptych/events/EventBroadcaster.hpp"
#include "triptych/events/EventEmitter.hpp"
#include "triptych/merge/IVideoMerger.hpp"
#include "triptych/merge/MergeGroupOrchestrator.hpp"
#include "triptych/runtime/IngestInterface.h"
#include "triptych/runtime/MaintenanceLoop.hpp"
#include "triptych/storage/IKeyValueStore.hpp"
#include "triptych/time/ITimeSource.hpp"
#include "triptych/upload/ChunkStore.hpp"
#include "triptych/upload/UploadConfig.hpp"
#include "triptych/upload/UploadSessionManager.hpp"

namespace triptych::events {
class EventSpool;
}

namespace triptych::runtime {

class IngestRuntime {
 public:
  // Opens a FileKeyValueStore under config.storage_root and, when
  // config.event_journal_dir is set, the event journal; then restores
  // sessions and groups. Throws std::runtime_error if either directory is
  // unusable.
  IngestRuntime(const upload::IngestConfig& config,
                std::shared_ptr<merge::IVideoMerger> merger,
                std::shared_ptr<time::ITimeSource> time_source);

  // Variant over a caller-supplied store (tests).
  IngestRuntime(const upload::IngestConfig& config,
                std::shared_ptr<storage::IKeyValueStore> store,
                std::shared_ptr<merge::IVideoMerger> merger,
                std::shared_ptr<time::ITimeSource> time_source);

  ~IngestRuntime();

  IngestRuntime(const IngestRuntime&) = delete;
  IngestRuntime& operator=(const IngestRuntime&) = delete;

  // Starts the maintenance thread.
  void Start();

  // Stops maintenance, closes subscriptions and flushes the journal.
  void Shutdown();

  IngestInterface& Interface() { return *interface_; }
  upload::UploadSessionManager& Sessions() { return *sessions_; }
  merge::MergeGroupOrchestrator& Groups() { return *groups_; }
  events::EventBroadcaster& Broadcaster() { return *broadcaster_; }
  events::EventEmitter& Events() { return *emitter_; }
  MaintenanceLoop& Maintenance() { return *maintenance_; }

  // Null when no journal directory is configured.
  std::shared_ptr<events::EventSpool> Journal() const { return spool_; }

 private:
  const upload::IngestConfig config_;
  std::shared_ptr<time::ITimeSource> time_source_;
  std::shared_ptr<storage::IKeyValueStore> store_;
  std::shared_ptr<events::EventSpool> spool_;
  std::shared_ptr<events::EventBroadcaster> broadcaster_;
  std::shared_ptr<events::EventEmitter> emitter_;
  std::shared_ptr<upload::ChunkStore> chunks_;
  std::shared_ptr<upload::UploadSessionManager> sessions_;
  std::shared_ptr<merge::MergeGroupOrchestrator> groups_;
  std::unique_ptr<IngestInterface> interface_;
  std::unique_ptr<MaintenanceLoop> maintenance_;
};

}  // namespace triptych::runtime

#endif  // TRIPTYCH_RUNTIME_INGEST_RUNTIME_HPP_
