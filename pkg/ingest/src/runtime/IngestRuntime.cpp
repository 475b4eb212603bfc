// Repository: Triptych-ingest
// Component: Ingest Runtime Implementation
// Copyright (c) 2026 Triptych

#include "triptych/runtime/IngestRuntime.hpp"

#include <chrono>
#include <sstream>

#include "events/EventSpool.hpp"
#include "triptych/events/LoggingEventSink.hpp"
#include "triptych/storage/FileKeyValueStore.hpp"
#include "triptych/util/Logger.hpp"

namespace triptych::runtime {

using triptych::util::Logger;

IngestRuntime::IngestRuntime(const upload::IngestConfig& config,
                             std::shared_ptr<merge::IVideoMerger> merger,
                             std::shared_ptr<time::ITimeSource> time_source)
    : IngestRuntime(config,
                    std::make_shared<storage::FileKeyValueStore>(config.storage_root),
                    std::move(merger),
                    std::move(time_source)) {}

IngestRuntime::IngestRuntime(const upload::IngestConfig& config,
                             std::shared_ptr<storage::IKeyValueStore> store,
                             std::shared_ptr<merge::IVideoMerger> merger,
                             std::shared_ptr<time::ITimeSource> time_source)
    : config_(config),
      time_source_(std::move(time_source)),
      store_(std::move(store)) {
  uint64_t last_sequence = 0;
  if (!config_.event_journal_dir.empty()) {
    spool_ = std::make_shared<events::EventSpool>(config_.event_journal_dir);
    last_sequence = spool_->LastSequence();
  }
  broadcaster_ = std::make_shared<events::EventBroadcaster>();
  emitter_ = std::make_shared<events::EventEmitter>(time_source_, last_sequence);
  emitter_->AddSink(std::make_shared<events::LoggingEventSink>());
  if (spool_) emitter_->AddSink(spool_);
  emitter_->AddSink(broadcaster_);

  chunks_ = std::make_shared<upload::ChunkStore>(store_);
  sessions_ = std::make_shared<upload::UploadSessionManager>(
      store_, chunks_, emitter_, time_source_, config_.limits, config_.sessions);
  groups_ = std::make_shared<merge::MergeGroupOrchestrator>(
      store_, sessions_, std::move(merger), emitter_, time_source_, config_.merge,
      config_.sessions);
  interface_ = std::make_unique<IngestInterface>(sessions_, groups_, config_.merge);
  maintenance_ = std::make_unique<MaintenanceLoop>(sessions_, groups_,
                                                   config_.maintenance_interval_ms);

  const size_t sessions = sessions_->Restore();
  const size_t groups = groups_->Restore();
  std::ostringstream oss;
  oss << "[IngestRuntime] READY sessions=" << sessions << " groups=" << groups
      << " last_event_sequence=" << emitter_->LastSequence();
  Logger::Info(oss.str());
}

IngestRuntime::~IngestRuntime() {
  Shutdown();
}

void IngestRuntime::Start() {
  maintenance_->Start();
}

void IngestRuntime::Shutdown() {
  maintenance_->Stop();
  broadcaster_->CloseAll();
  if (spool_ && !spool_->Flush(std::chrono::milliseconds(2000))) {
    Logger::Warn("[IngestRuntime] JOURNAL_FLUSH_TIMEOUT");
  }
}

}  // namespace triptych::runtime
