// Repository: Triptych-ingest
// Component: Ingest Interface Implementation
// Copyright (c) 2026 Triptych

#include "triptych/runtime/IngestInterface.h"

#include <chrono>
#include <sstream>

#include "triptych/util/Logger.hpp"

namespace triptych::runtime {

using triptych::util::Logger;

IngestInterface::IngestInterface(std::shared_ptr<upload::UploadSessionManager> sessions,
                                 std::shared_ptr<merge::MergeGroupOrchestrator> groups,
                                 upload::MergePolicy merge_policy)
    : sessions_(std::move(sessions)),
      groups_(std::move(groups)),
      merge_policy_(merge_policy) {}

merge::InitiateGroupResult IngestInterface::InitiateGroup(
    const std::string& owner_id, const std::vector<upload::VideoDeclaration>& videos) {
  return groups_->Initiate(owner_id, videos);
}

upload::CreateSessionResult IngestInterface::CreateSession(const std::string& owner_id,
                                                           const upload::VideoDeclaration& video) {
  return sessions_->Create(owner_id, video);
}

upload::PutChunkResult IngestInterface::PutChunk(const std::string& session_id,
                                                 int64_t index,
                                                 const upload::Bytes& bytes,
                                                 const std::string& requester_id,
                                                 const std::optional<std::string>& chunk_hash) {
  return sessions_->PutChunk(session_id, index, bytes, requester_id, chunk_hash);
}

CompleteSessionResult IngestInterface::CompleteSession(
    const std::string& session_id,
    const std::optional<std::string>& declared_hash,
    const std::string& requester_id) {
  CompleteSessionResult result;
  result.session = sessions_->Complete(session_id, declared_hash, requester_id);
  if (!result.session.ok || result.session.group_id.empty()) return result;

  const std::string& group_id = result.session.group_id;
  if (result.session.merge_triggered && merge_policy_.quick_merge_grace_ms > 0) {
    const bool settled = groups_->WaitForMergeSettled(
        group_id, std::chrono::milliseconds(merge_policy_.quick_merge_grace_ms));
    std::ostringstream oss;
    oss << "[IngestInterface] QUICK_MERGE_WAIT group=" << group_id
        << " settled=" << (settled ? "true" : "false");
    Logger::Debug(oss.str());
  }

  auto status = groups_->Status(group_id, requester_id);
  if (status.ok) result.group = std::move(status.view);
  return result;
}

upload::CancelSessionResult IngestInterface::CancelSession(const std::string& session_id,
                                                           const std::string& requester_id) {
  return groups_->CancelMember(session_id, requester_id);
}

merge::CancelGroupResult IngestInterface::CancelGroup(const std::string& group_id,
                                                      const std::string& requester_id) {
  return groups_->Cancel(group_id, requester_id);
}

merge::ReplaceSlotResult IngestInterface::ReplaceSlot(const std::string& group_id,
                                                      int32_t statement_index,
                                                      const std::string& new_session_id,
                                                      const std::string& requester_id) {
  return groups_->ReplaceSlot(group_id, statement_index, new_session_id, requester_id);
}

merge::GroupStatusResult IngestInterface::GroupStatus(const std::string& group_id,
                                                      const std::string& requester_id) const {
  return groups_->Status(group_id, requester_id);
}

upload::SessionStatusResult IngestInterface::SessionStatus(const std::string& session_id,
                                                           const std::string& requester_id) const {
  return sessions_->Status(session_id, requester_id);
}

}  // namespace triptych::runtime
