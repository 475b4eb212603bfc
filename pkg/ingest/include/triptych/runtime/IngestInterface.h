// Repository: Triptych-ingest
// Component: Ingest Interface
// Purpose: Thin adapter between the gRPC service and the upload/merge
//          domain. Adds the quick-merge grace window to CompleteSession.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_RUNTIME_INGEST_INTERFACE_H_
#define TRIPTYCH_RUNTIME_INGEST_INTERFACE_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "triptych/merge/MergeGroupOrchestrator.hpp"
#include "triptych/upload/UploadConfig.hpp"
#include "triptych/upload/UploadSessionManager.hpp"
#include "triptych/upload/UploadTypes.hpp"

namespace triptych::runtime {

// CompleteSession response: the session outcome plus, for group members,
// the group as seen after the completion callback (and after the grace
// window when this call fired the merge).
struct CompleteSessionResult {
  upload::CompleteResult session;
  std::optional<merge::GroupStatusView> group;
};

class IngestInterface {
 public:
  IngestInterface(std::shared_ptr<upload::UploadSessionManager> sessions,
                  std::shared_ptr<merge::MergeGroupOrchestrator> groups,
                  upload::MergePolicy merge_policy);

  IngestInterface(const IngestInterface&) = delete;
  IngestInterface& operator=(const IngestInterface&) = delete;

  merge::InitiateGroupResult InitiateGroup(const std::string& owner_id,
                                           const std::vector<upload::VideoDeclaration>& videos);

  upload::CreateSessionResult CreateSession(const std::string& owner_id,
                                            const upload::VideoDeclaration& video);

  upload::PutChunkResult PutChunk(const std::string& session_id,
                                  int64_t index,
                                  const upload::Bytes& bytes,
                                  const std::string& requester_id,
                                  const std::optional<std::string>& chunk_hash = std::nullopt);

  CompleteSessionResult CompleteSession(const std::string& session_id,
                                        const std::optional<std::string>& declared_hash,
                                        const std::string& requester_id);

  // Group members are cancelled through the orchestrator so the slot state
  // stays consistent; the group itself keeps waiting.
  upload::CancelSessionResult CancelSession(const std::string& session_id,
                                            const std::string& requester_id);

  merge::CancelGroupResult CancelGroup(const std::string& group_id,
                                       const std::string& requester_id);

  merge::ReplaceSlotResult ReplaceSlot(const std::string& group_id,
                                       int32_t statement_index,
                                       const std::string& new_session_id,
                                       const std::string& requester_id);

  merge::GroupStatusResult GroupStatus(const std::string& group_id,
                                       const std::string& requester_id) const;

  upload::SessionStatusResult SessionStatus(const std::string& session_id,
                                            const std::string& requester_id) const;

 private:
  std::shared_ptr<upload::UploadSessionManager> sessions_;
  std::shared_ptr<merge::MergeGroupOrchestrator> groups_;
  const upload::MergePolicy merge_policy_;
};

}  // namespace triptych::runtime

#endif  // TRIPTYCH_RUNTIME_INGEST_INTERFACE_H_
