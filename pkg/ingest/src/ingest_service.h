// Repository: Triptych-ingest
// Component: IngestControl gRPC Service Implementation
// Purpose: Implements the IngestControl service: request/response mapping
//          onto IngestInterface and the SubscribeEvents stream.
// Copyright (c) 2026 Triptych

#ifndef TRIPTYCH_INGEST_SERVICE_H_
#define TRIPTYCH_INGEST_SERVICE_H_

#include <memory>
#include <optional>
#include <string>

#include <grpcpp/grpcpp.h>

#include "ingest.grpc.pb.h"
#include "ingest.pb.h"
#include "events/EventSpool.hpp"
#include "triptych/events/EventBroadcaster.hpp"
#include "triptych/runtime/IngestInterface.h"
#include "triptych/upload/UploadTypes.hpp"

namespace triptych
{
  namespace ingest
  {

    // IngestControlImpl implements the gRPC service defined in ingest.proto.
    // This is a thin adapter that delegates to IngestInterface. The caller
    // identity comes from the "x-user-id" metadata; requests without it fail
    // with UNAUTHENTICATED before reaching the domain.
    class IngestControlImpl final : public v1::IngestControl::Service
    {
    public:
      // journal may be null (no replay for SubscribeEvents).
      IngestControlImpl(runtime::IngestInterface &interface,
                        events::EventBroadcaster &broadcaster,
                        std::shared_ptr<events::EventSpool> journal);
      ~IngestControlImpl() override;

      IngestControlImpl(const IngestControlImpl &) = delete;
      IngestControlImpl &operator=(const IngestControlImpl &) = delete;

      grpc::Status InitiateGroup(grpc::ServerContext *context,
                                 const v1::InitiateGroupRequest *request,
                                 v1::InitiateGroupResponse *response) override;

      grpc::Status CreateSession(grpc::ServerContext *context,
                                 const v1::CreateSessionRequest *request,
                                 v1::CreateSessionResponse *response) override;

      grpc::Status PutChunk(grpc::ServerContext *context,
                            const v1::PutChunkRequest *request,
                            v1::PutChunkResponse *response) override;

      grpc::Status CompleteSession(grpc::ServerContext *context,
                                   const v1::CompleteSessionRequest *request,
                                   v1::CompleteSessionResponse *response) override;

      grpc::Status CancelSession(grpc::ServerContext *context,
                                 const v1::CancelSessionRequest *request,
                                 v1::CancelSessionResponse *response) override;

      grpc::Status CancelGroup(grpc::ServerContext *context,
                               const v1::CancelGroupRequest *request,
                               v1::CancelGroupResponse *response) override;

      grpc::Status ReplaceSlot(grpc::ServerContext *context,
                               const v1::ReplaceSlotRequest *request,
                               v1::ReplaceSlotResponse *response) override;

      grpc::Status GetGroupStatus(grpc::ServerContext *context,
                                  const v1::GetGroupStatusRequest *request,
                                  v1::GroupStatus *response) override;

      grpc::Status GetSessionStatus(grpc::ServerContext *context,
                                    const v1::GetSessionStatusRequest *request,
                                    v1::SessionStatus *response) override;

      grpc::Status SubscribeEvents(grpc::ServerContext *context,
                                   const v1::SubscribeEventsRequest *request,
                                   grpc::ServerWriter<v1::UploadEvent> *writer) override;

      grpc::Status GetVersion(grpc::ServerContext *context,
                              const v1::ApiVersionRequest *request,
                              v1::ApiVersion *response) override;

    private:
      // Empty when the metadata entry is missing.
      static std::optional<std::string> CallerId(const grpc::ServerContext *context);

      static grpc::StatusCode MapError(upload::UploadError error);
      static grpc::Status ErrorStatus(upload::UploadError error, const std::string &detail,
                                      v1::ErrorInfo *info);

      runtime::IngestInterface &interface_;
      events::EventBroadcaster &broadcaster_;
      std::shared_ptr<events::EventSpool> journal_;
    };

  } // namespace ingest
} // namespace triptych

#endif // TRIPTYCH_INGEST_SERVICE_H_
