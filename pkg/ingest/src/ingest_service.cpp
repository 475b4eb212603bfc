// Repository: Triptych-ingest
// Component: IngestControl gRPC Service Implementation
// Purpose: Implements the IngestControl service interface for chunked
//          uploads and merge groups.
// Copyright (c) 2026 Triptych

#include "ingest_service.h"

#include <chrono>
#include <sstream>
#include <utility>
#include <vector>

#include "triptych/merge/MergeTypes.hpp"
#include "triptych/util/Logger.hpp"

namespace triptych
{
  namespace ingest
  {

    using triptych::util::Logger;
    using upload::UploadError;

    namespace
    {
      constexpr char kApiVersion[] = "1.0.0";
      constexpr char kCallerMetadataKey[] = "x-user-id";
      constexpr auto kStreamPollInterval = std::chrono::milliseconds(250);
      constexpr auto kJournalFlushTimeout = std::chrono::milliseconds(500);

      upload::VideoDeclaration ToDeclaration(const v1::VideoDeclaration &video)
      {
        upload::VideoDeclaration out;
        out.declared_size = video.declared_size();
        out.declared_chunk_count = video.declared_chunk_count();
        out.mime_type = video.mime_type();
        out.declared_duration_ms = video.declared_duration_ms();
        if (!video.declared_hash().empty())
        {
          out.declared_hash = video.declared_hash();
        }
        return out;
      }

      std::optional<std::string> OptionalString(const std::string &value)
      {
        if (value.empty())
          return std::nullopt;
        return value;
      }

      void FillGroupStatus(const merge::GroupStatusView &view, v1::GroupStatus *out)
      {
        const merge::MergeGroupRecord &rec = view.record;
        out->set_success(true);
        out->set_group_id(rec.group_id);
        out->set_status(merge::GroupStatusName(rec.status));
        for (const auto &slot : view.slots)
        {
          auto *s = out->add_slots();
          s->set_statement_index(slot.statement_index);
          s->set_session_id(slot.session_id);
          s->set_session_status(upload::SessionStatusName(slot.session_status));
          s->set_progress_percent(slot.progress_percent);
          s->set_ready(slot.ready);
          s->set_blocked(slot.blocked);
        }
        out->set_aggregate_progress_percent(view.aggregate_progress_percent);
        out->set_merge_progress_percent(rec.merge_progress_percent);
        if (rec.has_result)
        {
          auto *result = out->mutable_result();
          result->set_output_locator(rec.result.output_locator);
          result->set_total_duration_ms(rec.result.total_duration_ms);
          for (const auto &seg : rec.result.segments)
          {
            auto *s = result->add_segments();
            s->set_statement_index(seg.statement_index);
            s->set_start_offset_ms(seg.start_offset_ms);
            s->set_end_offset_ms(seg.end_offset_ms);
          }
        }
        out->set_merge_error_code(rec.error_code);
        out->set_merge_error_message(rec.error_message);
        out->set_created_utc_ms(rec.created_utc_ms);
        out->set_updated_utc_ms(rec.updated_utc_ms);
      }

      void FillEvent(const events::UploadEvent &event, v1::UploadEvent *out)
      {
        out->set_sequence(event.sequence);
        out->set_type(events::UploadEventTypeName(event.type));
        out->set_group_id(event.group_id);
        out->set_session_id(event.session_id);
        out->set_statement_index(event.statement_index);
        out->set_emitted_utc_ms(event.emitted_utc_ms);
        out->set_detail(event.detail);
      }
    } // namespace

    IngestControlImpl::IngestControlImpl(runtime::IngestInterface &interface,
                                         events::EventBroadcaster &broadcaster,
                                         std::shared_ptr<events::EventSpool> journal)
        : interface_(interface),
          broadcaster_(broadcaster),
          journal_(std::move(journal))
    {
    }

    IngestControlImpl::~IngestControlImpl() = default;

    std::optional<std::string> IngestControlImpl::CallerId(const grpc::ServerContext *context)
    {
      const auto &metadata = context->client_metadata();
      auto it = metadata.find(kCallerMetadataKey);
      if (it == metadata.end() || it->second.empty())
        return std::nullopt;
      return std::string(it->second.data(), it->second.size());
    }

    grpc::StatusCode IngestControlImpl::MapError(UploadError error)
    {
      switch (error)
      {
      case UploadError::kNone:
        return grpc::StatusCode::OK;
      case UploadError::kInvalidMetadata:
      case UploadError::kChunkSizeMismatch:
        return grpc::StatusCode::INVALID_ARGUMENT;
      case UploadError::kIndexOutOfRange:
        return grpc::StatusCode::OUT_OF_RANGE;
      case UploadError::kInvalidState:
      case UploadError::kIncomplete:
      case UploadError::kSessionExpired:
      case UploadError::kDuplicate:
      case UploadError::kAlreadyTriggered:
        return grpc::StatusCode::FAILED_PRECONDITION;
      case UploadError::kIntegrityError:
        return grpc::StatusCode::DATA_LOSS;
      case UploadError::kAccessDenied:
        return grpc::StatusCode::PERMISSION_DENIED;
      case UploadError::kNotFound:
        return grpc::StatusCode::NOT_FOUND;
      case UploadError::kQuotaExceeded:
        return grpc::StatusCode::RESOURCE_EXHAUSTED;
      case UploadError::kMergeFailure:
      case UploadError::kStorageError:
        return grpc::StatusCode::INTERNAL;
      }
      return grpc::StatusCode::UNKNOWN;
    }

    grpc::Status IngestControlImpl::ErrorStatus(UploadError error, const std::string &detail,
                                                v1::ErrorInfo *info)
    {
      info->set_code(upload::UploadErrorCode(error));
      info->set_name(upload::UploadErrorName(error));
      info->set_message(detail);
      return grpc::Status(MapError(error), std::string(upload::UploadErrorName(error)) + ": " + detail);
    }

    grpc::Status IngestControlImpl::InitiateGroup(grpc::ServerContext *context,
                                                  const v1::InitiateGroupRequest *request,
                                                  v1::InitiateGroupResponse *response)
    {
      auto caller = CallerId(context);
      if (!caller)
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "missing x-user-id");

      std::vector<upload::VideoDeclaration> videos;
      for (const auto &video : request->videos())
        videos.push_back(ToDeclaration(video));

      auto result = interface_.InitiateGroup(*caller, videos);
      response->set_success(result.ok);
      if (!result.ok)
        return ErrorStatus(result.error, result.detail, response->mutable_error());

      response->set_group_id(result.group_id);
      for (const auto &slot : result.slots)
      {
        auto *s = response->add_slots();
        s->set_statement_index(slot.statement_index);
        s->set_session_id(slot.session_id);
        s->set_chunk_size(slot.chunk_size);
        s->set_chunk_count(slot.chunk_count);
      }
      return grpc::Status::OK;
    }

    grpc::Status IngestControlImpl::CreateSession(grpc::ServerContext *context,
                                                  const v1::CreateSessionRequest *request,
                                                  v1::CreateSessionResponse *response)
    {
      auto caller = CallerId(context);
      if (!caller)
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "missing x-user-id");

      auto result = interface_.CreateSession(*caller, ToDeclaration(request->video()));
      response->set_success(result.ok);
      if (!result.ok)
        return ErrorStatus(result.error, result.detail, response->mutable_error());

      response->set_session_id(result.session_id);
      response->set_chunk_size(result.chunk_size);
      response->set_chunk_count(result.chunk_count);
      return grpc::Status::OK;
    }

    grpc::Status IngestControlImpl::PutChunk(grpc::ServerContext *context,
                                             const v1::PutChunkRequest *request,
                                             v1::PutChunkResponse *response)
    {
      auto caller = CallerId(context);
      if (!caller)
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "missing x-user-id");

      const std::string &data = request->data();
      upload::Bytes bytes(data.begin(), data.end());
      auto result = interface_.PutChunk(request->session_id(), request->index(), bytes, *caller,
                                        OptionalString(request->chunk_hash()));
      response->set_success(result.ok);
      if (!result.ok)
        return ErrorStatus(result.error, result.detail, response->mutable_error());

      response->set_duplicate(result.duplicate);
      response->set_received_chunks(result.received_chunks);
      response->set_chunk_count(result.chunk_count);
      response->set_progress_percent(result.progress_percent);
      response->set_status(upload::SessionStatusName(result.status));
      return grpc::Status::OK;
    }

    grpc::Status IngestControlImpl::CompleteSession(grpc::ServerContext *context,
                                                    const v1::CompleteSessionRequest *request,
                                                    v1::CompleteSessionResponse *response)
    {
      auto caller = CallerId(context);
      if (!caller)
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "missing x-user-id");

      auto result = interface_.CompleteSession(request->session_id(),
                                               OptionalString(request->declared_hash()), *caller);
      const upload::CompleteResult &session = result.session;
      response->set_success(session.ok);
      for (int64_t index : session.missing_indices)
        response->add_missing_indices(index);
      if (!session.ok)
      {
        std::string detail = session.detail;
        if (!session.missing_indices.empty())
        {
          std::ostringstream oss;
          oss << detail << " (missing:";
          for (int64_t index : session.missing_indices)
            oss << " " << index;
          oss << ")";
          detail = oss.str();
        }
        return ErrorStatus(session.error, detail, response->mutable_error());
      }

      response->set_already_completed(session.already_completed);
      response->set_status(upload::SessionStatusName(session.status));
      response->set_computed_hash(session.computed_hash);
      response->set_merge_triggered(session.merge_triggered);
      if (result.group)
        FillGroupStatus(*result.group, response->mutable_group());
      return grpc::Status::OK;
    }

    grpc::Status IngestControlImpl::CancelSession(grpc::ServerContext *context,
                                                  const v1::CancelSessionRequest *request,
                                                  v1::CancelSessionResponse *response)
    {
      auto caller = CallerId(context);
      if (!caller)
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "missing x-user-id");

      auto result = interface_.CancelSession(request->session_id(), *caller);
      response->set_success(result.ok);
      if (!result.ok)
        return ErrorStatus(result.error, result.detail, response->mutable_error());

      response->set_already_terminal(result.already_terminal);
      response->set_status(upload::SessionStatusName(result.status));
      return grpc::Status::OK;
    }

    grpc::Status IngestControlImpl::CancelGroup(grpc::ServerContext *context,
                                                const v1::CancelGroupRequest *request,
                                                v1::CancelGroupResponse *response)
    {
      auto caller = CallerId(context);
      if (!caller)
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "missing x-user-id");

      auto result = interface_.CancelGroup(request->group_id(), *caller);
      response->set_success(result.ok);
      if (!result.ok)
        return ErrorStatus(result.error, result.detail, response->mutable_error());

      response->set_already_cancelled(result.already_cancelled);
      for (const auto &member : result.members)
      {
        auto *m = response->add_members();
        m->set_statement_index(member.statement_index);
        m->set_session_id(member.session_id);
        m->set_outcome(member.outcome);
      }
      return grpc::Status::OK;
    }

    grpc::Status IngestControlImpl::ReplaceSlot(grpc::ServerContext *context,
                                                const v1::ReplaceSlotRequest *request,
                                                v1::ReplaceSlotResponse *response)
    {
      auto caller = CallerId(context);
      if (!caller)
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "missing x-user-id");

      auto result = interface_.ReplaceSlot(request->group_id(), request->statement_index(),
                                           request->new_session_id(), *caller);
      response->set_success(result.ok);
      if (!result.ok)
        return ErrorStatus(result.error, result.detail, response->mutable_error());

      response->set_replaced_session_id(result.replaced_session_id);
      response->set_slot_ready(result.slot_ready);
      response->set_merge_triggered(result.merge_triggered);
      return grpc::Status::OK;
    }

    grpc::Status IngestControlImpl::GetGroupStatus(grpc::ServerContext *context,
                                                   const v1::GetGroupStatusRequest *request,
                                                   v1::GroupStatus *response)
    {
      auto caller = CallerId(context);
      if (!caller)
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "missing x-user-id");

      auto result = interface_.GroupStatus(request->group_id(), *caller);
      if (!result.ok)
      {
        response->set_success(false);
        return ErrorStatus(result.error, result.detail, response->mutable_error());
      }
      FillGroupStatus(result.view, response);
      return grpc::Status::OK;
    }

    grpc::Status IngestControlImpl::GetSessionStatus(grpc::ServerContext *context,
                                                     const v1::GetSessionStatusRequest *request,
                                                     v1::SessionStatus *response)
    {
      auto caller = CallerId(context);
      if (!caller)
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "missing x-user-id");

      auto result = interface_.SessionStatus(request->session_id(), *caller);
      response->set_success(result.ok);
      if (!result.ok)
        return ErrorStatus(result.error, result.detail, response->mutable_error());

      const upload::SessionSnapshot &snap = result.snapshot;
      const upload::UploadSessionRecord &rec = snap.record;
      response->set_session_id(rec.session_id);
      response->set_status(upload::SessionStatusName(rec.status));
      response->set_progress_percent(snap.progress_percent);
      for (int64_t index : snap.present_indices)
        response->add_present_indices(index);
      for (int64_t index : snap.missing_indices)
        response->add_missing_indices(index);
      response->set_declared_size(rec.declared_size);
      response->set_chunk_size(rec.chunk_size);
      response->set_chunk_count(rec.declared_chunk_count);
      response->set_mime_type(rec.mime_type);
      response->set_declared_hash(rec.declared_hash);
      response->set_computed_hash(rec.computed_hash);
      response->set_group_id(rec.group_id);
      response->set_statement_index(rec.statement_index);
      response->set_error_detail(rec.error_detail);
      response->set_created_utc_ms(rec.created_utc_ms);
      response->set_updated_utc_ms(rec.updated_utc_ms);
      response->set_completed_utc_ms(rec.completed_utc_ms);
      return grpc::Status::OK;
    }

    grpc::Status IngestControlImpl::SubscribeEvents(grpc::ServerContext *context,
                                                    const v1::SubscribeEventsRequest *request,
                                                    grpc::ServerWriter<v1::UploadEvent> *writer)
    {
      auto caller = CallerId(context);
      if (!caller)
        return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "missing x-user-id");

      // Subscribe before replaying so nothing emitted in between is lost;
      // live events already covered by the replay are skipped by sequence.
      auto subscription = broadcaster_.Subscribe(*caller);
      uint64_t last_sent = request->after_sequence();
      Logger::Info("[SubscribeEvents] OPEN owner=" + *caller +
                   " after_sequence=" + std::to_string(last_sent));

      if (journal_ && request->after_sequence() > 0)
      {
        if (!journal_->Flush(kJournalFlushTimeout))
          Logger::Warn("[SubscribeEvents] JOURNAL_FLUSH_TIMEOUT owner=" + *caller);
        for (const auto &event : journal_->ReplayFrom(request->after_sequence()))
        {
          if (event.owner_id != *caller)
            continue;
          v1::UploadEvent out;
          FillEvent(event, &out);
          if (!writer->Write(out))
          {
            broadcaster_.Unsubscribe(subscription);
            return grpc::Status::OK;
          }
          last_sent = event.sequence;
        }
      }

      while (!context->IsCancelled())
      {
        auto event = subscription->WaitNext(kStreamPollInterval);
        if (!event)
        {
          if (subscription->IsClosed())
            break;
          continue;
        }
        if (event->sequence <= last_sent)
          continue;
        v1::UploadEvent out;
        FillEvent(*event, &out);
        if (!writer->Write(out))
          break;
        last_sent = event->sequence;
      }

      const uint64_t dropped = subscription->DroppedCount();
      broadcaster_.Unsubscribe(subscription);
      std::ostringstream oss;
      oss << "[SubscribeEvents] CLOSED owner=" << *caller << " last_sequence=" << last_sent
          << " dropped=" << dropped;
      Logger::Info(oss.str());
      return grpc::Status::OK;
    }

    grpc::Status IngestControlImpl::GetVersion(grpc::ServerContext *context,
                                               const v1::ApiVersionRequest *request,
                                               v1::ApiVersion *response)
    {
      response->set_version(kApiVersion);
      return grpc::Status::OK;
    }

  } // namespace ingest
} // namespace triptych
