#include "context_service.hpp"

#include <chrono>
#include <stdexcept>
#include <type_traits>

#include "internal/cache/context_cache.hpp"
#include "internal/documents/document_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/session/session_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace kag::service {

using namespace kag::context::v1;

namespace {

void RequireNonEmpty(const std::string& value, const char* field) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(field) + " is required");
  }
}

void FillContextInfo(const cache::CacheEntry& entry, ContextInfo* info) {
  for (const auto& id : entry.fingerprint) {
    info->add_document_ids(id);
  }
  *info->mutable_built_at() = util::ToProto(entry.built_at);
  info->set_build_duration_ms(static_cast<uint64_t>(entry.build_duration.count()));
  info->set_segment_count(entry.segment_count);
  info->set_estimated_tokens(entry.estimated_tokens);
}

session::ChatMessage ToSessionMessage(const ChatMessage& message) {
  return {message.role(), message.content(), message.name()};
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view session_id, Fn&& fn) {
  kag::observability::SpanScope span(route);
  if (!session_id.empty()) {
    span.SetAttribute("session.id", session_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    kag::observability::Metrics::Instance().RecordRequest(route, success);
    kag::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    KAG_LOG_ERROR("RPC failed", {kag::observability::StringField("route", route), kag::observability::StringField("error", ex.what()),
                                 kag::observability::StringField("session_id", session_id)});
    record(false);
    throw;
  }
}

} // namespace

ContextService::ContextService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.registry || !ctx_.cache || !ctx_.documents) {
    throw std::invalid_argument("ContextService: registry, cache and document store are required");
  }
}

// ------------------------------------------------------------------
// Sessions / context
// ------------------------------------------------------------------

PrepareContextResponse ContextService::PrepareContext(const PrepareContextRequest& req) {
  const std::string session_id = req.session_id().empty() ? util::NewId() : req.session_id();

  return ObserveRpc("ContextService/PrepareContext", session_id, [&] {
    RequireNonEmpty(req.user_id(), "user_id");
    ctx_.registry->GetOrCreate(session_id, req.user_id());

    bool stale = false;
    if (req.document_ids_size() > 0) {
      std::vector<std::string> ids(req.document_ids().begin(), req.document_ids().end());
      try {
        ctx_.cache->EnsureReady(session_id, ids, req.user_id());
      } catch (const util::BuildError& e) {
        // a previous context is still better than none
        if (!ctx_.cache->Get(session_id)) throw;
        stale = true;
        KAG_LOG_WARN("Serving previous context after failed rebuild",
                     {kag::observability::StringField("session_id", session_id), kag::observability::StringField("error", e.what())});
      }
    }

    PrepareContextResponse resp;
    resp.set_session_id(session_id);
    resp.set_stale(stale);
    if (auto entry = ctx_.cache->Entry(session_id)) {
      resp.set_context_ready(true);
      FillContextInfo(*entry, resp.mutable_context());
    }
    return resp;
  });
}

GetContextResponse ContextService::GetContext(const GetContextRequest& req) {
  return ObserveRpc("ContextService/GetContext", req.session_id(), [&] {
    RequireNonEmpty(req.session_id(), "session_id");

    GetContextResponse resp;
    if (auto entry = ctx_.cache->Entry(req.session_id())) {
      resp.set_found(true);
      FillContextInfo(*entry, resp.mutable_context());
    }
    return resp;
  });
}

void ContextService::ClearContext(const ClearContextRequest& req) {
  ObserveRpc("ContextService/ClearContext", req.session_id(), [&] {
    RequireNonEmpty(req.session_id(), "session_id");
    ctx_.cache->Clear(req.session_id());
  });
}

void ContextService::RecordTurn(const RecordTurnRequest& req) {
  ObserveRpc("ContextService/RecordTurn", req.session_id(), [&] {
    RequireNonEmpty(req.session_id(), "session_id");

    std::vector<session::ChatMessage> inputs;
    inputs.reserve(static_cast<std::size_t>(req.input_messages_size()));
    for (const auto& message : req.input_messages()) {
      inputs.push_back(ToSessionMessage(message));
    }
    ctx_.registry->RecordTurn(req.session_id(), inputs, ToSessionMessage(req.output_message()));
  });
}

ListSessionsResponse ContextService::ListSessions(const ListSessionsRequest& req) {
  return ObserveRpc("ContextService/ListSessions", {}, [&] {
    RequireNonEmpty(req.user_id(), "user_id");

    ListSessionsResponse resp;
    for (const auto& summary : ctx_.registry->ListForUser(req.user_id())) {
      auto* out = resp.add_sessions();
      out->set_session_id(summary.id);
      out->set_user_id(summary.user_id);
      *out->mutable_created_at()       = util::ToProto(summary.created_at);
      *out->mutable_last_accessed_at() = util::ToProto(summary.last_accessed_at);
      out->set_message_count(summary.message_count);
      out->set_document_count(summary.document_count);
    }
    return resp;
  });
}

DeleteSessionResponse ContextService::DeleteSession(const DeleteSessionRequest& req) {
  return ObserveRpc("ContextService/DeleteSession", req.session_id(), [&] {
    RequireNonEmpty(req.session_id(), "session_id");

    // the cache entry goes with it through the registry's removal listener
    DeleteSessionResponse resp;
    resp.set_deleted(ctx_.registry->Delete(req.session_id()));
    return resp;
  });
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

UploadDocumentResponse ContextService::UploadDocument(const UploadDocumentRequest& req) {
  return ObserveRpc("ContextService/UploadDocument", {}, [&] {
    RequireNonEmpty(req.name(), "name");

    documents::IngestRequest ingest;
    ingest.name        = req.name();
    ingest.format      = req.format();
    ingest.user_id     = req.user_id();
    ingest.text        = req.text();
    ingest.document_id = req.document_id();

    UploadDocumentResponse resp;
    auto                   result = ctx_.documents->Ingest(ingest);
    if (!result) {
      return resp;
    }

    // replaced segments make any context built from the old ones stale
    if (!req.document_id().empty()) {
      ctx_.cache->InvalidateDocument(result->document_id);
    }

    resp.set_accepted(true);
    resp.set_document_id(result->document_id);
    resp.set_segment_count(result->segment_count);
    return resp;
  });
}

ListDocumentsResponse ContextService::ListDocuments(const ListDocumentsRequest& req) {
  return ObserveRpc("ContextService/ListDocuments", {}, [&] {
    RequireNonEmpty(req.user_id(), "user_id");

    ListDocumentsResponse resp;
    for (const auto& record : ctx_.documents->ListDocuments(req.user_id())) {
      auto* out = resp.add_documents();
      out->set_document_id(record.id);
      out->set_name(record.name);
      out->set_format(record.format);
      out->set_user_id(record.user_id);
      *out->mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
      out->set_segment_count(record.segment_count);
    }
    return resp;
  });
}

DeleteDocumentResponse ContextService::DeleteDocument(const DeleteDocumentRequest& req) {
  return ObserveRpc("ContextService/DeleteDocument", {}, [&] {
    RequireNonEmpty(req.document_id(), "document_id");
    RequireNonEmpty(req.user_id(), "user_id");

    DeleteDocumentResponse resp;
    if (!ctx_.documents->DeleteDocument(req.document_id(), req.user_id())) {
      return resp;
    }
    resp.set_deleted(true);
    resp.set_invalidated_contexts(ctx_.cache->InvalidateDocument(req.document_id()));
    return resp;
  });
}

// ------------------------------------------------------------------
// Stats
// ------------------------------------------------------------------

StatsResponse ContextService::Stats(const StatsRequest&) {
  return ObserveRpc("ContextService/Stats", {}, [&] {
    const auto registry = ctx_.registry->Stats();
    const auto cache    = ctx_.cache->Stats();

    StatsResponse resp;
    resp.set_total_sessions(registry.total_sessions);
    resp.set_total_users(registry.total_users);
    for (const auto& [user_id, count] : registry.sessions_per_user) {
      (*resp.mutable_sessions_per_user())[user_id] = count;
    }

    resp.set_active_contexts(cache.active_entries);
    resp.set_total_document_bindings(cache.total_document_bindings);
    for (const auto& [session_id, count] : cache.per_session_document_counts) {
      (*resp.mutable_per_session_document_counts())[session_id] = count;
    }
    resp.set_in_flight_builds(cache.in_flight_builds);
    resp.set_cache_hits(cache.hits);
    resp.set_cache_misses(cache.misses);
    resp.set_builds(cache.builds);
    resp.set_build_failures(cache.build_failures);
    return resp;
  });
}

} // namespace kag::service
