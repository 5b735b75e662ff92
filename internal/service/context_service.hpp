#pragma once

#include "kag/context/v1.hpp"
#include "service_context.hpp"

namespace kag::service {

/*
  Request-layer facade over the registry, cache and document store.

  Transport independent: the gRPC adapter and the tests both call it
  directly. Errors are thrown as kag::util exceptions.
*/
class ContextService {
 public:
  explicit ContextService(ServiceContext ctx);

  kag::context::v1::PrepareContextResponse PrepareContext(const kag::context::v1::PrepareContextRequest& req);
  kag::context::v1::GetContextResponse     GetContext(const kag::context::v1::GetContextRequest& req);
  void                                     ClearContext(const kag::context::v1::ClearContextRequest& req);
  void                                     RecordTurn(const kag::context::v1::RecordTurnRequest& req);

  kag::context::v1::ListSessionsResponse  ListSessions(const kag::context::v1::ListSessionsRequest& req);
  kag::context::v1::DeleteSessionResponse DeleteSession(const kag::context::v1::DeleteSessionRequest& req);

  kag::context::v1::UploadDocumentResponse UploadDocument(const kag::context::v1::UploadDocumentRequest& req);
  kag::context::v1::ListDocumentsResponse  ListDocuments(const kag::context::v1::ListDocumentsRequest& req);
  kag::context::v1::DeleteDocumentResponse DeleteDocument(const kag::context::v1::DeleteDocumentRequest& req);

  kag::context::v1::StatsResponse Stats(const kag::context::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace kag::service
