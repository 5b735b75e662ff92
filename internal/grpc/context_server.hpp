#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/context_service.hpp"
#include "kag/context/v1/context_service.grpc.pb.h"

namespace kag::grpc {

class ContextServer final : public kag::context::v1::ContextService::Service {
 public:
  explicit ContextServer(std::shared_ptr<kag::service::ContextService> svc);

  ::grpc::Status PrepareContext(::grpc::ServerContext*, const kag::context::v1::PrepareContextRequest*,
                                kag::context::v1::PrepareContextResponse*) override;
  ::grpc::Status GetContext(::grpc::ServerContext*, const kag::context::v1::GetContextRequest*, kag::context::v1::GetContextResponse*) override;
  ::grpc::Status ClearContext(::grpc::ServerContext*, const kag::context::v1::ClearContextRequest*, kag::context::v1::ClearContextResponse*) override;
  ::grpc::Status RecordTurn(::grpc::ServerContext*, const kag::context::v1::RecordTurnRequest*, kag::context::v1::RecordTurnResponse*) override;

  ::grpc::Status ListSessions(::grpc::ServerContext*, const kag::context::v1::ListSessionsRequest*, kag::context::v1::ListSessionsResponse*) override;
  ::grpc::Status DeleteSession(::grpc::ServerContext*, const kag::context::v1::DeleteSessionRequest*,
                               kag::context::v1::DeleteSessionResponse*) override;

  ::grpc::Status UploadDocument(::grpc::ServerContext*, const kag::context::v1::UploadDocumentRequest*,
                                kag::context::v1::UploadDocumentResponse*) override;
  ::grpc::Status ListDocuments(::grpc::ServerContext*, const kag::context::v1::ListDocumentsRequest*,
                               kag::context::v1::ListDocumentsResponse*) override;
  ::grpc::Status DeleteDocument(::grpc::ServerContext*, const kag::context::v1::DeleteDocumentRequest*,
                                kag::context::v1::DeleteDocumentResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const kag::context::v1::StatsRequest*, kag::context::v1::StatsResponse*) override;

 private:
  std::shared_ptr<kag::service::ContextService> service_;
};

} // namespace kag::grpc
