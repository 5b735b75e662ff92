#include "context_server.hpp"

#include "grpc_error.hpp"

namespace kag::grpc {

using namespace kag::context::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

ContextServer::ContextServer(std::shared_ptr<kag::service::ContextService> svc) : service_(std::move(svc)) {
}

::grpc::Status ContextServer::PrepareContext(::grpc::ServerContext*, const PrepareContextRequest* req, PrepareContextResponse* resp) {
  return Handle([&] { *resp = service_->PrepareContext(*req); });
}

::grpc::Status ContextServer::GetContext(::grpc::ServerContext*, const GetContextRequest* req, GetContextResponse* resp) {
  return Handle([&] { *resp = service_->GetContext(*req); });
}

::grpc::Status ContextServer::ClearContext(::grpc::ServerContext*, const ClearContextRequest* req, ClearContextResponse*) {
  return Handle([&] { service_->ClearContext(*req); });
}

::grpc::Status ContextServer::RecordTurn(::grpc::ServerContext*, const RecordTurnRequest* req, RecordTurnResponse*) {
  return Handle([&] { service_->RecordTurn(*req); });
}

::grpc::Status ContextServer::ListSessions(::grpc::ServerContext*, const ListSessionsRequest* req, ListSessionsResponse* resp) {
  return Handle([&] { *resp = service_->ListSessions(*req); });
}

::grpc::Status ContextServer::DeleteSession(::grpc::ServerContext*, const DeleteSessionRequest* req, DeleteSessionResponse* resp) {
  return Handle([&] { *resp = service_->DeleteSession(*req); });
}

::grpc::Status ContextServer::UploadDocument(::grpc::ServerContext*, const UploadDocumentRequest* req, UploadDocumentResponse* resp) {
  return Handle([&] { *resp = service_->UploadDocument(*req); });
}

::grpc::Status ContextServer::ListDocuments(::grpc::ServerContext*, const ListDocumentsRequest* req, ListDocumentsResponse* resp) {
  return Handle([&] { *resp = service_->ListDocuments(*req); });
}

::grpc::Status ContextServer::DeleteDocument(::grpc::ServerContext*, const DeleteDocumentRequest* req, DeleteDocumentResponse* resp) {
  return Handle([&] { *resp = service_->DeleteDocument(*req); });
}

::grpc::Status ContextServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  return Handle([&] { *resp = service_->Stats(*req); });
}

} // namespace kag::grpc
