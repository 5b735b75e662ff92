#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/context_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"
#include "kag/context/v1.hpp"

namespace {

using namespace kag::context::v1;

void TestErrorMapping() {
  using kag::grpc::ToStatus;
  assert(ToStatus(kag::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(kag::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(kag::util::NoContent("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(kag::util::BuildTimeout("x")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatus(kag::util::BuildError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(kag::util::PermissionDenied("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(kag::util::NotFound("missing session")).error_message() == "missing session");
}

struct ServerFixture {
  ServerFixture() : runtime(kag::factory::Build(kag::config::ConfigLoader::LoadDefault())), server(runtime.context_service) {
  }

  ~ServerFixture() {
    runtime.Shutdown();
  }

  kag::factory::Runtime   runtime;
  kag::grpc::ContextServer server;
};

void TestPrepareWithoutUserIsInvalidArgument() {
  ServerFixture f;

  PrepareContextRequest req;
  req.set_session_id("s1");
  req.add_document_ids("d1");
  PrepareContextResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = f.server.PrepareContext(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestPrepareUnknownDocumentsIsFailedPrecondition() {
  ServerFixture f;

  PrepareContextRequest req;
  req.set_session_id("s1");
  req.set_user_id("u1");
  req.add_document_ids("does-not-exist");
  PrepareContextResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = f.server.PrepareContext(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestUploadThenPrepareSucceeds() {
  ServerFixture f;

  UploadDocumentRequest upload;
  upload.set_user_id("u1");
  upload.set_name("guide.md");
  upload.set_format("md");
  upload.set_text("Reference material for the assistant.");
  UploadDocumentResponse uploaded;
  ::grpc::ServerContext  upload_ctx;
  assert(f.server.UploadDocument(&upload_ctx, &upload, &uploaded).ok());
  assert(uploaded.accepted());

  PrepareContextRequest req;
  req.set_user_id("u1");
  req.add_document_ids(uploaded.document_id());
  PrepareContextResponse resp;
  ::grpc::ServerContext  grpc_ctx;
  assert(f.server.PrepareContext(&grpc_ctx, &req, &resp).ok());
  assert(resp.context_ready());

  GetContextRequest get;
  get.set_session_id(resp.session_id());
  GetContextResponse    got;
  ::grpc::ServerContext get_ctx;
  assert(f.server.GetContext(&get_ctx, &get, &got).ok());
  assert(got.found());
}

void TestGetContextWithoutSessionIsInvalidArgument() {
  ServerFixture f;

  GetContextRequest     req;
  GetContextResponse    resp;
  ::grpc::ServerContext grpc_ctx;
  assert(f.server.GetContext(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestErrorMapping();
  TestPrepareWithoutUserIsInvalidArgument();
  TestPrepareUnknownDocumentsIsFailedPrecondition();
  TestUploadThenPrepareSucceeds();
  TestGetContextWithoutSessionIsInvalidArgument();

  std::cout << "kag_unit_grpc_status: pass\n";
  return 0;
}
