#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "kag/context/v1.hpp"
#include "kag/context/v1/context_service.grpc.pb.h"

using namespace kag::context::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  kagctl <addr> prepare <user_id> <session_id|-> [document_id...]\n"
            << "  kagctl <addr> get <session_id>\n"
            << "  kagctl <addr> clear <session_id>\n"
            << "  kagctl <addr> turn <session_id> <user_text> <assistant_text>\n"
            << "  kagctl <addr> sessions <user_id>\n"
            << "  kagctl <addr> delete-session <session_id>\n"
            << "  kagctl <addr> upload <user_id> <file> [format] [document_id]\n"
            << "  kagctl <addr> documents <user_id>\n"
            << "  kagctl <addr> delete-document <user_id> <document_id>\n"
            << "  kagctl <addr> stats\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static void PrintContext(const ContextInfo& info) {
  std::cout << "documents=";
  for (int i = 0; i < info.document_ids_size(); ++i) {
    std::cout << (i ? "," : "") << info.document_ids(i);
  }
  std::cout << "\nsegments=" << info.segment_count() << "\n";
  std::cout << "estimated_tokens=" << info.estimated_tokens() << "\n";
  std::cout << "build_ms=" << info.build_duration_ms() << "\n";
}

static std::string BaseName(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

static std::string Extension(const std::string& path) {
  const auto name = BaseName(path);
  const auto dot  = name.find_last_of('.');
  return dot == std::string::npos ? "txt" : name.substr(dot + 1);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ContextService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "prepare") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    PrepareContextRequest req;
    req.set_user_id(argv[3]);
    if (std::string(argv[4]) != "-") req.set_session_id(argv[4]);
    for (int i = 5; i < argc; ++i) {
      req.add_document_ids(argv[i]);
    }

    PrepareContextResponse resp;
    auto                   status = stub->PrepareContext(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "session=" << resp.session_id() << "\n";
    std::cout << "ready=" << (resp.context_ready() ? "true" : "false") << (resp.stale() ? " (stale)" : "") << "\n";
    if (resp.context_ready()) PrintContext(resp.context());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetContextRequest req;
    req.set_session_id(argv[3]);

    GetContextResponse resp;
    auto               status = stub->GetContext(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.found()) {
      std::cout << "no context\n";
      return 0;
    }
    PrintContext(resp.context());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "clear") {
    if (argc < 4) return 1;

    ClearContextRequest req;
    req.set_session_id(argv[3]);

    ClearContextResponse resp;
    auto                 status = stub->ClearContext(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cleared\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "turn") {
    if (argc < 6) return 1;

    RecordTurnRequest req;
    req.set_session_id(argv[3]);
    auto* input = req.add_input_messages();
    input->set_role("user");
    input->set_content(argv[4]);
    req.mutable_output_message()->set_role("assistant");
    req.mutable_output_message()->set_content(argv[5]);

    RecordTurnResponse resp;
    auto               status = stub->RecordTurn(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "recorded\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sessions") {
    if (argc < 4) return 1;

    ListSessionsRequest req;
    req.set_user_id(argv[3]);

    ListSessionsResponse resp;
    auto                 status = stub->ListSessions(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& session : resp.sessions()) {
      std::cout << session.session_id() << " messages=" << session.message_count() << " documents=" << session.document_count() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-session") {
    if (argc < 4) return 1;

    DeleteSessionRequest req;
    req.set_session_id(argv[3]);

    DeleteSessionResponse resp;
    auto                  status = stub->DeleteSession(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.deleted() ? "deleted" : "not found") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "upload") {
    if (argc < 5) return 1;

    const std::string path = argv[4];
    std::ifstream     in(path, std::ios::binary);
    if (!in) {
      std::cerr << "cannot read " << path << "\n";
      return 1;
    }
    std::ostringstream text;
    text << in.rdbuf();

    UploadDocumentRequest req;
    req.set_user_id(argv[3]);
    req.set_name(BaseName(path));
    req.set_format(argc >= 6 ? argv[5] : Extension(path));
    req.set_text(text.str());
    if (argc >= 7) req.set_document_id(argv[6]);

    UploadDocumentResponse resp;
    auto                   status = stub->UploadDocument(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.accepted()) {
      std::cout << "rejected\n";
      return 2;
    }
    std::cout << "document=" << resp.document_id() << "\nsegments=" << resp.segment_count() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "documents") {
    if (argc < 4) return 1;

    ListDocumentsRequest req;
    req.set_user_id(argv[3]);

    ListDocumentsResponse resp;
    auto                  status = stub->ListDocuments(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& document : resp.documents()) {
      std::cout << document.document_id() << " " << document.name() << " format=" << document.format()
                << " segments=" << document.segment_count() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-document") {
    if (argc < 5) return 1;

    DeleteDocumentRequest req;
    req.set_user_id(argv[3]);
    req.set_document_id(argv[4]);

    DeleteDocumentResponse resp;
    auto                   status = stub->DeleteDocument(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.deleted()) {
      std::cout << "not found\n";
      return 0;
    }
    std::cout << "deleted invalidated_contexts=" << resp.invalidated_contexts() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "sessions=" << resp.total_sessions() << "\n";
    std::cout << "users=" << resp.total_users() << "\n";
    std::cout << "active_contexts=" << resp.active_contexts() << "\n";
    std::cout << "document_bindings=" << resp.total_document_bindings() << "\n";
    std::cout << "in_flight_builds=" << resp.in_flight_builds() << "\n";
    std::cout << "cache_hits=" << resp.cache_hits() << "\n";
    std::cout << "cache_misses=" << resp.cache_misses() << "\n";
    std::cout << "builds=" << resp.builds() << "\n";
    std::cout << "build_failures=" << resp.build_failures() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
