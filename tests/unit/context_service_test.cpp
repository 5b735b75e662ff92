#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/build_scheduler.hpp"
#include "internal/cache/build_worker.hpp"
#include "internal/cache/context_cache.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/documents/document_store.hpp"
#include "internal/engine/in_memory_context_builder.hpp"
#include "internal/service/context_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/session/session_registry.hpp"
#include "internal/util/errors.hpp"
#include "kag/context/v1.hpp"

namespace {

using namespace kag::context::v1;

struct Fixture {
  Fixture() {
    for (int i = 0; i < 2; ++i) {
      workers.push_back(std::make_unique<kag::cache::BuildWorker>(scheduler));
      workers.back()->Start();
    }
    cache = std::make_shared<kag::cache::ContextCache>(registry, documents, builder, scheduler, kag::cache::ContextCacheOptions{});

    kag::service::ServiceContext ctx;
    ctx.registry  = registry;
    ctx.cache     = cache;
    ctx.documents = documents;
    service       = std::make_unique<kag::service::ContextService>(ctx);
  }

  ~Fixture() {
    for (auto& worker : workers) worker->Stop();
  }

  std::string Upload(const std::string& user_id, const std::string& text, const std::string& document_id = {}) {
    UploadDocumentRequest req;
    req.set_user_id(user_id);
    req.set_name("doc.txt");
    req.set_text(text);
    req.set_document_id(document_id);
    const auto resp = service->UploadDocument(req);
    assert(resp.accepted());
    return resp.document_id();
  }

  PrepareContextResponse Prepare(const std::string& session_id, const std::string& user_id, const std::vector<std::string>& ids) {
    PrepareContextRequest req;
    req.set_session_id(session_id);
    req.set_user_id(user_id);
    for (const auto& id : ids) req.add_document_ids(id);
    return service->PrepareContext(req);
  }

  std::shared_ptr<kag::session::SessionRegistry>       registry  = std::make_shared<kag::session::SessionRegistry>();
  std::shared_ptr<kag::documents::DocumentStore>       documents = std::make_shared<kag::documents::DocumentStore>(
      std::make_shared<kag::db::memory::MemoryRepository>(), kag::documents::TextSplitter(64, 8));
  std::shared_ptr<kag::engine::InMemoryContextBuilder> builder   = std::make_shared<kag::engine::InMemoryContextBuilder>();
  std::shared_ptr<kag::cache::BuildScheduler>          scheduler = std::make_shared<kag::cache::BuildScheduler>();
  std::vector<std::unique_ptr<kag::cache::BuildWorker>> workers;
  std::shared_ptr<kag::cache::ContextCache>            cache;
  std::unique_ptr<kag::service::ContextService>        service;
};

template <typename E>
bool ThrowsAs(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestPrepareGeneratesSessionIdAndBuilds() {
  Fixture f;
  const auto doc = f.Upload("u1", "alpha beta gamma");

  const auto resp = f.Prepare("", "u1", {doc});
  assert(!resp.session_id().empty());
  assert(resp.context_ready());
  assert(!resp.stale());
  assert(resp.context().document_ids_size() == 1);
  assert(resp.context().document_ids(0) == doc);
  assert(resp.context().segment_count() == 1);
  assert(f.builder->BuildCount() == 1);

  GetContextRequest get;
  get.set_session_id(resp.session_id());
  assert(f.service->GetContext(get).found());
}

void TestPrepareWithoutDocumentsOnlyRegistersSession() {
  Fixture f;
  const auto resp = f.Prepare("s1", "u1", {});
  assert(resp.session_id() == "s1");
  assert(!resp.context_ready());
  assert(f.registry->Get("s1").has_value());
  assert(f.builder->BuildCount() == 0);
}

void TestPrepareRequiresUser() {
  Fixture f;
  assert(ThrowsAs<kag::util::InvalidArgument>([&] { (void)f.Prepare("s1", "", {"d"}); }));
}

void TestForeignDocumentsYieldNoContent() {
  Fixture f;
  const auto doc = f.Upload("owner", "private notes");
  assert(ThrowsAs<kag::util::NoContent>([&] { (void)f.Prepare("s1", "intruder", {doc}); }));

  GetContextRequest get;
  get.set_session_id("s1");
  assert(!f.service->GetContext(get).found());
}

void TestFailedRebuildServesPreviousContext() {
  Fixture f;
  const auto first  = f.Upload("u1", "first document");
  const auto second = f.Upload("u1", "second document");

  assert(f.Prepare("s1", "u1", {first}).context_ready());

  f.builder->FailNextBuilds(1);
  const auto resp = f.Prepare("s1", "u1", {second});
  assert(resp.stale());
  assert(resp.context_ready());
  // the entry still describes the previous build
  assert(resp.context().document_ids_size() == 1);
  assert(resp.context().document_ids(0) == first);
}

void TestFailedFirstBuildPropagates() {
  Fixture f;
  const auto doc = f.Upload("u1", "some text");
  f.builder->FailNextBuilds(1);
  assert(ThrowsAs<kag::util::BuildError>([&] { (void)f.Prepare("s1", "u1", {doc}); }));
}

void TestClearContextKeepsSession() {
  Fixture f;
  const auto doc = f.Upload("u1", "text");
  (void)f.Prepare("s1", "u1", {doc});

  ClearContextRequest clear;
  clear.set_session_id("s1");
  f.service->ClearContext(clear);

  GetContextRequest get;
  get.set_session_id("s1");
  assert(!f.service->GetContext(get).found());
  assert(f.registry->Get("s1").has_value());
}

void TestRecordTurnAndListSessions() {
  Fixture f;
  (void)f.Prepare("s1", "u1", {});
  (void)f.Prepare("s2", "u1", {});
  (void)f.Prepare("s3", "u2", {});
  std::this_thread::sleep_for(std::chrono::milliseconds(5));

  RecordTurnRequest turn;
  turn.set_session_id("s1");
  auto* input = turn.add_input_messages();
  input->set_role("user");
  input->set_content("hello");
  turn.mutable_output_message()->set_role("assistant");
  turn.mutable_output_message()->set_content("hi");
  f.service->RecordTurn(turn);

  ListSessionsRequest list;
  list.set_user_id("u1");
  const auto sessions = f.service->ListSessions(list);
  assert(sessions.sessions_size() == 2);
  // most recently touched first
  assert(sessions.sessions(0).session_id() == "s1");
  assert(sessions.sessions(0).message_count() == 2);
  assert(sessions.sessions(1).message_count() == 0);
}

void TestDeleteSessionDropsContext() {
  Fixture f;
  const auto doc = f.Upload("u1", "text");
  (void)f.Prepare("s1", "u1", {doc});

  DeleteSessionRequest del;
  del.set_session_id("s1");
  assert(f.service->DeleteSession(del).deleted());
  assert(!f.service->DeleteSession(del).deleted());
  assert(f.cache->Get("s1") == nullptr);
}

void TestDocumentLifecycleInvalidatesContexts() {
  Fixture f;
  const auto doc = f.Upload("u1", "shared knowledge");
  (void)f.Prepare("s1", "u1", {doc});
  (void)f.Prepare("s2", "u1", {doc});

  ListDocumentsRequest list;
  list.set_user_id("u1");
  const auto listed = f.service->ListDocuments(list);
  assert(listed.documents_size() == 1);
  assert(listed.documents(0).document_id() == doc);
  assert(listed.documents(0).segment_count() == 1);

  DeleteDocumentRequest foreign;
  foreign.set_document_id(doc);
  foreign.set_user_id("u2");
  assert(!f.service->DeleteDocument(foreign).deleted());
  assert(f.cache->Get("s1") != nullptr);

  DeleteDocumentRequest del;
  del.set_document_id(doc);
  del.set_user_id("u1");
  const auto resp = f.service->DeleteDocument(del);
  assert(resp.deleted());
  assert(resp.invalidated_contexts() == 2);
  assert(f.cache->Get("s1") == nullptr);
  assert(f.cache->Get("s2") == nullptr);
}

void TestReuploadInvalidatesContexts() {
  Fixture f;
  const auto doc = f.Upload("u1", "version one", "handbook");
  assert(doc == "handbook");
  (void)f.Prepare("s1", "u1", {doc});

  (void)f.Upload("u1", "version two", "handbook");
  assert(f.cache->Get("s1") == nullptr);

  assert(f.Prepare("s1", "u1", {doc}).context_ready());
  assert(f.builder->Texts().back().find("version two") != std::string::npos);
}

void TestUploadRequiresName() {
  Fixture f;
  UploadDocumentRequest req;
  req.set_user_id("u1");
  req.set_text("body");
  assert(ThrowsAs<kag::util::InvalidArgument>([&] { (void)f.service->UploadDocument(req); }));
}

void TestStatsReportsRegistryAndCache() {
  Fixture f;
  const auto doc = f.Upload("u1", "text");
  (void)f.Prepare("s1", "u1", {doc});
  (void)f.Prepare("s1", "u1", {doc});
  (void)f.Prepare("s2", "u2", {});

  const auto stats = f.service->Stats(StatsRequest{});
  assert(stats.total_sessions() == 2);
  assert(stats.total_users() == 2);
  assert(stats.sessions_per_user().at("u1") == 1);
  assert(stats.active_contexts() == 1);
  assert(stats.total_document_bindings() == 1);
  assert(stats.per_session_document_counts().at("s1") == 1);
  assert(stats.builds() == 1);
  assert(stats.cache_hits() == 1);
  assert(stats.in_flight_builds() == 0);
}

} // namespace

int main() {
  TestPrepareGeneratesSessionIdAndBuilds();
  TestPrepareWithoutDocumentsOnlyRegistersSession();
  TestPrepareRequiresUser();
  TestForeignDocumentsYieldNoContent();
  TestFailedRebuildServesPreviousContext();
  TestFailedFirstBuildPropagates();
  TestClearContextKeepsSession();
  TestRecordTurnAndListSessions();
  TestDeleteSessionDropsContext();
  TestDocumentLifecycleInvalidatesContexts();
  TestReuploadInvalidatesContexts();
  TestUploadRequiresName();
  TestStatsReportsRegistryAndCache();

  std::cout << "kag_unit_context_service: pass\n";
  return 0;
}
