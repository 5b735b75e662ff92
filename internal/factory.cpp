#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/cache/build_scheduler.hpp"
#include "internal/cache/build_worker.hpp"
#include "internal/cache/context_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/documents/document_store.hpp"
#include "internal/engine/in_memory_context_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/context_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/session/session_registry.hpp"
#include "internal/session/session_sweeper.hpp"

namespace kag::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const kag::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->BootstrapSchema();
    KAG_LOG_INFO("Using sqlite document store", {kag::observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  KAG_LOG_INFO("Using in-memory document store");
  return std::make_shared<db::memory::MemoryRepository>();
}

cache::ContextCacheOptions BuildCacheOptions(const kag::runtime::config::RuntimeConfig& config) {
  cache::ContextCacheOptions options;
  options.max_context_tokens    = config.context_cache().max_context_tokens();
  options.build_timeout         = std::chrono::milliseconds(config.context_cache().build_timeout_ms());
  options.params.deterministic  = config.engine().deterministic();
  options.params.max_new_tokens = config.engine().max_new_tokens();
  return options;
}

} // namespace

void Runtime::Shutdown() {
  if (sweeper) sweeper->Stop();
  for (auto& worker : build_workers) {
    worker->Stop();
  }
}

Runtime Build(const kag::runtime::config::RuntimeConfig& config) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Documents
  // ------------------------------------------------------------------
  rt.repository = BuildRepository(config);
  rt.documents  = std::make_shared<documents::DocumentStore>(
      rt.repository, documents::TextSplitter(config.ingestion().chunk_size(), config.ingestion().chunk_overlap()));

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  rt.builder = std::make_shared<engine::InMemoryContextBuilder>(config.engine().model().empty() ? "in-memory" : config.engine().model());

  // ------------------------------------------------------------------
  // Sessions + cache
  // ------------------------------------------------------------------
  rt.registry  = std::make_shared<session::SessionRegistry>();
  rt.scheduler = std::make_shared<cache::BuildScheduler>();
  rt.cache     = std::make_shared<cache::ContextCache>(rt.registry, rt.documents, rt.builder, rt.scheduler, BuildCacheOptions(config));

  const auto threads = config.build_workers().threads() == 0 ? 1u : config.build_workers().threads();
  for (uint32_t i = 0; i < threads; ++i) {
    auto worker = std::make_shared<cache::BuildWorker>(rt.scheduler);
    worker->Start();
    rt.build_workers.push_back(std::move(worker));
  }

  rt.sweeper = std::make_shared<session::SessionSweeper>(rt.registry, std::chrono::seconds(config.sessions().timeout_seconds()),
                                                         std::chrono::seconds(config.sessions().sweep_interval_seconds()));
  rt.sweeper->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry  = rt.registry;
  ctx.cache     = rt.cache;
  ctx.documents = rt.documents;

  rt.context_service = std::make_shared<service::ContextService>(ctx);

  KAG_LOG_INFO("Runtime ready", {kag::observability::IntField("build_workers", threads),
                                 kag::observability::IntField("session_timeout_seconds", static_cast<int64_t>(config.sessions().timeout_seconds())),
                                 kag::observability::IntField("max_context_tokens", config.context_cache().max_context_tokens())});
  return rt;
}

} // namespace kag::factory
