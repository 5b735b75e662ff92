#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace kag::db {
class Repository;
}
namespace kag::documents {
class DocumentStore;
}
namespace kag::engine {
class ContextBuilder;
}
namespace kag::session {
class SessionRegistry;
class SessionSweeper;
}
namespace kag::cache {
class BuildScheduler;
class BuildWorker;
class ContextCache;
}
namespace kag::service {
class ContextService;
}

namespace kag::factory {

/*
  Runtime

  Owns every long-lived component of the server. Built once at startup and
  handed to the transport layer; nothing here is reachable as global state.
*/
struct Runtime {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<documents::DocumentStore> documents;
  std::shared_ptr<engine::ContextBuilder>   builder;
  std::shared_ptr<session::SessionRegistry> registry;
  std::shared_ptr<cache::BuildScheduler>    scheduler;
  std::shared_ptr<cache::ContextCache>      cache;
  std::shared_ptr<service::ContextService>  context_service;

  std::vector<std::shared_ptr<cache::BuildWorker>> build_workers;
  std::shared_ptr<session::SessionSweeper>         sweeper;

  // Stops the sweeper, then drains and joins the build workers.
  void Shutdown();
};

/*
  Composition root: the only place that knows concrete repository and engine
  types. Build workers and the sweeper are started before returning.
*/
Runtime Build(const kag::runtime::config::RuntimeConfig& config);

} // namespace kag::factory
