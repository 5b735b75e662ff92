#pragma once

#include <memory>

namespace kag::session {
class SessionRegistry;
}
namespace kag::cache {
class ContextCache;
}
namespace kag::documents {
class DocumentStore;
}

namespace kag::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<kag::session::SessionRegistry> registry;
  std::shared_ptr<kag::cache::ContextCache>      cache;
  std::shared_ptr<kag::documents::DocumentStore> documents;
};

} // namespace kag::service
