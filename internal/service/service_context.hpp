#pragma once

#include <memory>

namespace docbuild::db { class Repository; }
namespace docbuild::queue { class BuildQueue; }
namespace docbuild::sync { class IndexSync; }
namespace docbuild::orchestrator { class Orchestrator; }
namespace docbuild::registry { class NotificationVerifier; }

namespace docbuild::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<docbuild::db::Repository>               repository;
  std::shared_ptr<docbuild::queue::BuildQueue>            queue;
  std::shared_ptr<docbuild::sync::IndexSync>              sync;
  std::shared_ptr<docbuild::orchestrator::Orchestrator>   orchestrator;
  std::shared_ptr<docbuild::registry::NotificationVerifier> verifier;
};

} // namespace docbuild::service
