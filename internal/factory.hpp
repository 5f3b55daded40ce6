#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/orchestrator/orchestrator.hpp"
#include "internal/queue/build_queue.hpp"
#include "internal/registry/registry_index.hpp"
#include "internal/sandbox/doc_builder.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/query_service.hpp"
#include "internal/sync/index_sync.hpp"

namespace docbuild::factory {

/*
  Application

  Owns all long-lived components. Everything here lives for the lifetime
  of the process. The RPC transport is attached by the caller so that this
  graph builds without gRPC.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<queue::BuildQueue>          queue;
  std::shared_ptr<registry::RegistryIndex>    index;
  std::shared_ptr<sync::IndexSync>            sync;
  std::shared_ptr<sandbox::DocBuilder>        builder; // null when no build command is configured
  std::shared_ptr<orchestrator::Orchestrator> orchestrator;

  std::shared_ptr<service::AdminService> admin_service;
  std::shared_ptr<service::QueryService> query_service;
};

/*
  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const docbuild::runtime::config::RuntimeConfig& config);

// Builds the graph without starting any thread.
Application Build(const docbuild::runtime::config::RuntimeConfig& config);

} // namespace docbuild::factory
