#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/loyalty/sweep_worker.hpp"

namespace strands::factory {

/*
  Application

  Owns everything that lives for the lifetime of the process:
  the gRPC service adapters handed to runtime::Server and the
  background sweep worker (already started).
*/
struct Application {
  std::shared_ptr<db::Repository>                   repository;
  std::vector<std::unique_ptr<::grpc::Service>>     grpc_services;
  std::shared_ptr<loyalty::SweepWorker>             sweep_worker;
};

/*
  Build

  Composition root. The only place that knows concrete repository
  and notification sink types.
*/
Application Build(const strands::runtime::config::RuntimeConfig& config);

// Exposed for tests and tools: repository with schema applied.
std::shared_ptr<db::Repository> BuildRepository(const strands::runtime::config::RuntimeConfig& config);

} // namespace strands::factory
