#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/audit/audit_log.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/family_graph.hpp"
#include "internal/persist/snapshot_writer.hpp"
#include "internal/service/family_service.hpp"

namespace famgraph::factory {

/*
  Application

  Owns every long-lived object of the process. The transport layer wraps
  `service`; nothing else holds the graph.
*/
struct Application {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<graph::FamilyGraph>      graph;
  std::shared_ptr<persist::SnapshotWriter> writer;
  std::shared_ptr<audit::AuditLog>         audit;
  std::shared_ptr<service::FamilyService>  service;

  graph::RestoreStats restored;
};

/*
  Build

  Composition root: the ONLY place that knows concrete DB types. Opens the
  configured repository, restores the stored snapshot into a fresh graph and
  starts the snapshot writer.
*/
Application Build(const famgraph::config::RuntimeConfig& config);

} // namespace famgraph::factory
