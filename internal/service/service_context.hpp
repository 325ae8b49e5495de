#pragma once

#include <memory>

#include "internal/graph/consistency_checker.hpp"

namespace famgraph::graph { class FamilyGraph; }
namespace famgraph::persist { class SnapshotWriter; }
namespace famgraph::audit { class AuditLog; }

namespace famgraph::service {

/*
  Dependency container shared by all services.

  writer and audit may be null (tests, read-only tools).
*/
struct ServiceContext {
  std::shared_ptr<famgraph::graph::FamilyGraph> graph;
  std::shared_ptr<famgraph::persist::SnapshotWriter> writer;
  std::shared_ptr<famgraph::audit::AuditLog> audit;

  famgraph::graph::DuplicatePolicy duplicates;
  int default_view_depth = 2;
};

}
