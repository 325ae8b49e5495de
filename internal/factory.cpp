#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"

namespace famgraph::factory {

using namespace famgraph;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const famgraph::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->EnsureSchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

persist::PersistenceMode ToMode(famgraph::config::PersistenceMode mode) {
  switch (mode) {
    case famgraph::config::PERSISTENCE_MODE_ASYNC:
      return persist::PersistenceMode::kAsync;
    case famgraph::config::PERSISTENCE_MODE_SYNC:
    case famgraph::config::PERSISTENCE_MODE_UNSPECIFIED:
    default:
      return persist::PersistenceMode::kSync;
  }
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const famgraph::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.writer     = std::make_shared<persist::SnapshotWriter>(app.repository, ToMode(config.persistence().mode()));

  // ------------------------------------------------------------------
  // Graph
  // ------------------------------------------------------------------
  graph::TraversalLimits limits;
  if (config.traversal().max_depth() > 0) limits.max_depth = static_cast<int>(config.traversal().max_depth());
  if (config.traversal().max_visited() > 0) limits.max_visited = config.traversal().max_visited();

  app.graph    = std::make_shared<graph::FamilyGraph>(limits);
  app.restored = app.graph->Restore(app.writer->Load());

  app.writer->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.audit = std::make_shared<audit::AuditLog>(config.audit().path());

  service::ServiceContext ctx;
  ctx.graph                         = app.graph;
  ctx.writer                        = app.writer;
  ctx.audit                         = app.audit;
  ctx.duplicates.compare_birth_date = !config.duplicates().has_compare_birth_date() || config.duplicates().compare_birth_date();
  ctx.default_view_depth            = config.traversal().default_depth() > 0 ? static_cast<int>(config.traversal().default_depth()) : 2;

  app.service = std::make_shared<service::FamilyService>(ctx);

  app.audit->Record("system", "load_tree", {observability::IntField("people", static_cast<std::int64_t>(app.restored.people_loaded)),
                                             observability::IntField("relationships", static_cast<std::int64_t>(app.restored.relationships_loaded))});

  return app;
}

} // namespace famgraph::factory
