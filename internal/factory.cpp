#include "factory.hpp"

#include <stdexcept>

#include "internal/blocking/blocking_resolver.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/cycle_guard.hpp"
#include "internal/graph/graph_cache.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/progress/progress_overlay.hpp"
#include "internal/progress/status_machine.hpp"
#include "internal/readiness/readiness_ranker.hpp"
#include "internal/service/service_context.hpp"
#if TRAILMAP_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if TRAILMAP_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace trailmap::factory {

using trailmap::observability::BoolField;
using trailmap::observability::IntField;
using trailmap::observability::StringField;

namespace {

constexpr std::size_t kFallbackReadyLimit = 10;

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const trailmap::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TRAILMAP_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = sqlite.busy_timeout_ms() > 0 ? std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), static_cast<int>(sqlite.busy_timeout_ms()))
                                                  : std::make_shared<db::sqlite::SqliteDB>(sqlite.path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    TRAILMAP_LOG_INFO("Using sqlite repository", {StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TRAILMAP_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto pool = postgres.max_connections() > 0 ? std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections())
                                               : std::make_shared<db::postgres::PgPool>(postgres.connection_uri());
    db::postgres::BootstrapSchema(pool);
    TRAILMAP_LOG_INFO("Using postgres repository", {IntField("max_connections", postgres.max_connections())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  TRAILMAP_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

Runtime Build(const trailmap::runtime::config::RuntimeConfig& config, std::shared_ptr<progress::CloseValidator> validator) {
  const auto& graph_config = config.graph();
  const auto  ready_limit  = graph_config.default_ready_limit() > 0 ? static_cast<std::size_t>(graph_config.default_ready_limit()) : kFallbackReadyLimit;

  TRAILMAP_LOG_INFO("Building engine", {BoolField("graph_cache", graph_config.cache_enabled()), IntField("default_ready_limit", static_cast<std::int64_t>(ready_limit))});
  return BuildWithRepository(BuildRepository(config), graph_config.cache_enabled(), ready_limit, std::move(validator));
}

Runtime BuildWithRepository(std::shared_ptr<db::Repository> repository, bool cache_enabled, std::size_t default_ready_limit,
                            std::shared_ptr<progress::CloseValidator> validator) {
  if (!repository) {
    throw std::invalid_argument("repository is required");
  }

  // ------------------------------------------------------------------
  // Engine components
  // ------------------------------------------------------------------
  auto cache   = cache_enabled ? std::make_shared<graph::GraphCache>() : nullptr;
  auto graph   = std::make_shared<graph::GraphStore>(repository, cache);
  auto cycles  = std::make_shared<graph::CycleGuard>(graph);
  auto overlay = std::make_shared<progress::ProgressOverlay>(repository);
  if (!validator) {
    validator = std::make_shared<progress::AllowAllValidator>();
  }
  auto status_machine = std::make_shared<progress::StatusMachine>(graph, overlay, validator);
  auto blocking       = std::make_shared<blocking::BlockingResolver>(graph, overlay);
  auto ranker         = std::make_shared<readiness::ReadinessRanker>(graph, overlay, blocking);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository          = repository;
  ctx.graph               = graph;
  ctx.cycles              = cycles;
  ctx.overlay             = overlay;
  ctx.status_machine      = status_machine;
  ctx.blocking            = blocking;
  ctx.ranker              = ranker;
  ctx.default_ready_limit = default_ready_limit;

  Runtime runtime;
  runtime.repository   = std::move(repository);
  runtime.curriculum   = std::make_shared<service::CurriculumService>(ctx);
  runtime.dependencies = std::make_shared<service::DependencyService>(ctx);
  runtime.progress     = std::make_shared<service::ProgressService>(ctx);
  runtime.readiness    = std::make_shared<service::ReadinessService>(ctx);
  return runtime;
}

} // namespace trailmap::factory
