#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

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

namespace {

using trailmap::db::ErrorCode;
using trailmap::db::Repository;
using trailmap::db::memory::MemoryRepository;
using trailmap::db::model::DependencyRecord;
using trailmap::db::model::ProgressRecord;
using trailmap::db::model::TaskRecord;
using trailmap::model::DependencyType;
using trailmap::model::TaskStatus;
using trailmap::model::TaskType;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

TaskRecord MakeTask(const std::string& id, std::optional<std::string> parent, const std::string& project, TaskType type = TaskType::kTask) {
  TaskRecord task;
  task.id            = id;
  task.parent_id     = std::move(parent);
  task.project_id    = project;
  task.type          = type;
  task.priority      = 2;
  task.title         = "title of " + id;
  task.created_at_ms = NowMs();
  return task;
}

DependencyRecord MakeEdge(const std::string& from, const std::string& to, DependencyType type) {
  DependencyRecord edge;
  edge.task_id       = from;
  edge.depends_on_id = to;
  edge.type          = type;
  edge.created_at_ms = NowMs();
  edge.created_by    = "parity";
  return edge;
}

std::vector<std::string> Ids(const std::vector<TaskRecord>& tasks) {
  std::vector<std::string> ids;
  for (const auto& task : tasks) ids.push_back(task.id);
  return ids;
}

void VerifyTaskReadWrite(Repository& repo, const std::string& prefix) {
  const auto project = prefix + "-proj";
  auto       tx      = repo.Begin();

  assert(repo.InsertTask(*tx, MakeTask(project, std::nullopt, project, TaskType::kProject)));
  assert(repo.InsertTask(*tx, MakeTask(project + "-b", project, project)));
  assert(repo.InsertTask(*tx, MakeTask(project + "-a", project, project, TaskType::kEpic)));
  assert(repo.InsertTask(*tx, MakeTask(project + "-a.1", project + "-a", project)));

  auto root = repo.GetTask(*tx, project);
  assert(root.has_value());
  assert(!root->parent_id.has_value());
  assert(root->type == TaskType::kProject);
  assert(root->title == "title of " + project);

  auto child = repo.GetTask(*tx, project + "-a.1");
  assert(child.has_value());
  assert(child->parent_id == project + "-a");
  assert(child->project_id == project);
  assert(child->priority == 2);

  assert(!repo.GetTask(*tx, project + "-missing").has_value());

  auto listed = Ids(repo.ListTasksByProject(*tx, project));
  assert((listed == std::vector<std::string>{project, project + "-a", project + "-a.1", project + "-b"}));

  auto children = Ids(repo.ListChildTasks(*tx, project));
  assert((children == std::vector<std::string>{project + "-a", project + "-b"}));
  assert(repo.ListChildTasks(*tx, project + "-b").empty());

  auto duplicate = repo.InsertTask(*tx, MakeTask(project + "-b", project, project));
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto orphan = repo.InsertTask(*tx, MakeTask(project + "-orphan", project + "-nowhere", project));
  assert(!orphan);
  assert(orphan.code == ErrorCode::ConstraintViolation);

  bool listed_project = false;
  for (const auto& id : repo.ListProjects(*tx)) {
    listed_project = listed_project || id == project;
  }
  assert(listed_project);

  tx->Commit();
}

void VerifyDependencyReadWrite(Repository& repo, const std::string& prefix) {
  const auto project = prefix + "-deps";
  const auto a       = project + "-a";
  const auto b       = project + "-b";
  const auto c       = project + "-c";

  auto tx = repo.Begin();
  assert(repo.InsertTask(*tx, MakeTask(project, std::nullopt, project, TaskType::kProject)));
  assert(repo.InsertTask(*tx, MakeTask(a, project, project)));
  assert(repo.InsertTask(*tx, MakeTask(b, project, project)));
  assert(repo.InsertTask(*tx, MakeTask(c, project, project)));

  assert(repo.LockProjectGraph(*tx, project));

  assert(repo.InsertDependency(*tx, MakeEdge(c, b, DependencyType::kRelated)));
  assert(repo.InsertDependency(*tx, MakeEdge(c, a, DependencyType::kBlocks)));
  assert(repo.InsertDependency(*tx, MakeEdge(c, b, DependencyType::kBlocks)));
  assert(repo.InsertDependency(*tx, MakeEdge(b, a, DependencyType::kBlocks)));

  auto duplicate = repo.InsertDependency(*tx, MakeEdge(c, a, DependencyType::kBlocks));
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto dangling = repo.InsertDependency(*tx, MakeEdge(c, project + "-nowhere", DependencyType::kBlocks));
  assert(!dangling);
  assert(dangling.code == ErrorCode::ConstraintViolation);

  auto deps = repo.GetDependencies(*tx, c);
  assert(deps.size() == 3);
  assert(deps[0].depends_on_id == a && deps[0].type == DependencyType::kBlocks);
  assert(deps[1].depends_on_id == b && deps[1].type == DependencyType::kBlocks);
  assert(deps[2].depends_on_id == b && deps[2].type == DependencyType::kRelated);
  assert(deps[0].created_by == "parity");

  auto dependents = repo.GetDependents(*tx, a);
  assert(dependents.size() == 2);
  assert(dependents[0].task_id == b);
  assert(dependents[1].task_id == c);

  auto in_project = repo.ListDependenciesByProject(*tx, project);
  assert(in_project.size() == 4);
  assert(in_project[0].task_id == b);
  assert(in_project[3].task_id == c && in_project[3].type == DependencyType::kRelated);

  assert(repo.DeleteDependency(*tx, c, b, DependencyType::kRelated));
  auto missing = repo.DeleteDependency(*tx, c, b, DependencyType::kRelated);
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);
  assert(repo.GetDependencies(*tx, c).size() == 2);

  tx->Commit();

  auto check = repo.Begin();
  assert(repo.GetDependents(*check, b).size() == 1);
  check->Commit();
}

void VerifyProgressReadWrite(Repository& repo, const std::string& prefix) {
  const auto first   = prefix + "-prog1";
  const auto second  = prefix + "-prog2";
  const auto learner = prefix + "-learner";

  auto tx = repo.Begin();
  assert(repo.InsertTask(*tx, MakeTask(first, std::nullopt, first, TaskType::kProject)));
  assert(repo.InsertTask(*tx, MakeTask(first + "-t", first, first)));
  assert(repo.InsertTask(*tx, MakeTask(second, std::nullopt, second, TaskType::kProject)));

  assert(!repo.GetProgress(*tx, first + "-t", learner).has_value());

  ProgressRecord record;
  record.task_id       = first + "-t";
  record.learner_id    = learner;
  record.status        = TaskStatus::kClosed;
  record.started_at_ms = 100;
  record.completed_at_ms = 200;
  record.close_reason  = "done";
  record.updated_at_ms = 200;
  assert(repo.UpsertProgress(*tx, record));

  auto stored = repo.GetProgress(*tx, first + "-t", learner);
  assert(stored.has_value());
  assert(stored->status == TaskStatus::kClosed);
  assert(stored->started_at_ms == 100u);
  assert(stored->completed_at_ms == 200u);
  assert(stored->close_reason == "done");
  assert(!stored->reopen_reason.has_value());

  record.status = TaskStatus::kOpen;
  record.completed_at_ms.reset();
  record.close_reason.reset();
  record.reopen_reason = "redo";
  record.updated_at_ms = 300;
  assert(repo.UpsertProgress(*tx, record));

  stored = repo.GetProgress(*tx, first + "-t", learner);
  assert(stored.has_value());
  assert(stored->status == TaskStatus::kOpen);
  assert(!stored->completed_at_ms.has_value());
  assert(!stored->close_reason.has_value());
  assert(stored->reopen_reason == "redo");
  assert(stored->updated_at_ms == 300u);

  ProgressRecord other;
  other.task_id       = second;
  other.learner_id    = learner;
  other.status        = TaskStatus::kInProgress;
  other.started_at_ms = 400;
  other.updated_at_ms = 400;
  assert(repo.UpsertProgress(*tx, other));

  ProgressRecord dangling = other;
  dangling.task_id        = prefix + "-nowhere";
  auto rejected           = repo.UpsertProgress(*tx, dangling);
  assert(!rejected);
  assert(rejected.code == ErrorCode::ConstraintViolation);

  auto all = repo.ListProgressByLearner(*tx, learner, std::nullopt);
  assert(all.size() == 2);
  assert(all[0].task_id == first + "-t");
  assert(all[1].task_id == second);

  auto scoped = repo.ListProgressByLearner(*tx, learner, second);
  assert(scoped.size() == 1);
  assert(scoped[0].status == TaskStatus::kInProgress);

  assert(repo.ListProgressByLearner(*tx, learner + "-other", std::nullopt).empty());
  assert(!repo.GetProgress(*tx, first + "-t", learner + "-other").has_value());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto project = prefix + "-rollback";
  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(project, std::nullopt, project, TaskType::kProject)));
    assert(repo.GetTask(*tx, project).has_value());
    tx->Rollback();
  }

  {
    // never committed; the destructor rolls back
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(project + "-dropped", std::nullopt, project + "-dropped", TaskType::kProject)));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetTask(*check_tx, project).has_value());
  assert(!repo.GetTask(*check_tx, project + "-dropped").has_value());
  assert(repo.ListTasksByProject(*check_tx, project).empty());
  check_tx->Commit();
}

// Same learner-facing answers on top of every backend.
void VerifyEngineOnBackend(const std::shared_ptr<Repository>& repo, const std::string& prefix, bool cached) {
  auto runtime = trailmap::factory::BuildWithRepository(repo, cached, 0);

  const auto project = prefix + "-engine";
  const auto t1      = project + "-t1";
  const auto t2      = project + "-t2";
  const auto t3      = project + "-t3";
  const auto learner = prefix + "-student";

  auto add = [&](const std::string& id, std::optional<std::string> parent, TaskType type) {
    TaskRecord task;
    task.id        = id;
    task.parent_id = std::move(parent);
    task.type      = type;
    runtime.curriculum->AddTask(task);
  };
  add(project, std::nullopt, TaskType::kProject);
  add(t1, project, TaskType::kTask);
  add(t2, project, TaskType::kTask);
  add(t3, project, TaskType::kTask);

  runtime.dependencies->AddDependency({t2, t1, DependencyType::kBlocks, "parity"});
  runtime.dependencies->AddDependency({t3, t2, DependencyType::kBlocks, "parity"});

  bool rejected = false;
  try {
    runtime.dependencies->AddDependency({t1, t3, DependencyType::kBlocks, "parity"});
  } catch (const trailmap::util::CycleDetected&) {
    rejected = true;
  }
  assert(rejected);
  assert(runtime.dependencies->GetDependencies(t1).empty());

  assert(runtime.readiness->IsTaskBlocked(t3, learner).blocked);
  assert((runtime.readiness->GetBlockingChain(t3, learner) == std::vector<std::string>{t2, t1}));

  runtime.progress->StartTask(t1, learner);
  runtime.progress->CloseTask(t1, learner, std::string("finished"));
  assert(!runtime.readiness->IsTaskBlocked(t2, learner).blocked);
  assert(runtime.readiness->IsTaskBlocked(t3, learner).blocked);

  auto ready = runtime.readiness->GetReadyWork({project, learner, TaskType::kTask, 0});
  assert(ready.size() == 1);
  assert(ready[0].task.id == t2);

  runtime.progress->ReopenTask(t1, learner, "review");
  assert(runtime.readiness->IsTaskBlocked(t2, learner).blocked);
  assert(runtime.progress->GetProgress(t1, learner).status == TaskStatus::kOpen);
}

// Two engines over one store: a warm template snapshot in one must not hide
// an edge the other committed from the insert-time cycle check.
void VerifyEnginesShareStore(BackendFactory& backend, const std::shared_ptr<Repository>& repo, const std::string& prefix) {
  auto other_repo = backend.supports_restart() ? backend.make_repository() : repo;

  auto first  = trailmap::factory::BuildWithRepository(repo, true, 0);
  auto second = trailmap::factory::BuildWithRepository(other_repo, true, 0);

  const auto project = prefix + "-shared";
  const auto t1      = project + "-t1";
  const auto t2      = project + "-t2";

  auto add = [&](const std::string& id, std::optional<std::string> parent, TaskType type) {
    TaskRecord task;
    task.id        = id;
    task.parent_id = std::move(parent);
    task.type      = type;
    first.curriculum->AddTask(task);
  };
  add(project, std::nullopt, TaskType::kProject);
  add(t1, project, TaskType::kTask);
  add(t2, project, TaskType::kTask);

  assert(first.dependencies->GetDependencies(t1).empty());

  second.dependencies->AddDependency({t2, t1, DependencyType::kBlocks, "parity"});

  std::vector<std::string> path;
  try {
    first.dependencies->AddDependency({t1, t2, DependencyType::kBlocks, "parity"});
  } catch (const trailmap::util::CycleDetected& e) {
    path = e.Path();
  }
  assert((path == std::vector<std::string>{t2, t1}));

  auto audit = trailmap::factory::BuildWithRepository(repo, false, 0);
  assert(audit.dependencies->DetectCycles(project).empty());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  const auto project = prefix + "-durable";
  const auto learner = prefix + "-durable-learner";

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertTask(*tx, MakeTask(project, std::nullopt, project, TaskType::kProject)));
    assert(repo->InsertTask(*tx, MakeTask(project + "-a", project, project)));
    assert(repo->InsertTask(*tx, MakeTask(project + "-b", project, project)));
    assert(repo->InsertDependency(*tx, MakeEdge(project + "-b", project + "-a", DependencyType::kBlocks)));

    ProgressRecord progress;
    progress.task_id       = project + "-a";
    progress.learner_id    = learner;
    progress.status        = TaskStatus::kInProgress;
    progress.started_at_ms = 11;
    progress.updated_at_ms = 11;
    assert(repo->UpsertProgress(*tx, progress));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->ListTasksByProject(*tx, project).size() == 3);

  auto deps = repo->GetDependencies(*tx, project + "-b");
  assert(deps.size() == 1);
  assert(deps[0].depends_on_id == project + "-a");

  auto progress = repo->GetProgress(*tx, project + "-a", learner);
  assert(progress.has_value());
  assert(progress->status == TaskStatus::kInProgress);
  assert(progress->started_at_ms == 11u);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if TRAILMAP_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("trailmap_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<trailmap::db::sqlite::SqliteDB>(db_path);
    trailmap::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<trailmap::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if TRAILMAP_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TRAILMAP_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TRAILMAP_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<trailmap::db::postgres::PgPool>(conninfo);
    trailmap::db::postgres::BootstrapSchema(pool);
    return std::make_shared<trailmap::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();
  assert(repo->BackendName() == backend.name);

  // postgres keeps rows between runs
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyTaskReadWrite(*repo, prefix);
  VerifyDependencyReadWrite(*repo, prefix);
  VerifyProgressReadWrite(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);
  VerifyEngineOnBackend(repo, prefix + "-uncached", false);
  VerifyEngineOnBackend(repo, prefix + "-cached", true);
  VerifyEnginesShareStore(backend, repo, prefix);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TRAILMAP_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if TRAILMAP_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "trailmap_integration_repository_parity: pass\n";
  return 0;
}
