#pragma once

#include <cstddef>
#include <memory>

namespace trailmap::db { class Repository; }
namespace trailmap::graph { class GraphStore; class CycleGuard; }
namespace trailmap::progress { class ProgressOverlay; class StatusMachine; }
namespace trailmap::blocking { class BlockingResolver; }
namespace trailmap::readiness { class ReadinessRanker; }

namespace trailmap::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<trailmap::db::Repository>            repository;
  std::shared_ptr<trailmap::graph::GraphStore>         graph;
  std::shared_ptr<trailmap::graph::CycleGuard>         cycles;
  std::shared_ptr<trailmap::progress::ProgressOverlay> overlay;
  std::shared_ptr<trailmap::progress::StatusMachine>   status_machine;
  std::shared_ptr<trailmap::blocking::BlockingResolver> blocking;
  std::shared_ptr<trailmap::readiness::ReadinessRanker> ranker;

  // applied when a ready-work request leaves the limit at 0
  std::size_t default_ready_limit = 0;
};

} // namespace trailmap::service
