#pragma once

#include <cstddef>
#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/progress/close_validator.hpp"
#include "internal/service/curriculum_service.hpp"
#include "internal/service/dependency_service.hpp"
#include "internal/service/progress_service.hpp"
#include "internal/service/readiness_service.hpp"

namespace trailmap::factory {

/*
  Runtime

  Owns every long-lived object of one engine instance.
*/
struct Runtime {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<service::CurriculumService> curriculum;
  std::shared_ptr<service::DependencyService> dependencies;
  std::shared_ptr<service::ProgressService>   progress;
  std::shared_ptr<service::ReadinessService>  readiness;
};

/*
  Composition root. The only place that knows concrete repository types.
*/
std::shared_ptr<db::Repository> BuildRepository(const trailmap::runtime::config::RuntimeConfig& config);

Runtime Build(const trailmap::runtime::config::RuntimeConfig& config, std::shared_ptr<progress::CloseValidator> validator = nullptr);

// default_ready_limit 0 leaves ready work unlimited
Runtime BuildWithRepository(std::shared_ptr<db::Repository> repository, bool cache_enabled, std::size_t default_ready_limit,
                            std::shared_ptr<progress::CloseValidator> validator = nullptr);

} // namespace trailmap::factory
