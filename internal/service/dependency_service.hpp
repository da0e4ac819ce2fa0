#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/dependency_record.hpp"
#include "internal/service/service_context.hpp"

namespace trailmap::service {

struct AddDependencyRequest {
  std::string                     task_id;
  std::string                     depends_on_id;
  trailmap::model::DependencyType type = trailmap::model::DependencyType::kBlocks;
  std::string                     created_by; // "system" when empty
};

/*
  DependencyService

  Template-graph edge writes and lookups.

  AddDependency serializes on the projects the edge touches: an in-process
  mutex per project, then the repository's project graph lock, so the cycle
  check and the insert cannot interleave with another insert on the same
  blocking subgraph, in this process or another.
*/
class DependencyService {
 public:
  explicit DependencyService(ServiceContext ctx);

  db::model::DependencyRecord AddDependency(const AddDependencyRequest& req);

  void RemoveDependency(const std::string& task_id, const std::string& depends_on_id, trailmap::model::DependencyType type);

  std::vector<db::model::DependencyRecord> GetDependencies(const std::string&                             task_id,
                                                           std::optional<trailmap::model::DependencyType> type = std::nullopt);
  std::vector<db::model::DependencyRecord> GetDependents(const std::string&                             task_id,
                                                         std::optional<trailmap::model::DependencyType> type = std::nullopt);

  bool WouldCreateCycle(const std::string& task_id, const std::string& depends_on_id);

  // diagnostic; never on a learner-facing path
  std::vector<std::vector<std::string>> DetectCycles(const std::string& project_id);

 private:
  std::shared_ptr<std::mutex> ProjectMutex(const std::string& project_id);

  ServiceContext ctx_;

  std::mutex                                                   project_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> project_mutexes_;
};

} // namespace trailmap::service
