#include "internal/progress/progress_overlay.hpp"

#include <stdexcept>

namespace trailmap::progress {

ProgressOverlay::ProgressOverlay(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::ProgressRecord ProgressOverlay::Resolve(const std::optional<db::model::ProgressRecord>& stored, const std::string& task_id,
                                                   const std::string& learner_id) {
  if (stored) return *stored;

  db::model::ProgressRecord record;
  record.task_id    = task_id;
  record.learner_id = learner_id;
  record.status     = model::TaskStatus::kOpen;
  return record;
}

db::model::ProgressRecord ProgressOverlay::GetOrDefault(db::Transaction& tx, const std::string& task_id, const std::string& learner_id) const {
  return Resolve(repository_->GetProgress(tx, task_id, learner_id), task_id, learner_id);
}

bool ProgressOverlay::IsMaterialized(db::Transaction& tx, const std::string& task_id, const std::string& learner_id) const {
  return repository_->GetProgress(tx, task_id, learner_id).has_value();
}

std::vector<db::model::ProgressRecord> ProgressOverlay::ListMaterialized(db::Transaction& tx, const std::string& learner_id,
                                                                         const std::optional<std::string>& project_id) const {
  return repository_->ListProgressByLearner(tx, learner_id, project_id);
}

void ProgressOverlay::Write(db::Transaction& tx, const db::model::ProgressRecord& record) {
  auto result = repository_->UpsertProgress(tx, record);
  if (!result) {
    throw std::runtime_error("upsert progress " + record.task_id + "/" + record.learner_id + ": " + result.message);
  }
}

// ------------------------------------------------------------------
// LearnerStatusView
// ------------------------------------------------------------------

LearnerStatusView::LearnerStatusView(const ProgressOverlay& overlay, db::Transaction& tx, std::string learner_id)
    : overlay_(overlay), tx_(tx), learner_id_(std::move(learner_id)) {
}

void LearnerStatusView::Preload() {
  for (const auto& record : overlay_.ListMaterialized(tx_, learner_id_)) {
    memo_[record.task_id] = record.status;
  }
  preloaded_ = true;
}

model::TaskStatus LearnerStatusView::StatusOf(const std::string& task_id) {
  if (auto it = memo_.find(task_id); it != memo_.end()) {
    return it->second;
  }

  const auto status = preloaded_ ? ProgressOverlay::Resolve(std::nullopt, task_id, learner_id_).status
                                 : overlay_.GetOrDefault(tx_, task_id, learner_id_).status;
  memo_.emplace(task_id, status);
  return status;
}

} // namespace trailmap::progress
