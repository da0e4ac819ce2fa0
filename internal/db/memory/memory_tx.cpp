#include "memory_tx.hpp"

#include <stdexcept>

namespace trailmap::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.tx_mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::EnsureOpen() const {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  EnsureOpen();
  if (!working_) {
    working_ = repo_.committed_; // copy on first write
  }
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  EnsureOpen();
  return working_ ? *working_ : repo_.committed_;
}

void MemoryTransaction::Commit() {
  EnsureOpen();
  if (working_) {
    repo_.committed_ = std::move(*working_);
    working_.reset();
  }
  committed_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  working_.reset();
  rolled_back_ = true;
  lock_.unlock();
}

} // namespace trailmap::db::memory
