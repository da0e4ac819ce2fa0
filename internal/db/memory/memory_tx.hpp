#pragma once

#include <mutex>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace trailmap::db::memory {

/*
  Exclusive transaction over the committed state.

  Reads see the committed state until the first write, which copies it into
  a private working state. Commit swaps the working state in.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  void EnsureOpen() const;

  MemoryRepository&                      repo_;
  std::unique_lock<std::mutex>           lock_;
  std::optional<MemoryRepository::State> working_;
  bool                                   committed_   = false;
  bool                                   rolled_back_ = false;
};

} // namespace trailmap::db::memory
