#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace jobflow::db::memory {

/*
  Transaction = snapshot + write set

  Read transactions skip the snapshot and view committed state directly.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, AccessMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Throws std::logic_error on a read transaction.
  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return mode_ == AccessMode::kWrite ? working_ : repo_.committed_;
  }

 private:
  MemoryRepository&       repo_;
  AccessMode              mode_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace jobflow::db::memory
