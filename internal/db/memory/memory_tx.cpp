#include "memory_tx.hpp"

#include <stdexcept>

namespace jobflow::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, AccessMode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  if (mode_ == AccessMode::kWrite) {
    working_ = repo_.committed_; // snapshot copy
  }
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (mode_ != AccessMode::kWrite) {
    throw std::logic_error("memory transaction opened read-only");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (mode_ == AccessMode::kRead) {
    committed_ = true;
    return;
  }
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw std::runtime_error("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace jobflow::db::memory
