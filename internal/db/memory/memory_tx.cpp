#include "memory_tx.hpp"

#include <stdexcept>

namespace strands::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_lock_(repo_.writer_mutex_) {
  working_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  if (writer_lock_.owns_lock()) Rollback();
}

void MemoryTransaction::Commit() {
  if (!writer_lock_.owns_lock()) {
    throw std::runtime_error("memory transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (!writer_lock_.owns_lock()) {
    return;
  }
  working_ = MemoryRepository::State{};
  writer_lock_.unlock();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!writer_lock_.owns_lock()) {
    throw std::runtime_error("memory transaction used after commit or rollback");
  }
  return working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  if (!writer_lock_.owns_lock()) {
    throw std::runtime_error("memory transaction used after commit or rollback");
  }
  return working_;
}

} // namespace strands::db::memory
