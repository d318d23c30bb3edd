#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace jobflow::store {

/*
  Read cache of durable records, keyed by ID, one per entity kind.

  Holds records exactly as the backend returned them; pending updates are
  laid over after lookup, so staging a mutation never invalidates an entry.
  Cleared when a commit writes the kind.
*/
template <typename Record>
class RecordCache {
 public:
  std::optional<Record> Get(uint64_t id) const {
    std::shared_lock lock(mutex_);
    auto             it = cache_.find(id);
    if (it == cache_.end()) return std::nullopt;
    return it->second;
  }

  void Put(const Record& record) {
    std::unique_lock lock(mutex_);
    cache_[record.id] = record;
  }

  void Remove(uint64_t id) {
    std::unique_lock lock(mutex_);
    cache_.erase(id);
  }

  void Clear() {
    std::unique_lock lock(mutex_);
    cache_.clear();
  }

  size_t Size() const {
    std::shared_lock lock(mutex_);
    return cache_.size();
  }

 private:
  mutable std::shared_mutex              mutex_;
  std::unordered_map<uint64_t, Record>   cache_;
};

} // namespace jobflow::store
