#include "internal/store/record_cache.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/ram/ram_content_store.hpp"
#include "internal/store/persistent_store.hpp"

namespace {

using jobflow::db::AccessMode;
using jobflow::db::EntityKind;
using jobflow::db::model::TaskRecord;
using jobflow::store::PersistentStore;
using jobflow::store::RecordCache;

void TestGetPutClear() {
  RecordCache<TaskRecord> cache;
  assert(!cache.Get(1));

  TaskRecord task;
  task.id    = 1;
  task.index = 4;
  cache.Put(task);

  auto hit = cache.Get(1);
  assert(hit);
  assert(hit->index == 4);
  assert(cache.Size() == 1);

  cache.Remove(1);
  assert(!cache.Get(1));

  cache.Put(task);
  cache.Clear();
  assert(cache.Size() == 0);
}

// Rewrites task 0 directly in the backend, bypassing the store.
void RewriteTaskIndexBehindStore(jobflow::db::Repository& repo, uint64_t new_index) {
  auto tx   = repo.Begin(repo.ResourcesFor(EntityKind::kTask), AccessMode::kWrite);
  auto task = repo.GetTask(*tx, 0);
  assert(task);
  task->index = new_index;
  assert(repo.UpdateTask(*tx, *task));
  tx->Commit();
}

void TestCacheScopeServesCachedRecords() {
  auto            repo = std::make_shared<jobflow::db::memory::MemoryRepository>();
  PersistentStore store(repo, std::make_shared<jobflow::storage::RamContentStore>());

  store.AddTask(0, {});
  store.CommitAll();

  {
    PersistentStore::CacheScope scope(store);
    assert(store.CacheEnabled());
    assert(store.GetTasks({0}).front().index == 0);

    RewriteTaskIndexBehindStore(*repo, 9);

    // still served from the cache
    assert(store.GetTasks({0}).front().index == 0);

    store.Reload();
    assert(store.GetTasks({0}).front().index == 9);
  }

  assert(!store.CacheEnabled());
  RewriteTaskIndexBehindStore(*repo, 5);
  assert(store.GetTasks({0}).front().index == 5);
}

void TestPendingUpdatesOverlayCachedRecords() {
  auto            repo = std::make_shared<jobflow::db::memory::MemoryRepository>();
  PersistentStore store(repo, std::make_shared<jobflow::storage::RamContentStore>(), jobflow::store::StoreOptions{true, false});
  assert(store.CacheEnabled());

  auto task = store.AddTask(0, {});
  store.CommitAll();
  assert(store.GetTasks({task}).front().element_ids.empty());

  auto element = store.AddElement(task, 0, {}, {});
  assert(store.GetTasks({task}).front().element_ids.size() == 1);

  // the commit rewrites tasks, so the cached copy is dropped
  store.CommitAll();
  const auto committed = store.GetTasks({task}).front();
  assert(committed.element_ids.size() == 1);
  assert(committed.element_ids.front() == element);
}

} // namespace

int main() {
  TestGetPutClear();
  TestCacheScopeServesCachedRecords();
  TestPendingUpdatesOverlayCachedRecords();

  std::cout << "jobflow_unit_record_cache: pass\n";
  return 0;
}
