#include "ram_content_store.hpp"

#include <mutex>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace jobflow::storage {

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamContentStore::Read(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) throw util::NotFound("content " + key + " not found");

  return it->second;
}

void RamContentStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool /*fsync unused*/) {
  common::ValidateContentKey(key);

  std::unique_lock lock(mutex_);
  buffers_[key] = buffer;
}

void RamContentStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  buffers_.erase(key);
}

bool RamContentStore::Exists(const std::string& key) {
  std::shared_lock lock(mutex_);
  return buffers_.count(key) != 0;
}

} // namespace jobflow::storage
