#include "disk_content_store.hpp"

#include <filesystem>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace jobflow::storage {

using namespace jobflow::storage::common;

DiskContentStore::DiskContentStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::shared_ptr<arrow::Buffer> DiskContentStore::Read(const std::string& key) {
  auto path = ContentPath(root_, key);
  if (!std::filesystem::exists(path)) {
    throw util::NotFound("content " + key + " not found under " + root_.string());
  }
  return ReadFile(path);
}

void DiskContentStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) {
  WriteFileAtomic(ContentPath(root_, key), *buffer, fsync);
}

void DiskContentStore::Remove(const std::string& key) {
  std::filesystem::remove(ContentPath(root_, key));
}

bool DiskContentStore::Exists(const std::string& key) {
  return std::filesystem::exists(ContentPath(root_, key));
}

} // namespace jobflow::storage
