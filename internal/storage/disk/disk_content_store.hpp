#pragma once

#include <arrow/buffer.h>

#include <filesystem>

#include "internal/storage/content_store.hpp"

namespace jobflow::storage {

/*
  Durable content area using Arrow IO.

  Properties:
    - atomic replace writes
    - optional fsync
*/

class DiskContentStore final : public ContentStore {
 public:
  explicit DiskContentStore(std::filesystem::path root);

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  void Remove(const std::string& key) override;

  bool Exists(const std::string& key) override;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace jobflow::storage
