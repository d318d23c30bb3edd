#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "internal/storage/content_store.hpp"

namespace jobflow::storage {

/*
  In-memory content area.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamContentStore final : public ContentStore {
 public:
  RamContentStore()           = default;
  ~RamContentStore() override = default;

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  void Remove(const std::string& key) override;

  bool Exists(const std::string& key) override;

 private:
  mutable std::shared_mutex                                        mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace jobflow::storage
