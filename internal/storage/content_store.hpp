#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

namespace jobflow::storage {

/*
  Content area for file parameters whose contents the workflow keeps.

  Contents are Arrow buffers addressed by a content key. Keys are single
  path components; callers derive them from the owning parameter.

  Implementations:
    RAM   -> in-memory Arrow buffers
    DISK  -> Arrow file IO under a root directory
*/

class ContentStore {
 public:
  virtual ~ContentStore() = default;

  // Throws NotFound for an unknown key.
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& key) = 0;

  // Replaces any existing contents under key.
  virtual void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  virtual void Remove(const std::string& key) = 0;

  virtual bool Exists(const std::string& key) = 0;
};

using ContentStorePtr = std::shared_ptr<ContentStore>;

} // namespace jobflow::storage
