#pragma once

#include "config/config.pb.h"
#include "content_store.hpp"

namespace jobflow::storage {

/*
  Builds the content area from configuration: an empty root_path keeps
  contents in memory, anything else is a directory on disk.
*/
class StorageFactory {
 public:
  static ContentStorePtr Build(const jobflow::runtime::config::ContentConfig& cfg);
};

} // namespace jobflow::storage
