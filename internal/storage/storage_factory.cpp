#include "storage_factory.hpp"

#include <filesystem>

#include "disk/disk_content_store.hpp"
#include "ram/ram_content_store.hpp"

namespace jobflow::storage {

ContentStorePtr StorageFactory::Build(const jobflow::runtime::config::ContentConfig& cfg) {
  if (cfg.root_path().empty()) {
    return std::make_shared<RamContentStore>();
  }
  return std::make_shared<DiskContentStore>(std::filesystem::path{cfg.root_path()});
}

} // namespace jobflow::storage
