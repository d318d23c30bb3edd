#include "internal/factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/db/json/json_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/storage_factory.hpp"
#if JOBFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace jobflow::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const jobflow::runtime::config::StoreConfig& config) {
  if (config.has_json()) {
    return std::make_shared<db::json::JsonRepository>(config.json().path(), config.json().fsync());
  }

  if (config.has_sqlite()) {
#if JOBFLOW_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.fsync = config.sqlite().fsync();

    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(config.sqlite().path(), options);
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    repository->BootstrapSchema();
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build the store for one workflow
*/
Workflow Build(const jobflow::runtime::config::RuntimeConfig& config) {
  jobflow::config::ConfigLoader::Validate(config);

  Workflow workflow;

  // ------------------------------------------------------------------
  // Backends
  // ------------------------------------------------------------------
  workflow.repository = BuildRepository(config.store());
  workflow.content    = storage::StorageFactory::Build(config.content());

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  store::StoreOptions options;
  options.use_cache     = config.store().use_cache();
  options.content_fsync = config.content().fsync();
  if (config.content().array_chunk_length() > 0) options.array_chunk_length = config.content().array_chunk_length();

  workflow.store = std::make_unique<store::PersistentStore>(workflow.repository, workflow.content, options);

  return workflow;
}

} // namespace jobflow::factory
