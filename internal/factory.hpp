#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/storage/content_store.hpp"
#include "internal/store/persistent_store.hpp"

namespace jobflow::factory {

/*
  Workflow

  Owns the long-lived pieces of one opened workflow. The store refers to
  the repository and content area, so they share its lifetime.
*/
struct Workflow {
  std::shared_ptr<db::Repository>         repository;
  storage::ContentStorePtr                content;
  std::unique_ptr<store::PersistentStore> store;
};

/*
  Build

  Opens the backend and content area selected by the config and wraps them
  in a store.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Workflow Build(const jobflow::runtime::config::RuntimeConfig& config);

} // namespace jobflow::factory
