#pragma once

#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/commit_step.hpp"

namespace jobflow::db {
class Repository;
}

namespace jobflow::store {

struct CommitGroup {
  std::vector<std::string>    resources; // first-appearance order
  std::vector<db::CommitStep> steps;     // commit order
};

/*
  Folds a step -> resources table into resource-acquisition groups.

  Scan in commit order: a step joins the current group when it needs no
  resource or shares one with the group; otherwise it starts a new group.
  Groups ending up with an identical resource list are then merged into the
  first of them. Computed once at construction.
*/
class CommitResourceMap {
 public:
  using StepResources = std::vector<std::pair<db::CommitStep, std::vector<std::string>>>;

  explicit CommitResourceMap(StepResources table);

  // Table derived from Repository::ResourcesFor over KindsWrittenBy.
  static StepResources TableFor(const db::Repository& repository);
  static CommitResourceMap ForRepository(const db::Repository& repository);

  const std::vector<CommitGroup>& Groups() const {
    return groups_;
  }

  const std::vector<std::string>& ResourcesOf(db::CommitStep step) const;

 private:
  StepResources            table_;
  std::vector<CommitGroup> groups_;
};

std::string JoinResources(const std::vector<std::string>& resources);

} // namespace jobflow::store
