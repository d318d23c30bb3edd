#include "internal/store/commit_resource_map.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/api/repository.hpp"

namespace jobflow::store {

namespace {

bool Contains(const std::vector<std::string>& haystack, const std::string& needle) {
  return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
}

void AppendUnique(std::vector<std::string>& into, const std::vector<std::string>& added) {
  for (const auto& r : added) {
    if (!Contains(into, r)) into.push_back(r);
  }
}

bool Overlaps(const std::vector<std::string>& a, const std::vector<std::string>& b) {
  return std::any_of(b.begin(), b.end(), [&](const std::string& r) { return Contains(a, r); });
}

} // namespace

CommitResourceMap::CommitResourceMap(StepResources table) : table_(std::move(table)) {
  std::vector<CommitGroup> scanned;
  for (const auto& [step, resources] : table_) {
    if (scanned.empty() || resources.empty() || Overlaps(scanned.back().resources, resources)) {
      if (scanned.empty()) scanned.emplace_back();
      AppendUnique(scanned.back().resources, resources);
      scanned.back().steps.push_back(step);
      continue;
    }
    scanned.push_back(CommitGroup{resources, {step}});
  }

  for (auto& group : scanned) {
    auto same = std::find_if(groups_.begin(), groups_.end(), [&](const CommitGroup& g) { return g.resources == group.resources; });
    if (same == groups_.end()) {
      groups_.push_back(std::move(group));
    } else {
      same->steps.insert(same->steps.end(), group.steps.begin(), group.steps.end());
    }
  }
}

CommitResourceMap::StepResources CommitResourceMap::TableFor(const db::Repository& repository) {
  StepResources table;
  for (auto step : db::kCommitOrder) {
    std::vector<std::string> resources;
    for (auto kind : db::KindsWrittenBy(step)) AppendUnique(resources, repository.ResourcesFor(kind));
    table.emplace_back(step, std::move(resources));
  }
  return table;
}

CommitResourceMap CommitResourceMap::ForRepository(const db::Repository& repository) {
  return CommitResourceMap(TableFor(repository));
}

const std::vector<std::string>& CommitResourceMap::ResourcesOf(db::CommitStep step) const {
  for (const auto& [s, resources] : table_) {
    if (s == step) return resources;
  }
  throw std::out_of_range(std::string("no resources declared for step ") + db::CommitStepName(step));
}

std::string JoinResources(const std::vector<std::string>& resources) {
  std::string out;
  for (const auto& r : resources) {
    if (!out.empty()) out += ",";
    out += r;
  }
  return out;
}

} // namespace jobflow::store
