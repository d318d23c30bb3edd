#include "internal/store/commit_resource_map.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/json/json_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using jobflow::db::CommitStep;
using jobflow::store::CommitGroup;
using jobflow::store::CommitResourceMap;

using Steps     = std::vector<CommitStep>;
using Resources = std::vector<std::string>;

void TestOverlappingStepsShareAGroup() {
  CommitResourceMap map({
      {CommitStep::kTasks, {"a"}},
      {CommitStep::kLoops, {"a", "b"}},
      {CommitStep::kSubmissions, {"b"}},
      {CommitStep::kElements, {"c"}},
  });

  const auto& groups = map.Groups();
  assert(groups.size() == 2);
  assert((groups[0].resources == Resources{"a", "b"}));
  assert((groups[0].steps == Steps{CommitStep::kTasks, CommitStep::kLoops, CommitStep::kSubmissions}));
  assert((groups[1].resources == Resources{"c"}));
  assert((groups[1].steps == Steps{CommitStep::kElements}));
}

void TestDisjointStepsAreSeparated() {
  CommitResourceMap map({
      {CommitStep::kTasks, {"a"}},
      {CommitStep::kLoops, {"b"}},
      {CommitStep::kSubmissions, {"c"}},
  });

  assert(map.Groups().size() == 3);
  for (const auto& group : map.Groups()) assert(group.steps.size() == 1);
}

void TestStepsWithoutResourcesJoinTheCurrentGroup() {
  CommitResourceMap map({
      {CommitStep::kParameters, {"p"}},
      {CommitStep::kFiles, {}},
      {CommitStep::kParameterSources, {"p"}},
  });

  assert(map.Groups().size() == 1);
  assert((map.Groups()[0].steps == Steps{CommitStep::kParameters, CommitStep::kFiles, CommitStep::kParameterSources}));
}

void TestIdenticalResourceListsAreMerged() {
  CommitResourceMap map({
      {CommitStep::kTasks, {"m"}},
      {CommitStep::kSubmissions, {"s"}},
      {CommitStep::kElements, {"m"}},
      {CommitStep::kParameters, {"p"}},
      {CommitStep::kLoopIndices, {"m"}},
  });

  const auto& groups = map.Groups();
  assert(groups.size() == 3);
  assert((groups[0].resources == Resources{"m"}));
  assert((groups[0].steps == Steps{CommitStep::kTasks, CommitStep::kElements, CommitStep::kLoopIndices}));
  assert((groups[1].resources == Resources{"s"}));
  assert((groups[2].resources == Resources{"p"}));
}

void TestResourcesOfUnknownStepThrows() {
  CommitResourceMap map({{CommitStep::kTasks, {"a"}}});
  assert((map.ResourcesOf(CommitStep::kTasks) == Resources{"a"}));

  bool threw = false;
  try {
    (void)map.ResourcesOf(CommitStep::kRuns);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);
}

void TestDocumentBackendGroupsByDocument() {
  const auto root = std::filesystem::temp_directory_path() / "jobflow_commit_resource_map_tests";
  std::filesystem::remove_all(root);

  jobflow::db::json::JsonRepository repo(root);
  const auto                        map = CommitResourceMap::ForRepository(repo);

  const auto& groups = map.Groups();
  assert(groups.size() == 3);
  assert((groups[0].resources == Resources{"metadata"}));
  assert((groups[1].resources == Resources{"submissions"}));
  assert((groups[2].resources == Resources{"parameters"}));

  // the metadata group still runs in commit order
  assert(groups[0].steps.front() == CommitStep::kTasks);
  assert(groups[0].steps.back() == CommitStep::kLoopParents);
  assert((groups[2].steps == Steps{CommitStep::kParameters, CommitStep::kFiles, CommitStep::kParameterSources}));

  std::filesystem::remove_all(root);
}

void TestSingleResourceBackendHasOneGroup() {
  jobflow::db::memory::MemoryRepository repo;
  const auto                            map = CommitResourceMap::ForRepository(repo);
  assert(map.Groups().size() == 1);
  assert(map.Groups()[0].steps.size() == jobflow::db::kCommitOrder.size());
}

} // namespace

int main() {
  TestOverlappingStepsShareAGroup();
  TestDisjointStepsAreSeparated();
  TestStepsWithoutResourcesJoinTheCurrentGroup();
  TestIdenticalResourceListsAreMerged();
  TestResourcesOfUnknownStepThrows();
  TestDocumentBackendGroupsByDocument();
  TestSingleResourceBackendHasOneGroup();

  std::cout << "jobflow_unit_commit_resource_map: pass\n";
  return 0;
}
