#include "internal/scheduling/jobscript_dependencies.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using jobflow::db::model::JobscriptRecord;
using jobflow::db::model::TaskAction;
using jobflow::scheduling::ElementDependencies;
using jobflow::scheduling::JobscriptMap;
using jobflow::scheduling::JobscriptsToList;
using jobflow::scheduling::MergeJobscriptsAcrossTasks;
using jobflow::scheduling::ResolveJobscriptDependencies;

// One action, one element per run.
JobscriptRecord MakeJobscript(uint64_t task_id, const std::string& hash, const std::vector<int64_t>& runs) {
  JobscriptRecord js;
  js.resource_hash   = hash;
  js.task_insert_ids = {task_id};
  js.task_loop_idx   = {{}};
  js.task_actions    = {TaskAction{task_id, 0, 0}};
  js.run_ids         = {runs};
  for (uint64_t e = 0; e < runs.size(); ++e) js.task_elements[e] = {e};
  js.is_array = runs.size() > 1;
  return js;
}

void TestOneToOneDependencyIsArray() {
  JobscriptMap jobscripts;
  jobscripts[0] = MakeJobscript(0, "a", {10, 11});
  jobscripts[1] = MakeJobscript(1, "b", {20, 21});

  ElementDependencies element_deps;
  element_deps[1][0] = {10};
  element_deps[1][1] = {11};

  auto deps = ResolveJobscriptDependencies(jobscripts, element_deps);
  assert(deps.size() == 1);

  const auto& dep = deps.at(1).at(0);
  assert(dep.is_array);
  assert((dep.js_element_mapping.at(0) == std::vector<uint64_t>{0}));
  assert((dep.js_element_mapping.at(1) == std::vector<uint64_t>{1}));
}

void TestFanInDependencyIsNotArray() {
  JobscriptMap jobscripts;
  jobscripts[0] = MakeJobscript(0, "a", {10, 11});
  jobscripts[1] = MakeJobscript(1, "a", {20});

  ElementDependencies element_deps;
  element_deps[1][0] = {10, 11};

  auto        deps = ResolveJobscriptDependencies(jobscripts, element_deps);
  const auto& dep  = deps.at(1).at(0);
  assert(!dep.is_array);
  assert((dep.js_element_mapping.at(0) == std::vector<uint64_t>{0, 1}));
}

void TestLaterJobscriptsAreNotSearched() {
  JobscriptMap jobscripts;
  jobscripts[0] = MakeJobscript(0, "a", {10});
  jobscripts[1] = MakeJobscript(1, "a", {20});

  // run 20 lives in jobscript 1, which comes after jobscript 0
  ElementDependencies element_deps;
  element_deps[0][0] = {20};

  auto deps = ResolveJobscriptDependencies(jobscripts, element_deps);
  assert(deps.at(0).empty());
}

void TestArrayDependencyWithSameResourcesMerges() {
  JobscriptMap jobscripts;
  jobscripts[0] = MakeJobscript(0, "a", {10, 11});
  jobscripts[1] = MakeJobscript(1, "a", {20, 21});
  jobscripts[2] = MakeJobscript(2, "b", {30, 31});

  ElementDependencies element_deps;
  element_deps[1][0] = {10};
  element_deps[1][1] = {11};
  element_deps[2][0] = {20};
  element_deps[2][1] = {21};

  for (auto& [js_idx, js_deps] : ResolveJobscriptDependencies(jobscripts, element_deps)) {
    jobscripts.at(js_idx).dependencies = std::move(js_deps);
  }

  auto merged = MergeJobscriptsAcrossTasks(std::move(jobscripts));
  assert(merged.size() == 2);
  assert(merged.contains(0));
  assert(merged.contains(2));

  const auto& survivor = merged.at(0);
  assert((survivor.task_insert_ids == std::vector<uint64_t>{0, 1}));
  assert(survivor.task_loop_idx.size() == 2);
  assert(survivor.task_actions.size() == 2);
  assert((survivor.task_actions[1] == TaskAction{1, 0, 1}));
  assert(survivor.run_ids.size() == 2);
  assert((survivor.run_ids[1] == std::vector<int64_t>{20, 21}));
  assert((survivor.task_elements.at(1) == std::vector<uint64_t>{1, 1}));

  // jobscript 2 waited on the folded jobscript and now waits on the survivor
  const auto& downstream = merged.at(2);
  assert(downstream.dependencies.size() == 1);
  assert(downstream.dependencies.contains(0));

  auto list = JobscriptsToList(std::move(merged));
  assert(list.size() == 2);
  assert(list[1].resource_hash == "b");
  assert(list[1].dependencies.contains(0));
}

void TestDifferentResourcesDoNotMerge() {
  JobscriptMap jobscripts;
  jobscripts[0] = MakeJobscript(0, "a", {10, 11});
  jobscripts[1] = MakeJobscript(1, "b", {20, 21});

  ElementDependencies element_deps;
  element_deps[1][0] = {10};
  element_deps[1][1] = {11};
  for (auto& [js_idx, js_deps] : ResolveJobscriptDependencies(jobscripts, element_deps)) {
    jobscripts.at(js_idx).dependencies = std::move(js_deps);
  }

  auto merged = MergeJobscriptsAcrossTasks(std::move(jobscripts));
  assert(merged.size() == 2);
}

void TestListRenumbersDependencies() {
  JobscriptMap jobscripts;
  jobscripts[3] = MakeJobscript(0, "a", {10});
  jobscripts[7] = MakeJobscript(1, "b", {20});
  jobscripts[7].dependencies[3].js_element_mapping[0] = {0};

  auto list = JobscriptsToList(std::move(jobscripts));
  assert(list.size() == 2);
  assert(list[0].resource_hash == "a");
  assert(list[1].dependencies.size() == 1);
  assert(list[1].dependencies.contains(0));
}

} // namespace

int main() {
  TestOneToOneDependencyIsArray();
  TestFanInDependencyIsNotArray();
  TestLaterJobscriptsAreNotSearched();
  TestArrayDependencyWithSameResourcesMerges();
  TestDifferentResourcesDoNotMerge();
  TestListRenumbersDependencies();

  std::cout << "jobflow_unit_jobscript_dependencies: pass\n";
  return 0;
}
