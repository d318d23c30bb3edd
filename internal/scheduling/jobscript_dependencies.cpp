#include "internal/scheduling/jobscript_dependencies.hpp"

#include <algorithm>
#include <optional>
#include <set>

#include "internal/scheduling/resource_map.hpp"

namespace jobflow::scheduling {

using db::model::JobscriptDependency;
using db::model::JobscriptRecord;

namespace {

size_t NumElements(const JobscriptRecord& js) {
  return js.run_ids.empty() ? 0 : js.run_ids.front().size();
}

// Column (jobscript element) holding run_id, if any.
std::optional<uint64_t> ElementOfRun(const JobscriptRecord& js, uint64_t run_id) {
  for (const auto& row : js.run_ids) {
    for (size_t col = 0; col < row.size(); ++col) {
      if (row[col] == static_cast<int64_t>(run_id)) return col;
    }
  }
  return std::nullopt;
}

bool IsRange(std::vector<uint64_t> values, size_t n) {
  if (values.size() != n) return false;
  std::sort(values.begin(), values.end());
  for (size_t i = 0; i < n; ++i) {
    if (values[i] != i) return false;
  }
  return true;
}

bool IsArrayDependency(const JobscriptDependency& dep, size_t num_elements, size_t upstream_num_elements) {
  std::vector<uint64_t> keys;
  std::vector<uint64_t> targets;
  for (const auto& [js_elem, upstream] : dep.js_element_mapping) {
    if (upstream.size() != 1) return false;
    keys.push_back(js_elem);
    targets.push_back(upstream.front());
  }
  if (keys.empty()) return false;
  return IsRange(keys, num_elements) && IsRange(targets, upstream_num_elements);
}

void ReindexDependencies(JobscriptMap& jobscripts, uint64_t from_idx, uint64_t to_idx) {
  for (auto& [js_idx, js] : jobscripts) {
    if (js_idx <= from_idx) continue;
    auto it = js.dependencies.find(from_idx);
    if (it == js.dependencies.end()) continue;
    auto dep = std::move(it->second);
    js.dependencies.erase(it);
    js.dependencies[to_idx] = std::move(dep);
  }
}

} // namespace

JobscriptDependencies ResolveJobscriptDependencies(const JobscriptMap& jobscripts, const ElementDependencies& element_deps) {
  JobscriptDependencies out;

  for (const auto& [js_idx, elem_deps] : element_deps) {
    auto& deps = out[js_idx];

    for (const auto& [js_elem, run_deps] : elem_deps) {
      for (auto run_id : run_deps) {
        for (const auto& [upstream_idx, upstream] : jobscripts) {
          if (upstream_idx == js_idx) break;

          auto upstream_elem = ElementOfRun(upstream, run_id);
          if (!upstream_elem) continue;

          auto& mapping = deps[upstream_idx].js_element_mapping[js_elem];
          if (std::find(mapping.begin(), mapping.end(), *upstream_elem) == mapping.end()) {
            mapping.push_back(*upstream_elem);
          }
        }
      }
    }
  }

  for (auto& [js_idx, deps] : out) {
    const auto num_elements = NumElements(jobscripts.at(js_idx));
    for (auto& [upstream_idx, dep] : deps) {
      dep.is_array = IsArrayDependency(dep, num_elements, NumElements(jobscripts.at(upstream_idx)));
    }
  }

  return out;
}

JobscriptMap MergeJobscriptsAcrossTasks(JobscriptMap jobscripts) {
  std::set<uint64_t> merged;

  for (auto& [js_idx, js] : jobscripts) {
    // only a single dependency is considered for now
    if (js.dependencies.size() != 1) continue;

    const auto& [target_idx, dep] = *js.dependencies.begin();
    auto& target                  = jobscripts.at(target_idx);
    if (!dep.is_array || js.resource_hash != target.resource_hash) continue;
    if (CanonicalResources(js.resources) != CanonicalResources(target.resources)) continue;

    const auto loop_slot = static_cast<uint64_t>(target.task_loop_idx.size());
    target.task_insert_ids.push_back(js.task_insert_ids.front());
    target.task_loop_idx.push_back(js.task_loop_idx.front());
    for (const auto& action : js.task_actions) target.task_actions.push_back({action[0], action[1], loop_slot});
    for (const auto& [js_elem, task_elems] : js.task_elements) {
      auto& dst = target.task_elements[js_elem];
      dst.insert(dst.end(), task_elems.begin(), task_elems.end());
    }
    target.run_ids.insert(target.run_ids.end(), js.run_ids.begin(), js.run_ids.end());

    merged.insert(js_idx);
    ReindexDependencies(jobscripts, js_idx, target_idx);
  }

  for (auto idx : merged) jobscripts.erase(idx);
  return jobscripts;
}

std::vector<JobscriptRecord> JobscriptsToList(JobscriptMap jobscripts) {
  std::vector<JobscriptRecord> out;
  out.reserve(jobscripts.size());

  for (auto& [js_idx, js] : jobscripts) {
    const auto new_idx = static_cast<uint64_t>(out.size());
    if (js_idx != new_idx) ReindexDependencies(jobscripts, js_idx, new_idx);
    out.push_back(std::move(js));
  }
  return out;
}

} // namespace jobflow::scheduling
