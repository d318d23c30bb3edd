#include "internal/scheduling/jobscript_planner.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>

#include "internal/graph/dependency_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduling/jobscript_dependencies.hpp"
#include "internal/scheduling/jobscript_grouping.hpp"
#include "internal/util/errors.hpp"

namespace jobflow::scheduling {

using namespace jobflow::db::model;
using observability::IdsField;
using observability::IntField;
using observability::UintField;

namespace {

const LoopRecord* NextPlaceableLoop(const std::vector<LoopRecord>& loops, const std::set<std::string>& placed) {
  for (const auto& loop : loops) {
    if (placed.contains(loop.name)) continue;
    bool parents_placed = std::all_of(loop.parents.begin(), loop.parents.end(), [&](const auto& p) { return placed.contains(p); });
    if (parents_placed) return &loop;
  }
  return nullptr;
}

bool MatchesParents(const LoopIndex& position, const std::map<std::string, int64_t>& parent_idx) {
  for (const auto& [name, idx] : parent_idx) {
    auto it = position.find(name);
    if (it == position.end() || it->second != idx) return false;
  }
  return true;
}

} // namespace

TaskPathway IterationTaskPathway(const std::vector<TaskRecord>& tasks, const std::vector<LoopRecord>& loops) {
  std::vector<const TaskRecord*> ordered;
  for (const auto& task : tasks) ordered.push_back(&task);
  std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) { return a->index < b->index; });

  std::map<uint64_t, uint64_t> id_of_index;
  TaskPathway                  pathway;
  for (const auto* task : ordered) {
    id_of_index[task->index] = task->id;
    pathway.emplace_back(task->id, LoopIndex{});
  }

  std::set<std::string> placed;
  for (size_t n = 0; n < loops.size(); ++n) {
    const auto* loop = NextPlaceableLoop(loops, placed);
    if (!loop) throw util::InvariantViolation("no loop left whose parent loops are all placed in the task pathway");

    std::set<uint64_t> loop_tasks;
    for (auto idx : loop->task_indices) {
      auto it = id_of_index.find(idx);
      if (it == id_of_index.end()) throw util::NotFound("loop " + loop->name + " refers to missing task index " + std::to_string(idx));
      loop_tasks.insert(it->second);
    }

    for (const auto& [key, num_added] : loop->num_added_iterations) {
      std::map<std::string, int64_t> parent_idx;
      for (size_t i = 0; i < key.size() && i < loop->parents.size(); ++i) parent_idx[loop->parents[i]] = key[i];

      TaskPathway         repl;
      std::vector<size_t> repl_idx;
      for (int64_t i = 0; i < num_added; ++i) {
        for (size_t p = 0; p < pathway.size(); ++p) {
          if (!loop_tasks.contains(pathway[p].first)) continue;
          if (!MatchesParents(pathway[p].second, parent_idx)) continue;

          auto entry               = pathway[p];
          entry.second[loop->name] = i;
          repl_idx.push_back(p);
          repl.push_back(std::move(entry));
        }
      }

      if (repl.empty()) continue;

      const auto start = *std::min_element(repl_idx.begin(), repl_idx.end());
      const auto stop  = *std::max_element(repl_idx.begin(), repl_idx.end()) + 1;

      TaskPathway next(pathway.begin(), pathway.begin() + start);
      next.insert(next.end(), repl.begin(), repl.end());
      next.insert(next.end(), pathway.begin() + stop, pathway.end());
      pathway = std::move(next);
    }

    placed.insert(loop->name);
  }

  return pathway;
}

JobscriptPlanner::JobscriptPlanner(store::PersistentStore& store, ResourceResolver& resolver) : store_(store), resolver_(resolver) {
}

std::vector<JobscriptRecord> JobscriptPlanner::Plan(const std::vector<uint64_t>& task_indices) {
  observability::SpanScope span("scheduling.plan", {IdsField("task_indices", task_indices)});

  const auto tasks   = store_.GetAllTasks();
  const auto pathway = IterationTaskPathway(tasks, store_.GetAllLoops());
  const auto deps    = graph::DependencyCache::Build(store_);

  std::map<uint64_t, const TaskRecord*> task_by_id;
  for (const auto& task : tasks) task_by_id[task.id] = &task;

  std::map<uint64_t, std::vector<store::ElementView>> elements_by_task;

  JobscriptMap        jobscripts;
  ElementDependencies element_deps;

  for (const auto& [task_id, loop_idx] : pathway) {
    const auto& task = *task_by_id.at(task_id);
    if (!task_indices.empty() && std::find(task_indices.begin(), task_indices.end(), task.index) == task_indices.end()) continue;

    auto cached = elements_by_task.find(task_id);
    if (cached == elements_by_task.end()) cached = elements_by_task.emplace(task_id, store_.GetTaskElements(task_id)).first;

    const auto res_map  = GenerateRunResourceMap(task, cached->second, loop_idx, resolver_);
    const auto grouping = GroupResourceMapIntoJobscripts(res_map.resource_idx);

    for (const auto& group : grouping.jobscripts) {
      const auto& resources = res_map.resources.at(group.resources);

      std::set<uint64_t> action_set;
      for (const auto& [elem_idx, actions] : group.elements) action_set.insert(actions.begin(), actions.end());
      const std::vector<uint64_t> actions(action_set.begin(), action_set.end());

      JobscriptRecord js;
      js.resource_hash   = resources.hash;
      js.resources       = resources.document;
      js.task_insert_ids = {task.id};
      js.task_loop_idx   = {loop_idx};
      for (auto a : actions) js.task_actions.push_back({task.id, a, 0});
      js.run_ids.assign(actions.size(), std::vector<int64_t>(group.elements.size(), kNoRun));
      js.is_array = resources.use_job_array && group.elements.size() > 1;

      uint64_t js_elem = 0;
      for (const auto& [elem_idx, elem_actions] : group.elements) {
        js.task_elements[js_elem] = {elem_idx};
        for (auto a : elem_actions) {
          const auto row           = std::lower_bound(actions.begin(), actions.end(), a) - actions.begin();
          js.run_ids[row][js_elem] = res_map.run_ids[a][elem_idx];
        }
        ++js_elem;
      }

      std::set<int64_t> own_runs;
      for (const auto& row : js.run_ids) own_runs.insert(row.begin(), row.end());

      const auto new_js_idx = static_cast<uint64_t>(jobscripts.size());
      js_elem               = 0;
      for (const auto& [elem_idx, elem_actions] : group.elements) {
        std::set<uint64_t> waits_on;
        for (auto a : elem_actions) {
          for (auto dep : deps.RunDependencies(static_cast<uint64_t>(res_map.run_ids[a][elem_idx]))) {
            if (!own_runs.contains(static_cast<int64_t>(dep))) waits_on.insert(dep);
          }
        }
        if (!waits_on.empty()) element_deps[new_js_idx][js_elem] = std::vector<uint64_t>(waits_on.begin(), waits_on.end());
        ++js_elem;
      }

      jobscripts.emplace(new_js_idx, std::move(js));
    }
  }

  for (auto& [js_idx, js_deps] : ResolveJobscriptDependencies(jobscripts, element_deps)) {
    jobscripts.at(js_idx).dependencies = std::move(js_deps);
  }

  const auto num_singular = jobscripts.size();
  auto       out          = JobscriptsToList(MergeJobscriptsAcrossTasks(std::move(jobscripts)));

  span.SetAttribute("jobscripts", static_cast<int64_t>(out.size()));
  JOBFLOW_LOG_INFO("jobscripts planned", {IntField("pathway_entries", static_cast<int64_t>(pathway.size())),
                                          IntField("singular", static_cast<int64_t>(num_singular)),
                                          IntField("jobscripts", static_cast<int64_t>(out.size()))});
  return out;
}

uint64_t JobscriptPlanner::AddSubmission(std::vector<JobscriptRecord> jobscripts) {
  std::vector<uint64_t> run_ids;
  for (const auto& js : jobscripts) {
    for (const auto& row : js.run_ids) {
      for (auto id : row) {
        if (id != kNoRun) run_ids.push_back(static_cast<uint64_t>(id));
      }
    }
  }

  const auto num_jobscripts = static_cast<int64_t>(jobscripts.size());
  const auto submission_id  = store_.AddSubmission(std::move(jobscripts));
  store_.SetRunSubmissionIndex(run_ids, static_cast<int64_t>(submission_id));

  JOBFLOW_LOG_INFO("submission staged",
                   {UintField("submission", submission_id), IntField("jobscripts", num_jobscripts), IdsField("runs", run_ids)});
  return submission_id;
}

} // namespace jobflow::scheduling
