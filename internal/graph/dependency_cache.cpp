#include "internal/graph/dependency_cache.hpp"

#include <queue>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/store/persistent_store.hpp"
#include "internal/util/errors.hpp"

namespace jobflow::graph {

using namespace jobflow::db::model;

namespace {

const DependencyCache::IdSet& Lookup(const std::map<uint64_t, DependencyCache::IdSet>& index, const char* kind, uint64_t id) {
  auto it = index.find(id);
  if (it == index.end()) throw util::NotFound(util::MissingEntity(kind, id));
  return it->second;
}

uint64_t Owner(const std::map<uint64_t, uint64_t>& owners, const char* kind, uint64_t id) {
  auto it = owners.find(id);
  if (it == owners.end()) throw util::NotFound(util::MissingEntity(kind, id));
  return it->second;
}

} // namespace

DependencyCache DependencyCache::Build(store::PersistentStore& store) {
  auto runs       = store.GetAllRuns();
  auto iterations = store.GetAllIterations();
  auto elements   = store.GetAllElements();

  std::vector<uint64_t> param_ids(store.NumParameters());
  for (uint64_t i = 0; i < param_ids.size(); ++i) param_ids[i] = i;
  auto sources = store.GetParameterSources(param_ids);

  auto cache = FromRecords(runs, iterations, elements, sources);
  JOBFLOW_LOG_DEBUG("dependency cache built", {observability::IntField("runs", static_cast<int64_t>(runs.size())),
                                               observability::IntField("elements", static_cast<int64_t>(elements.size()))});
  return cache;
}

DependencyCache DependencyCache::FromRecords(const std::vector<RunRecord>& runs, const std::vector<IterationRecord>& iterations,
                                             const std::vector<ElementRecord>& elements, const std::vector<ParamSource>& sources) {
  DependencyCache cache;

  // ------------------------------------------------------------
  // run edges
  // ------------------------------------------------------------

  for (const auto& run : runs) {
    cache.run_dependents_[run.id];
  }

  for (const auto& run : runs) {
    auto& deps = cache.run_dependencies_[run.id];
    for (auto param_id : ReferencedParameterIds(run.data_idx, /*skip_repeats=*/true)) {
      if (param_id >= sources.size()) throw util::NotFound(util::MissingEntity("parameter", param_id));
      auto producer = ProducingRun(sources[param_id]);
      if (!producer || *producer == run.id) continue;
      deps.insert(*producer);
      cache.run_dependents_[*producer].insert(run.id);
    }
  }

  std::map<uint64_t, uint64_t> iteration_of_run;
  for (const auto& run : runs) iteration_of_run[run.id] = run.iteration_id;

  // ------------------------------------------------------------
  // iteration edges
  // ------------------------------------------------------------

  for (const auto& iteration : iterations) {
    auto& run_deps  = cache.iteration_run_dependencies_[iteration.id];
    auto& iter_deps = cache.iteration_dependencies_[iteration.id];
    for (const auto& [action_idx, run_ids] : iteration.run_ids) {
      for (auto run_id : run_ids) {
        for (auto dep : Lookup(cache.run_dependencies_, "run", run_id)) {
          run_deps.insert(dep);
          iter_deps.insert(Owner(iteration_of_run, "run", dep));
        }
      }
    }
  }

  std::map<uint64_t, uint64_t> element_of_iteration;
  for (const auto& iteration : iterations) element_of_iteration[iteration.id] = iteration.element_id;

  // ------------------------------------------------------------
  // element edges
  // ------------------------------------------------------------

  for (const auto& element : elements) {
    cache.element_dependents_[element.id];
    cache.element_dependents_rec_[element.id];
  }

  for (const auto& element : elements) {
    auto& iter_deps = cache.element_iteration_dependencies_[element.id];
    auto& elem_deps = cache.element_dependencies_[element.id];
    for (auto iteration_id : element.iteration_ids) {
      for (auto dep : Lookup(cache.iteration_dependencies_, "iteration", iteration_id)) {
        iter_deps.insert(dep);
        auto dep_element = Owner(element_of_iteration, "iteration", dep);
        if (dep_element == element.id) continue;
        elem_deps.insert(dep_element);
        cache.element_dependents_[dep_element].insert(element.id);
      }
    }
  }

  // transitive dependents, breadth first
  for (const auto& element : elements) {
    auto&                rec = cache.element_dependents_rec_[element.id];
    std::queue<uint64_t> q;
    q.push(element.id);

    while (!q.empty()) {
      auto node = q.front();
      q.pop();

      for (auto next : cache.element_dependents_.at(node)) {
        if (next == element.id) continue;
        if (!rec.insert(next).second) continue;
        q.push(next);
      }
    }
  }

  return cache;
}

const DependencyCache::IdSet& DependencyCache::RunDependencies(uint64_t run_id) const {
  return Lookup(run_dependencies_, "run", run_id);
}

const DependencyCache::IdSet& DependencyCache::RunDependents(uint64_t run_id) const {
  return Lookup(run_dependents_, "run", run_id);
}

const DependencyCache::IdSet& DependencyCache::IterationRunDependencies(uint64_t iteration_id) const {
  return Lookup(iteration_run_dependencies_, "iteration", iteration_id);
}

const DependencyCache::IdSet& DependencyCache::IterationDependencies(uint64_t iteration_id) const {
  return Lookup(iteration_dependencies_, "iteration", iteration_id);
}

const DependencyCache::IdSet& DependencyCache::ElementIterationDependencies(uint64_t element_id) const {
  return Lookup(element_iteration_dependencies_, "element", element_id);
}

const DependencyCache::IdSet& DependencyCache::ElementDependencies(uint64_t element_id) const {
  return Lookup(element_dependencies_, "element", element_id);
}

const DependencyCache::IdSet& DependencyCache::ElementDependents(uint64_t element_id) const {
  return Lookup(element_dependents_, "element", element_id);
}

const DependencyCache::IdSet& DependencyCache::ElementDependentsRecursive(uint64_t element_id) const {
  return Lookup(element_dependents_rec_, "element", element_id);
}

} // namespace jobflow::graph
