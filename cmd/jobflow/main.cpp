#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduling/jobscript_planner.hpp"
#include "internal/scheduling/resource_map.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using jobflow::observability::StringField;

static void Usage() {
  std::cout << "Usage:\n"
            << "  jobflow <config.yaml> summary\n"
            << "  jobflow <config.yaml> plan [task_index...]\n"
            << "  jobflow <config.yaml> submissions\n";
}

static void PrintSummary(jobflow::store::PersistentStore& store) {
  try {
    const auto info = store.GetWorkflowInfo();
    std::cout << "workflow:     " << info.name << "\n"
              << "created:      " << jobflow::util::FormatTimestamp(info.creation.create_time) << " by " << info.creation.app_name << " "
              << info.creation.app_version << "\n";
  } catch (const jobflow::util::NotFound&) {
    std::cout << "workflow:     (no metadata recorded)\n";
  }
  std::cout << "backend:      " << store.Backend().BackendName() << "\n"
            << "tasks:        " << store.NumTasks() << "\n"
            << "elements:     " << store.NumElements() << "\n"
            << "iterations:   " << store.NumIterations() << "\n"
            << "runs:         " << store.NumRuns() << "\n"
            << "parameters:   " << store.NumParameters() << "\n"
            << "loops:        " << store.NumLoops() << "\n"
            << "submissions:  " << store.NumSubmissions() << "\n";
}

static void PrintSubmissions(jobflow::store::PersistentStore& store) {
  for (const auto& submission : store.GetAllSubmissions()) {
    std::cout << "submission " << submission.id << ": " << submission.jobscripts.size() << " jobscript(s)\n";
    for (const auto& part : submission.submission_parts) {
      std::cout << "  " << jobflow::util::FormatTimestamp(part.submit_time) << " submitted";
      for (auto js_idx : part.jobscript_indices) std::cout << " " << js_idx;
      std::cout << "\n";
    }
    for (size_t i = 0; i < submission.jobscripts.size(); ++i) {
      const auto& metadata = submission.jobscripts[i].metadata;
      if (metadata.scheduler_job_id) std::cout << "  jobscript " << i << " job id " << *metadata.scheduler_job_id << "\n";
    }
  }
}

static void PrintPlan(const std::vector<jobflow::db::model::JobscriptRecord>& jobscripts) {
  for (size_t i = 0; i < jobscripts.size(); ++i) {
    const auto& js = jobscripts[i];
    std::cout << "jobscript " << i << " resources=" << js.resource_hash << " array=" << (js.is_array ? "yes" : "no") << "\n";

    std::cout << "  tasks:";
    for (auto id : js.task_insert_ids) std::cout << " " << id;
    std::cout << "\n  actions:";
    for (const auto& action : js.task_actions) std::cout << " (" << action[0] << "," << action[1] << "," << action[2] << ")";
    std::cout << "\n  elements: " << js.task_elements.size() << "\n";

    for (const auto& [upstream, dep] : js.dependencies) {
      std::cout << "  depends on " << upstream << (dep.is_array ? " (array)" : "") << "\n";
    }
  }
  if (jobscripts.empty()) std::cout << "nothing to submit\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string command     = argv[2];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = jobflow::config::ConfigLoader::LoadFromYaml(config_path);

    jobflow::observability::InitializeTracing(config);
    jobflow::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Open workflow
    // ------------------------------------------------------------
    auto workflow = jobflow::factory::Build(config);

    if (command == "summary") {
      PrintSummary(*workflow.store);
    } else if (command == "plan") {
      std::vector<uint64_t> task_indices;
      for (int i = 3; i < argc; ++i) task_indices.push_back(std::stoull(argv[i]));

      jobflow::scheduling::MetadataResourceResolver resolver;
      jobflow::scheduling::JobscriptPlanner         planner(*workflow.store, resolver);
      PrintPlan(planner.Plan(task_indices));
    } else if (command == "submissions") {
      PrintSubmissions(*workflow.store);
    } else {
      Usage();
      jobflow::observability::ShutdownLogging();
      jobflow::observability::ShutdownTracing();
      return 1;
    }

    jobflow::observability::ShutdownLogging();
    jobflow::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    JOBFLOW_LOG_ERROR("Fatal error", {StringField("command", command), StringField("error", e.what())});
    jobflow::observability::ShutdownLogging();
    jobflow::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
