#include "internal/db/api/commit_step.hpp"

namespace jobflow::db {

const char* EntityKindName(EntityKind kind) {
  switch (kind) {
    case EntityKind::kTask:
      return "task";
    case EntityKind::kElement:
      return "element";
    case EntityKind::kIteration:
      return "iteration";
    case EntityKind::kRun:
      return "run";
    case EntityKind::kParameter:
      return "parameter";
    case EntityKind::kLoop:
      return "loop";
    case EntityKind::kSubmission:
      return "submission";
    case EntityKind::kTemplateComponents:
      return "template_components";
    case EntityKind::kWorkflow:
      return "workflow";
  }
  return "unknown";
}

const char* CommitStepName(CommitStep step) {
  switch (step) {
    case CommitStep::kTasks:
      return "tasks";
    case CommitStep::kLoops:
      return "loops";
    case CommitStep::kSubmissions:
      return "submissions";
    case CommitStep::kSubmissionParts:
      return "submission_parts";
    case CommitStep::kElementIds:
      return "element_ids";
    case CommitStep::kElements:
      return "elements";
    case CommitStep::kElementSets:
      return "element_sets";
    case CommitStep::kIterationIds:
      return "iteration_ids";
    case CommitStep::kIterations:
      return "iterations";
    case CommitStep::kRunIds:
      return "run_ids";
    case CommitStep::kRunsInitialised:
      return "runs_initialised";
    case CommitStep::kRuns:
      return "runs";
    case CommitStep::kRunSubmissionIndices:
      return "run_submission_indices";
    case CommitStep::kRunSkips:
      return "run_skips";
    case CommitStep::kRunStarts:
      return "run_starts";
    case CommitStep::kRunEnds:
      return "run_ends";
    case CommitStep::kJobscriptMetadata:
      return "jobscript_metadata";
    case CommitStep::kParameters:
      return "parameters";
    case CommitStep::kFiles:
      return "files";
    case CommitStep::kTemplateComponents:
      return "template_components";
    case CommitStep::kParameterSources:
      return "parameter_sources";
    case CommitStep::kLoopIndices:
      return "loop_indices";
    case CommitStep::kLoopNumIterations:
      return "loop_num_iterations";
    case CommitStep::kLoopParents:
      return "loop_parents";
  }
  return "unknown";
}

std::vector<EntityKind> KindsWrittenBy(CommitStep step) {
  switch (step) {
    case CommitStep::kTasks:
    case CommitStep::kElementIds:
    case CommitStep::kElementSets:
      return {EntityKind::kTask};
    case CommitStep::kLoops:
    case CommitStep::kLoopNumIterations:
    case CommitStep::kLoopParents:
      return {EntityKind::kLoop};
    case CommitStep::kSubmissions:
    case CommitStep::kSubmissionParts:
    case CommitStep::kJobscriptMetadata:
      return {EntityKind::kSubmission};
    case CommitStep::kElements:
    case CommitStep::kIterationIds:
      return {EntityKind::kElement};
    case CommitStep::kIterations:
    case CommitStep::kRunIds:
    case CommitStep::kRunsInitialised:
    case CommitStep::kLoopIndices:
      return {EntityKind::kIteration};
    case CommitStep::kRuns:
    case CommitStep::kRunSubmissionIndices:
    case CommitStep::kRunSkips:
    case CommitStep::kRunStarts:
    case CommitStep::kRunEnds:
      return {EntityKind::kRun};
    case CommitStep::kParameters:
    case CommitStep::kParameterSources:
      return {EntityKind::kParameter};
    case CommitStep::kTemplateComponents:
      return {EntityKind::kTemplateComponents};
    case CommitStep::kFiles:
      return {};
  }
  return {};
}

} // namespace jobflow::db
