#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace jobflow::db {

/*
  Entity kinds the backends store. Each backend maps a kind to the named
  resource(s) that must be held open to read or write it.
*/
enum class EntityKind {
  kTask,
  kElement,
  kIteration,
  kRun,
  kParameter,
  kLoop,
  kSubmission,
  kTemplateComponents,
  kWorkflow,
};

const char* EntityKindName(EntityKind kind);

/*
  Commit steps in execution order. Later steps may rely on records created
  by earlier ones (runs follow the iterations that own them).
*/
enum class CommitStep {
  kTasks,
  kLoops,
  kSubmissions,
  kSubmissionParts,
  kElementIds,
  kElements,
  kElementSets,
  kIterationIds,
  kIterations,
  kRunIds,
  kRunsInitialised,
  kRuns,
  kRunSubmissionIndices,
  kRunSkips,
  kRunStarts,
  kRunEnds,
  kJobscriptMetadata,
  kParameters,
  kFiles,
  kTemplateComponents,
  kParameterSources,
  kLoopIndices,
  kLoopNumIterations,
  kLoopParents,
};

inline constexpr std::array<CommitStep, 24> kCommitOrder = {
    CommitStep::kTasks,           CommitStep::kLoops,
    CommitStep::kSubmissions,     CommitStep::kSubmissionParts,
    CommitStep::kElementIds,      CommitStep::kElements,
    CommitStep::kElementSets,     CommitStep::kIterationIds,
    CommitStep::kIterations,      CommitStep::kRunIds,
    CommitStep::kRunsInitialised, CommitStep::kRuns,
    CommitStep::kRunSubmissionIndices, CommitStep::kRunSkips,
    CommitStep::kRunStarts,       CommitStep::kRunEnds,
    CommitStep::kJobscriptMetadata, CommitStep::kParameters,
    CommitStep::kFiles,           CommitStep::kTemplateComponents,
    CommitStep::kParameterSources, CommitStep::kLoopIndices,
    CommitStep::kLoopNumIterations, CommitStep::kLoopParents,
};

const char* CommitStepName(CommitStep step);

// Entity kinds a step writes. File contents go to the content area, which
// is not a repository resource, so kFiles touches none.
std::vector<EntityKind> KindsWrittenBy(CommitStep step);

} // namespace jobflow::db
