#pragma once

#include <arrow/buffer.h>
#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/commit_step.hpp"
#include "internal/db/model/element_record.hpp"
#include "internal/db/model/iteration_record.hpp"
#include "internal/db/model/loop_record.hpp"
#include "internal/db/model/parameter_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/submission_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/db/model/template_components.hpp"
#include "internal/util/time.hpp"

namespace jobflow::store {

struct RunStart {
  util::TimePoint                         time;
  std::optional<google::protobuf::Struct> snapshot;
  std::string                             hostname;
};

struct RunEnd {
  util::TimePoint                         time;
  std::optional<google::protobuf::Struct> snapshot;
  int32_t                                 exit_code = 0;
  bool                                    success   = false;
};

// Either a value or a file reference; exactly one is present.
struct ParameterValueUpdate {
  std::optional<google::protobuf::Value>   value;
  std::map<std::string, std::string>       type_lookup;
  std::optional<db::model::FileReference>  file;
  std::optional<db::model::ArrayReference> array;
};

struct LoopParentsUpdate {
  std::vector<std::string>   parents;
  db::model::IterationCounts counts;
};

// Contents headed for the content area. Exactly one of source_path and
// contents is set.
struct PendingFile {
  std::string                    content_key;
  std::optional<std::string>     source_path;
  std::shared_ptr<arrow::Buffer> contents;
};

/*
  In-memory stage of not-yet-durable mutations.

  One bucket per kind of mutation. Creation buckets hold whole records,
  keyed by their already-allocated ID; update buckets hold partial changes
  keyed by the ID they apply to, whether that entity is durable or still
  pending itself.

  The stage is a plain value: copying it is how a commit group snapshots
  it before running.
*/
struct PendingChanges {
  // creations
  std::map<uint64_t, db::model::TaskRecord>       add_tasks;
  std::map<uint64_t, db::model::LoopRecord>       add_loops;
  std::map<uint64_t, db::model::SubmissionRecord> add_submissions;
  std::map<uint64_t, db::model::ElementRecord>    add_elements;
  std::map<uint64_t, db::model::IterationRecord>  add_iterations;
  std::map<uint64_t, db::model::RunRecord>        add_runs;
  std::map<uint64_t, db::model::ParameterRecord>  add_parameters;
  std::map<std::string, PendingFile>              add_files;
  db::model::TemplateComponents                   add_template_components;

  // appends
  std::map<uint64_t, std::vector<db::model::SubmissionPart>>         add_submission_parts;
  std::map<uint64_t, std::vector<uint64_t>>                          add_element_ids;
  std::map<uint64_t, std::vector<google::protobuf::Struct>>          add_element_sets;
  std::map<uint64_t, std::vector<uint64_t>>                          add_iteration_ids;
  std::map<uint64_t, std::map<uint64_t, std::vector<uint64_t>>>      add_run_ids;

  // updates
  std::set<uint64_t>                                                   set_runs_initialised;
  std::map<uint64_t, int64_t>                                          set_run_submission_idx;
  std::set<uint64_t>                                                   set_run_skips;
  std::map<uint64_t, RunStart>                                         set_run_starts;
  std::map<uint64_t, RunEnd>                                           set_run_ends;
  std::map<uint64_t, std::map<uint64_t, db::model::JobscriptMetadata>> set_jobscript_metadata;
  std::map<uint64_t, ParameterValueUpdate>                             set_parameters;
  std::map<uint64_t, db::model::ParamSource>                           update_param_sources;
  std::map<uint64_t, db::model::LoopIndex>                             update_loop_indices;
  std::map<uint64_t, db::model::IterationCounts>                       update_loop_num_iterations;
  std::map<uint64_t, LoopParentsUpdate>                                update_loop_parents;

  bool IsEmpty() const;
  void Reset();

  // True when the bucket the step drains has anything in it.
  bool HasWork(db::CommitStep step) const;

  // Number of entries the step would apply.
  size_t EntryCount(db::CommitStep step) const;

  // Human-readable list of populated buckets, for logs.
  std::string Describe() const;

  // Pending partial updates laid over a record, durable or pending.
  db::model::TaskRecord       Overlay(db::model::TaskRecord record) const;
  db::model::ElementRecord    Overlay(db::model::ElementRecord record) const;
  db::model::IterationRecord  Overlay(db::model::IterationRecord record) const;
  db::model::RunRecord        Overlay(db::model::RunRecord record) const;
  db::model::ParameterRecord  Overlay(db::model::ParameterRecord record) const;
  db::model::LoopRecord       Overlay(db::model::LoopRecord record) const;
  db::model::SubmissionRecord Overlay(db::model::SubmissionRecord record) const;

  // Drop partial updates already folded into a record being created.
  void PruneTask(uint64_t id);
  void PruneElement(uint64_t id);
  void PruneIteration(uint64_t id);
  void PruneRun(uint64_t id);
  void PruneParameter(uint64_t id);
  void PruneLoop(uint64_t id);
  void PruneSubmission(uint64_t id);
};

} // namespace jobflow::store
