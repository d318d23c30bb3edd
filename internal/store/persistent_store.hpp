#pragma once

#include <arrow/array.h>
#include <arrow/chunked_array.h>
#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/storage/common/array_codec.hpp"
#include "internal/storage/content_store.hpp"
#include "internal/store/commit_resource_map.hpp"
#include "internal/store/pending_changes.hpp"
#include "internal/store/record_cache.hpp"

namespace jobflow::store {

struct StoreOptions {
  bool use_cache     = false;
  bool content_fsync = false;

  // values per record batch of a stored array
  int64_t array_chunk_length = storage::common::kDefaultArrayChunkLength;
};

struct IterationView {
  db::model::IterationRecord                              iteration;
  std::map<uint64_t, std::vector<db::model::RunRecord>> runs; // by action index
};

struct ElementView {
  db::model::ElementRecord   element;
  std::vector<IterationView> iterations;
};

/*
  Staged-commit store over one workflow.

  Every mutation is validated against the merged (durable + pending) view
  and then recorded in the pending stage; nothing reaches the backend until
  Save() or CommitAll(). IDs are allocated here as
  durable count + pending count, so they depend only on call order.

  Reads merge the stage over durable records and return them in the order
  requested. Unknown IDs raise util::NotFound.

  Single writer. Not safe for concurrent mutation.
*/
class PersistentStore {
 public:
  PersistentStore(std::shared_ptr<db::Repository> repository, storage::ContentStorePtr content, StoreOptions options = {});

  // Explicit grouping, for backends whose step table differs from the one
  // derived from Repository::ResourcesFor.
  PersistentStore(std::shared_ptr<db::Repository> repository, storage::ContentStorePtr content, CommitResourceMap resource_map,
                  StoreOptions options = {});

  PersistentStore(const PersistentStore&)            = delete;
  PersistentStore& operator=(const PersistentStore&) = delete;

  // ---------------------------------------------------------------------
  // Creation
  // ---------------------------------------------------------------------

  // input_types are the parameter types the task consumes; a type still
  // iterable in an earlier loop without recorded iterations is rejected.
  uint64_t AddTask(uint64_t index, google::protobuf::Struct task_template, const std::set<std::string>& input_types = {});

  // Returns the element-set index within the task.
  uint64_t AddElementSet(uint64_t task_id, google::protobuf::Struct element_set);

  uint64_t AddElement(uint64_t task_id, uint64_t es_idx, std::map<std::string, int64_t> seq_idx, std::map<std::string, int64_t> src_idx);

  // Every schema parameter must have an entry in data_idx, and every
  // parameter it references must exist.
  uint64_t AddElementIteration(uint64_t element_id, db::model::DataIndex data_idx, std::vector<std::string> schema_parameters,
                               db::model::LoopIndex loop_idx = {});

  uint64_t AddRun(uint64_t iteration_id, uint64_t action_idx, std::vector<uint64_t> commands_idx, db::model::DataIndex data_idx,
                  google::protobuf::Struct metadata = {});

  // Iterable parameters are derived from task_types, one entry per loop task.
  uint64_t AddLoop(std::string name, std::vector<uint64_t> task_indices, std::vector<std::string> parents,
                   db::model::IterationCounts num_added_iterations = {}, const std::vector<db::model::TaskParameterTypes>& task_types = {});

  uint64_t AddSubmission(std::vector<db::model::JobscriptRecord> jobscripts);

  uint64_t AddSetParameter(google::protobuf::Value data, db::model::ParamSource source, std::map<std::string, std::string> type_lookup = {});
  uint64_t AddUnsetParameter(db::model::ParamSource source);

  // A set file parameter. With store_contents the file (or the literal
  // contents, when given) is copied into the content area on commit.
  uint64_t AddFile(bool store_contents, std::string path, db::model::ParamSource source, std::optional<std::string> contents = std::nullopt);

  // A set parameter holding a numeric Arrow array, kept in the content area
  // in chunks. shape defaults to {length} and must multiply out to it.
  uint64_t AddArrayParameter(const std::shared_ptr<arrow::Array>& values, db::model::ParamSource source, std::vector<int64_t> shape = {});

  // Returns the number of components not already known.
  size_t AddTemplateComponents(const db::model::TemplateComponents& components);

  // Records the workflow name, creation info and template. Written straight
  // to the backend rather than staged; throws util::AlreadyExists when the
  // workflow already has them.
  void CreateWorkflow(const db::model::WorkflowInfo& info);

  // ---------------------------------------------------------------------
  // Updates
  // ---------------------------------------------------------------------

  void SetRunsInitialised(uint64_t iteration_id);
  void UpdateLoopIndex(uint64_t iteration_id, db::model::LoopIndex loop_idx);
  void AddSubmissionPart(uint64_t submission_id, util::TimePoint submit_time, std::vector<uint64_t> jobscript_indices);
  void SetRunSubmissionIndex(const std::vector<uint64_t>& run_ids, int64_t submission_idx);
  void SetRunSkip(uint64_t run_id);
  void SetRunStart(uint64_t run_id, util::TimePoint time, std::optional<google::protobuf::Struct> snapshot, std::string hostname);
  void SetRunEnd(uint64_t run_id, util::TimePoint time, std::optional<google::protobuf::Struct> snapshot, int32_t exit_code, bool success);
  void SetJobscriptMetadata(uint64_t submission_id, uint64_t js_idx, const db::model::JobscriptMetadata& metadata);
  void SetParameterValue(uint64_t parameter_id, google::protobuf::Value data, std::map<std::string, std::string> type_lookup = {});
  void SetParameterFile(uint64_t parameter_id, bool store_contents, std::string path, std::optional<std::string> contents = std::nullopt);
  void SetParameterArray(uint64_t parameter_id, const std::shared_ptr<arrow::Array>& values, std::vector<int64_t> shape = {});
  void UpdateParameterSource(uint64_t parameter_id, const db::model::ParamSource& source);
  void UpdateLoopNumIterations(uint64_t loop_id, std::vector<int64_t> parent_idx, int64_t num_iterations);
  void UpdateLoopParents(uint64_t loop_id, std::vector<std::string> parents, db::model::IterationCounts counts);

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  std::vector<db::model::TaskRecord>       GetTasks(const std::vector<uint64_t>& ids);
  std::vector<db::model::ElementRecord>    GetElements(const std::vector<uint64_t>& ids);
  std::vector<db::model::IterationRecord>  GetIterations(const std::vector<uint64_t>& ids);
  std::vector<db::model::RunRecord>        GetRuns(const std::vector<uint64_t>& ids);
  std::vector<db::model::ParameterRecord>  GetParameters(const std::vector<uint64_t>& ids);
  std::vector<db::model::LoopRecord>       GetLoops(const std::vector<uint64_t>& ids);
  std::vector<db::model::SubmissionRecord> GetSubmissions(const std::vector<uint64_t>& ids);

  std::vector<db::model::TaskRecord>       GetAllTasks();
  std::vector<db::model::ElementRecord>    GetAllElements();
  std::vector<db::model::IterationRecord>  GetAllIterations();
  std::vector<db::model::RunRecord>        GetAllRuns();
  std::vector<db::model::ParameterRecord>  GetAllParameters();
  std::vector<db::model::LoopRecord>       GetAllLoops();
  std::vector<db::model::SubmissionRecord> GetAllSubmissions();

  std::vector<bool>                   GetParameterSetStatuses(const std::vector<uint64_t>& ids);
  std::vector<db::model::ParamSource> GetParameterSources(const std::vector<uint64_t>& ids);
  std::vector<bool>                   CheckParametersExist(const std::vector<uint64_t>& ids);

  // Elements of a task by their index within it, each with its iterations
  // and their runs. Empty indices means every element.
  std::vector<ElementView> GetTaskElements(uint64_t task_id, const std::vector<uint64_t>& element_indices = {});

  db::model::TemplateComponents GetTemplateComponents();

  // Throws util::NotFound before CreateWorkflow.
  db::model::WorkflowInfo GetWorkflowInfo();

  // Stored contents of a file parameter, staged or committed.
  std::shared_ptr<arrow::Buffer> GetFileContents(uint64_t parameter_id);

  // Values of an array parameter, one chunk per stored record batch.
  std::shared_ptr<arrow::ChunkedArray> GetParameterArray(uint64_t parameter_id);

  uint64_t NumTasks();
  uint64_t NumElements();
  uint64_t NumIterations();
  uint64_t NumRuns();
  uint64_t NumParameters();
  uint64_t NumLoops();
  uint64_t NumSubmissions();

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  // No-op in batch mode or when nothing is pending; otherwise one CommitAll.
  void Save();

  // Applies every populated bucket, group by group. Throws
  // util::CommitFailure for the first failing group after the remaining
  // groups have run; the failed groups' buckets stay pending.
  void CommitAll();

  bool HasPending() const {
    return !pending_.IsEmpty();
  }
  const PendingChanges& Pending() const {
    return pending_;
  }

  bool InBatchMode() const {
    return batch_depth_ > 0;
  }

  bool CacheEnabled() const {
    return use_cache_ || cache_depth_ > 0;
  }
  void SetUseCache(bool enabled);

  // Drops caches and cached counts so the next read goes to the backend.
  void Reload();

  const CommitResourceMap& ResourceMap() const {
    return resource_map_;
  }
  db::Repository& Backend() {
    return *repository_;
  }

  // Defers Save() until Commit(); nests. Destroying an uncommitted scope
  // leaves the stage pending.
  class BatchScope {
   public:
    explicit BatchScope(PersistentStore& store);
    ~BatchScope();

    BatchScope(const BatchScope&)            = delete;
    BatchScope& operator=(const BatchScope&) = delete;

    void Commit();

   private:
    PersistentStore& store_;
    bool             open_ = true;
  };

  // Enables the read cache for its lifetime.
  class CacheScope {
   public:
    explicit CacheScope(PersistentStore& store);
    ~CacheScope();

    CacheScope(const CacheScope&)            = delete;
    CacheScope& operator=(const CacheScope&) = delete;

   private:
    PersistentStore& store_;
  };

 private:
  enum CountSlot { kTaskCount, kElementCount, kIterationCount, kRunCount, kParameterCount, kLoopCount, kSubmissionCount, kNumCountSlots };

  std::unique_ptr<db::Transaction> BeginRead(db::EntityKind kind);

  uint64_t DurableCount(db::EntityKind kind);
  void     InvalidateKind(db::EntityKind kind);

  // Throws NotFound unless id < durable + pending.
  void RequireTask(uint64_t id);
  void RequireElement(uint64_t id);
  void RequireIteration(uint64_t id);
  void RequireRun(uint64_t id);
  void RequireParameter(uint64_t id);
  void RequireLoop(uint64_t id);
  void RequireSubmission(uint64_t id);
  void RequireParameters(const db::model::DataIndex& data_idx);

  db::model::TaskRecord       MergedTask(uint64_t id);
  db::model::ElementRecord    MergedElement(uint64_t id);
  db::model::IterationRecord  MergedIteration(uint64_t id);
  db::model::RunRecord        MergedRun(uint64_t id);
  db::model::ParameterRecord  MergedParameter(uint64_t id);
  db::model::LoopRecord       MergedLoop(uint64_t id);
  db::model::SubmissionRecord MergedSubmission(uint64_t id);

  template <typename Record, typename Getter>
  std::vector<Record> ReadMerged(db::EntityKind kind, const std::map<uint64_t, Record>& staged, RecordCache<Record>& cache,
                                 const std::vector<uint64_t>& ids, Getter get);

  std::shared_ptr<arrow::Buffer> StagedOrStoredContents(const std::string& content_key);
  db::model::ArrayReference      StageArray(uint64_t parameter_id, const arrow::Array& values, std::vector<int64_t> shape);
  db::model::FileReference StageFile(uint64_t parameter_id, bool store_contents, std::string path, std::optional<std::string> contents);

  void RunStep(db::CommitStep step, db::Transaction& tx);
  void CommitTasks(db::Transaction& tx);
  void CommitLoops(db::Transaction& tx);
  void CommitSubmissions(db::Transaction& tx);
  void CommitSubmissionParts(db::Transaction& tx);
  void CommitElementIds(db::Transaction& tx);
  void CommitElements(db::Transaction& tx);
  void CommitElementSets(db::Transaction& tx);
  void CommitIterationIds(db::Transaction& tx);
  void CommitIterations(db::Transaction& tx);
  void CommitRunIds(db::Transaction& tx);
  void CommitRunsInitialised(db::Transaction& tx);
  void CommitRuns(db::Transaction& tx);
  void CommitRunSubmissionIndices(db::Transaction& tx);
  void CommitRunSkips(db::Transaction& tx);
  void CommitRunStarts(db::Transaction& tx);
  void CommitRunEnds(db::Transaction& tx);
  void CommitJobscriptMetadata(db::Transaction& tx);
  void CommitParameters(db::Transaction& tx);
  void CommitFiles();
  void CommitTemplateComponents(db::Transaction& tx);
  void CommitParameterSources(db::Transaction& tx);
  void CommitLoopIndices(db::Transaction& tx);
  void CommitLoopNumIterations(db::Transaction& tx);
  void CommitLoopParents(db::Transaction& tx);

  std::shared_ptr<db::Repository> repository_;
  storage::ContentStorePtr        content_;
  CommitResourceMap               resource_map_;
  StoreOptions                    options_;

  PendingChanges pending_;

  bool use_cache_   = false;
  int  batch_depth_ = 0;
  int  cache_depth_ = 0;

  std::optional<uint64_t> durable_counts_[kNumCountSlots];

  std::optional<db::model::WorkflowInfo> workflow_info_;

  RecordCache<db::model::TaskRecord>       task_cache_;
  RecordCache<db::model::ElementRecord>    element_cache_;
  RecordCache<db::model::IterationRecord>  iteration_cache_;
  RecordCache<db::model::RunRecord>        run_cache_;
  RecordCache<db::model::ParameterRecord>  parameter_cache_;
  RecordCache<db::model::LoopRecord>       loop_cache_;
  RecordCache<db::model::SubmissionRecord> submission_cache_;
};

} // namespace jobflow::store
