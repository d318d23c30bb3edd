#pragma once

#include <google/protobuf/struct.pb.h>

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/iteration_record.hpp"
#include "internal/util/time.hpp"

namespace jobflow::db::model {

/*
  Scheduler-reported facts about one jobscript. Every field is optional;
  applying an update only overwrites the fields it carries.
*/
struct JobscriptMetadata {
  std::optional<google::protobuf::Struct> version_info;
  std::optional<util::TimePoint>          submit_time;
  std::optional<std::string>              submit_hostname;
  std::optional<std::string>              submit_machine;
  std::optional<std::vector<std::string>> submit_cmdline;
  std::optional<std::string>              os_name;
  std::optional<std::string>              shell_name;
  std::optional<std::string>              scheduler_name;
  std::optional<std::string>              scheduler_job_id;
  std::optional<int64_t>                  process_id;

  JobscriptMetadata MergedWith(const JobscriptMetadata& update) const;
};

struct JobscriptDependency {
  // jobscript element -> elements of the upstream jobscript it waits on
  std::map<uint64_t, std::vector<uint64_t>> js_element_mapping;
  bool                                      is_array = false;
};

// (task insert ID, action index, index into task_loop_idx)
using TaskAction = std::array<uint64_t, 3>;

struct JobscriptRecord {
  std::string              resource_hash;
  google::protobuf::Struct resources;

  std::vector<uint64_t>  task_insert_ids;
  std::vector<LoopIndex> task_loop_idx;
  std::vector<TaskAction> task_actions;

  // jobscript element -> task element index per task insert ID
  std::map<uint64_t, std::vector<uint64_t>> task_elements;

  // [jobscript action][jobscript element] -> run ID, -1 where absent
  std::vector<std::vector<int64_t>> run_ids;

  std::map<uint64_t, JobscriptDependency> dependencies;
  bool                                    is_array = false;

  JobscriptMetadata metadata;
};

struct SubmissionPart {
  util::TimePoint       submit_time;
  std::vector<uint64_t> jobscript_indices;
};

/*
  Jobscripts approved for execution. submission_parts only grows and is
  the log that makes a retried submission idempotent.
*/
struct SubmissionRecord {
  uint64_t id = 0;

  std::vector<JobscriptRecord> jobscripts;
  std::vector<SubmissionPart>  submission_parts;

  SubmissionRecord WithParts(const std::vector<SubmissionPart>& appended) const {
    SubmissionRecord next = *this;
    next.submission_parts.insert(next.submission_parts.end(), appended.begin(), appended.end());
    return next;
  }

  // Throws NotFound for an unknown jobscript index.
  SubmissionRecord WithJobscriptMetadata(uint64_t js_idx, const JobscriptMetadata& update) const;
};

} // namespace jobflow::db::model
