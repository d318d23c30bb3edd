#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/data_index.hpp"
#include "internal/util/time.hpp"

namespace jobflow::db::model {

enum class RunStatus {
  kPending,
  kSubmitted,
  kRunning,
  kSkipped,
  kSuccess,
  kError,
};

const char* RunStatusName(RunStatus status);

/*
  One concrete execution attempt of one schema action.

  Lifecycle updates (submission, skip, start, end) each produce a new
  record; a record is never edited in place.
*/

struct RunRecord {
  uint64_t id           = 0;
  uint64_t iteration_id = 0;
  uint64_t action_idx   = 0;

  std::vector<uint64_t>    commands_idx;
  DataIndex                data_idx;
  google::protobuf::Struct metadata;

  std::optional<int64_t> submission_idx;
  bool                   skip = false;

  std::optional<util::TimePoint>          start_time;
  std::optional<util::TimePoint>          end_time;
  std::optional<google::protobuf::Struct> snapshot_start;
  std::optional<google::protobuf::Struct> snapshot_end;
  std::optional<int32_t>                  exit_code;
  std::optional<bool>                     success;
  std::optional<std::string>              run_hostname;

  RunStatus Status() const;

  RunRecord WithSubmissionIdx(int64_t sub_idx) const;
  RunRecord WithSkip() const;
  RunRecord WithStart(util::TimePoint time, std::optional<google::protobuf::Struct> snapshot, std::string hostname) const;
  RunRecord WithEnd(util::TimePoint time, std::optional<google::protobuf::Struct> snapshot, int32_t exit_code, bool success) const;
};

} // namespace jobflow::db::model
