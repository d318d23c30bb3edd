#include "internal/db/model/run_record.hpp"

namespace jobflow::db::model {

const char* RunStatusName(RunStatus status) {
  switch (status) {
    case RunStatus::kPending:
      return "pending";
    case RunStatus::kSubmitted:
      return "submitted";
    case RunStatus::kRunning:
      return "running";
    case RunStatus::kSkipped:
      return "skipped";
    case RunStatus::kSuccess:
      return "success";
    case RunStatus::kError:
      return "error";
  }
  return "unknown";
}

RunStatus RunRecord::Status() const {
  if (skip) return RunStatus::kSkipped;
  if (end_time) return success.value_or(false) ? RunStatus::kSuccess : RunStatus::kError;
  if (start_time) return RunStatus::kRunning;
  if (submission_idx) return RunStatus::kSubmitted;
  return RunStatus::kPending;
}

RunRecord RunRecord::WithSubmissionIdx(int64_t sub_idx) const {
  RunRecord next      = *this;
  next.submission_idx = sub_idx;
  return next;
}

RunRecord RunRecord::WithSkip() const {
  RunRecord next = *this;
  next.skip      = true;
  return next;
}

RunRecord RunRecord::WithStart(util::TimePoint time, std::optional<google::protobuf::Struct> snapshot, std::string hostname) const {
  RunRecord next      = *this;
  next.start_time     = time;
  next.snapshot_start = std::move(snapshot);
  next.run_hostname   = std::move(hostname);
  return next;
}

RunRecord RunRecord::WithEnd(util::TimePoint time, std::optional<google::protobuf::Struct> snapshot, int32_t exit_code_value, bool success_value) const {
  RunRecord next    = *this;
  next.end_time     = time;
  next.snapshot_end = std::move(snapshot);
  next.exit_code    = exit_code_value;
  next.success      = success_value;
  return next;
}

} // namespace jobflow::db::model
