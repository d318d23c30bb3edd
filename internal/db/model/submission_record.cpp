#include "internal/db/model/submission_record.hpp"

#include "internal/util/errors.hpp"

namespace jobflow::db::model {

namespace {

template <typename T>
void Overwrite(std::optional<T>& dst, const std::optional<T>& src) {
  if (src) dst = src;
}

} // namespace

JobscriptMetadata JobscriptMetadata::MergedWith(const JobscriptMetadata& update) const {
  JobscriptMetadata merged = *this;
  Overwrite(merged.version_info, update.version_info);
  Overwrite(merged.submit_time, update.submit_time);
  Overwrite(merged.submit_hostname, update.submit_hostname);
  Overwrite(merged.submit_machine, update.submit_machine);
  Overwrite(merged.submit_cmdline, update.submit_cmdline);
  Overwrite(merged.os_name, update.os_name);
  Overwrite(merged.shell_name, update.shell_name);
  Overwrite(merged.scheduler_name, update.scheduler_name);
  Overwrite(merged.scheduler_job_id, update.scheduler_job_id);
  Overwrite(merged.process_id, update.process_id);
  return merged;
}

SubmissionRecord SubmissionRecord::WithJobscriptMetadata(uint64_t js_idx, const JobscriptMetadata& update) const {
  if (js_idx >= jobscripts.size()) {
    throw util::NotFound("submission " + std::to_string(id) + " has no jobscript " + std::to_string(js_idx));
  }
  SubmissionRecord next           = *this;
  next.jobscripts[js_idx].metadata = jobscripts[js_idx].metadata.MergedWith(update);
  return next;
}

} // namespace jobflow::db::model
