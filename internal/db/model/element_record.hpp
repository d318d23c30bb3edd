#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace jobflow::db::model {

/*
  One parametrised repetition of a task.
*/

struct ElementRecord {
  uint64_t id      = 0;
  uint64_t task_id = 0;
  uint64_t index   = 0; // position within the owning task
  uint64_t es_idx  = 0; // originating element set

  std::map<std::string, int64_t> seq_idx;
  std::map<std::string, int64_t> src_idx;

  std::vector<uint64_t> iteration_ids;

  ElementRecord WithIterationIds(const std::vector<uint64_t>& appended) const {
    ElementRecord next = *this;
    next.iteration_ids.insert(next.iteration_ids.end(), appended.begin(), appended.end());
    return next;
  }
};

} // namespace jobflow::db::model
