#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "internal/db/model/data_index.hpp"

namespace jobflow::db::model {

using LoopIndex = std::map<std::string, int64_t>;

/*
  One loop pass over an element.

  run_ids is keyed by schema action index and only grows. loop_idx and
  runs_initialised change through copy-on-write only.
*/

struct IterationRecord {
  uint64_t id         = 0;
  uint64_t element_id = 0;

  bool runs_initialised = false;

  DataIndex                data_idx;
  std::vector<std::string> schema_parameters;
  LoopIndex                loop_idx;

  std::map<uint64_t, std::vector<uint64_t>> run_ids;

  IterationRecord WithRunIds(uint64_t action_idx, const std::vector<uint64_t>& appended) const {
    IterationRecord next = *this;
    auto&           ids  = next.run_ids[action_idx];
    ids.insert(ids.end(), appended.begin(), appended.end());
    return next;
  }

  IterationRecord WithRunsInitialised() const {
    IterationRecord next  = *this;
    next.runs_initialised = true;
    return next;
  }

  IterationRecord WithLoopIdx(const LoopIndex& updates) const {
    IterationRecord next = *this;
    for (const auto& [loop, idx] : updates) next.loop_idx[loop] = idx;
    return next;
  }
};

} // namespace jobflow::db::model
