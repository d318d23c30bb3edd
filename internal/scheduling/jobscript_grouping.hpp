#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "internal/scheduling/resource_map.hpp"

namespace jobflow::scheduling {

struct JobscriptGroup {
  int64_t resources = 0; // index into the resource list

  // element index -> action indices, ascending
  std::map<uint64_t, std::vector<uint64_t>> elements;

  bool operator==(const JobscriptGroup&) const = default;
};

struct GroupingResult {
  std::vector<JobscriptGroup> jobscripts;

  // [action][element] -> jobscript index, kNoRun where uncovered
  CellMatrix js_map;
};

/*
  Single deterministic pass over a resource matrix.

  Actions are visited in ascending order and, within an action, resource
  indices in ascending order. For each, the unallocated elements of that
  row with that resource form a jobscript, which is then extended down into
  later actions of the same elements for as long as the resource does not
  change. Empty cells take the resource being placed while the extension
  is computed, so an empty cell does not end a run of equal resources.

  Not a global optimum: earlier choices are never revisited.

  Throws std::invalid_argument for ragged rows or for entries below kNoRun.
*/
GroupingResult GroupResourceMapIntoJobscripts(const CellMatrix& resource_map);

} // namespace jobflow::scheduling
