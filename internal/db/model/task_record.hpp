#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <vector>

namespace jobflow::db::model {

/*
  One node of the template DAG.

  element_ids only grows. Evolve operations return a new record; a record
  already handed to a caller is never modified.
*/

struct TaskRecord {
  uint64_t id    = 0;
  uint64_t index = 0;

  std::vector<uint64_t> element_ids;

  google::protobuf::Struct              task_template;
  std::vector<google::protobuf::Struct> element_sets;

  TaskRecord WithElementIds(const std::vector<uint64_t>& appended) const {
    TaskRecord next = *this;
    next.element_ids.insert(next.element_ids.end(), appended.begin(), appended.end());
    return next;
  }

  TaskRecord WithElementSets(const std::vector<google::protobuf::Struct>& appended) const {
    TaskRecord next = *this;
    next.element_sets.insert(next.element_sets.end(), appended.begin(), appended.end());
    return next;
  }
};

} // namespace jobflow::db::model
