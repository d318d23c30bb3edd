#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

#include "internal/util/time.hpp"

namespace jobflow::db::model {

struct CreationInfo {
  std::string     app_name;
  std::string     app_version;
  util::TimePoint create_time;
  std::string     ts_fmt;      // strftime format of stored timestamps
  std::string     ts_name_fmt; // strftime format used in generated names
};

/*
  Workflow-level metadata, written once when the workflow is created and
  never changed after.
*/
struct WorkflowInfo {
  std::string              name;
  CreationInfo             creation;
  google::protobuf::Struct workflow_template;
};

} // namespace jobflow::db::model
