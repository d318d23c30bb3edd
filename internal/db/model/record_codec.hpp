#pragma once

#include <google/protobuf/map.h>

#include "internal/db/model/element_record.hpp"
#include "internal/db/model/iteration_record.hpp"
#include "internal/db/model/loop_record.hpp"
#include "internal/db/model/parameter_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/submission_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/db/model/template_components.hpp"
#include "internal/db/model/workflow_info.hpp"
#include "jobflow/v1.hpp"

namespace jobflow::db::model {

/*
  Record <-> durable message translation.

  Every backend stores the messages below, so encode/decode is shared and
  the in-memory records never leak backend types.
*/

v1::Task   Encode(const TaskRecord& r);
TaskRecord Decode(const v1::Task& m);

v1::Element   Encode(const ElementRecord& r);
ElementRecord Decode(const v1::Element& m);

v1::ElementIteration Encode(const IterationRecord& r);
IterationRecord      Decode(const v1::ElementIteration& m);

v1::Run   Encode(const RunRecord& r);
RunRecord Decode(const v1::Run& m);

v1::Parameter   Encode(const ParameterRecord& r);
ParameterRecord Decode(const v1::Parameter& m);

v1::Loop   Encode(const LoopRecord& r);
LoopRecord Decode(const v1::Loop& m);

v1::Submission   Encode(const SubmissionRecord& r);
SubmissionRecord Decode(const v1::Submission& m);

v1::WorkflowInfo Encode(const WorkflowInfo& r);
WorkflowInfo     Decode(const v1::WorkflowInfo& m);

void               EncodeComponents(const TemplateComponents& components, google::protobuf::Map<std::string, v1::ComponentSet>* out);
TemplateComponents DecodeComponents(const google::protobuf::Map<std::string, v1::ComponentSet>& m);

} // namespace jobflow::db::model
