#include "internal/db/model/record_codec.hpp"

namespace jobflow::db::model {

namespace {

template <typename K, typename V>
std::map<K, V> ToStdMap(const google::protobuf::Map<K, V>& m) {
  std::map<K, V> out;
  for (const auto& [k, v] : m) out.emplace(k, v);
  return out;
}

template <typename K, typename V>
void FromStdMap(const std::map<K, V>& src, google::protobuf::Map<K, V>* dst) {
  for (const auto& [k, v] : src) (*dst)[k] = v;
}

template <typename T>
std::vector<T> ToVector(const google::protobuf::RepeatedField<T>& f) {
  return std::vector<T>(f.begin(), f.end());
}

void EncodeDataIndex(const DataIndex& idx, google::protobuf::Map<std::string, v1::DataIndexEntry>* out) {
  for (const auto& [path, value] : idx) {
    auto& entry = (*out)[path];
    if (const auto* single = std::get_if<uint64_t>(&value)) {
      entry.set_id(*single);
    } else {
      for (auto id : std::get<ParameterIds>(value)) entry.mutable_group()->add_ids(id);
    }
  }
}

DataIndex DecodeDataIndex(const google::protobuf::Map<std::string, v1::DataIndexEntry>& m) {
  DataIndex idx;
  for (const auto& [path, entry] : m) {
    if (entry.has_group()) {
      idx.emplace(path, ToVector(entry.group().ids()));
    } else {
      idx.emplace(path, entry.id());
    }
  }
  return idx;
}

void EncodeSource(const ParamSource& source, google::protobuf::Map<std::string, v1::SourceValue>* out) {
  for (const auto& [key, value] : source) {
    auto& dst = (*out)[key];
    if (const auto* i = std::get_if<int64_t>(&value)) {
      dst.set_int_value(*i);
    } else {
      dst.set_string_value(std::get<std::string>(value));
    }
  }
}

ParamSource DecodeSource(const google::protobuf::Map<std::string, v1::SourceValue>& m) {
  ParamSource source;
  for (const auto& [key, value] : m) {
    if (value.value_case() == v1::SourceValue::kIntValue) {
      source.emplace(key, value.int_value());
    } else {
      source.emplace(key, value.string_value());
    }
  }
  return source;
}

v1::JobscriptMetadata EncodeMetadata(const JobscriptMetadata& r) {
  v1::JobscriptMetadata m;
  if (r.version_info) *m.mutable_version_info() = *r.version_info;
  if (r.submit_time) *m.mutable_submit_time() = util::ToProto(*r.submit_time);
  if (r.submit_hostname) m.set_submit_hostname(*r.submit_hostname);
  if (r.submit_machine) m.set_submit_machine(*r.submit_machine);
  if (r.submit_cmdline) {
    for (const auto& arg : *r.submit_cmdline) m.add_submit_cmdline(arg);
  }
  if (r.os_name) m.set_os_name(*r.os_name);
  if (r.shell_name) m.set_shell_name(*r.shell_name);
  if (r.scheduler_name) m.set_scheduler_name(*r.scheduler_name);
  if (r.scheduler_job_id) m.set_scheduler_job_id(*r.scheduler_job_id);
  if (r.process_id) {
    m.set_has_process_id(true);
    m.set_process_id(*r.process_id);
  }
  return m;
}

JobscriptMetadata DecodeMetadata(const v1::JobscriptMetadata& m) {
  JobscriptMetadata r;
  if (m.has_version_info()) r.version_info = m.version_info();
  if (m.has_submit_time()) r.submit_time = util::FromProto(m.submit_time());
  if (!m.submit_hostname().empty()) r.submit_hostname = m.submit_hostname();
  if (!m.submit_machine().empty()) r.submit_machine = m.submit_machine();
  if (m.submit_cmdline_size() > 0) r.submit_cmdline = std::vector<std::string>(m.submit_cmdline().begin(), m.submit_cmdline().end());
  if (!m.os_name().empty()) r.os_name = m.os_name();
  if (!m.shell_name().empty()) r.shell_name = m.shell_name();
  if (!m.scheduler_name().empty()) r.scheduler_name = m.scheduler_name();
  if (!m.scheduler_job_id().empty()) r.scheduler_job_id = m.scheduler_job_id();
  if (m.has_process_id()) r.process_id = m.process_id();
  return r;
}

v1::Jobscript EncodeJobscript(const JobscriptRecord& r) {
  v1::Jobscript m;
  m.set_resource_hash(r.resource_hash);
  *m.mutable_resources() = r.resources;
  for (auto id : r.task_insert_ids) m.add_task_insert_ids(id);
  for (const auto& loop_idx : r.task_loop_idx) FromStdMap(loop_idx, m.add_task_loop_idx()->mutable_values());
  for (const auto& action : r.task_actions) {
    auto* a = m.add_task_actions();
    a->set_task_insert_id(action[0]);
    a->set_action_idx(action[1]);
    a->set_loop_idx_index(action[2]);
  }
  for (const auto& [js_elem, task_elems] : r.task_elements) {
    auto& list = (*m.mutable_task_elements())[js_elem];
    for (auto idx : task_elems) list.add_indices(idx);
  }
  for (const auto& row : r.run_ids) {
    auto* dst = m.add_run_ids();
    for (auto id : row) dst->add_run_ids(id);
  }
  for (const auto& [js_idx, dep] : r.dependencies) {
    auto& dst = (*m.mutable_dependencies())[js_idx];
    dst.set_is_array(dep.is_array);
    for (const auto& [js_elem, upstream] : dep.js_element_mapping) {
      auto& list = (*dst.mutable_js_element_mapping())[js_elem];
      for (auto idx : upstream) list.add_indices(idx);
    }
  }
  m.set_is_array(r.is_array);
  *m.mutable_metadata() = EncodeMetadata(r.metadata);
  return m;
}

JobscriptRecord DecodeJobscript(const v1::Jobscript& m) {
  JobscriptRecord r;
  r.resource_hash   = m.resource_hash();
  r.resources       = m.resources();
  r.task_insert_ids = ToVector(m.task_insert_ids());
  for (const auto& loop_idx : m.task_loop_idx()) r.task_loop_idx.push_back(ToStdMap(loop_idx.values()));
  for (const auto& a : m.task_actions()) r.task_actions.push_back({a.task_insert_id(), a.action_idx(), a.loop_idx_index()});
  for (const auto& [js_elem, list] : m.task_elements()) r.task_elements[js_elem] = ToVector(list.indices());
  for (const auto& row : m.run_ids()) r.run_ids.push_back(ToVector(row.run_ids()));
  for (const auto& [js_idx, dep] : m.dependencies()) {
    auto& dst    = r.dependencies[js_idx];
    dst.is_array = dep.is_array();
    for (const auto& [js_elem, list] : dep.js_element_mapping()) dst.js_element_mapping[js_elem] = ToVector(list.indices());
  }
  r.is_array = m.is_array();
  r.metadata = DecodeMetadata(m.metadata());
  return r;
}

} // namespace

// ------------------------------------------------------------
// Tasks / elements / iterations
// ------------------------------------------------------------

v1::Task Encode(const TaskRecord& r) {
  v1::Task m;
  m.set_id(r.id);
  m.set_index(r.index);
  for (auto id : r.element_ids) m.add_element_ids(id);
  *m.mutable_task_template() = r.task_template;
  for (const auto& es : r.element_sets) *m.add_element_sets() = es;
  return m;
}

TaskRecord Decode(const v1::Task& m) {
  TaskRecord r;
  r.id            = m.id();
  r.index         = m.index();
  r.element_ids   = ToVector(m.element_ids());
  r.task_template = m.task_template();
  r.element_sets.assign(m.element_sets().begin(), m.element_sets().end());
  return r;
}

v1::Element Encode(const ElementRecord& r) {
  v1::Element m;
  m.set_id(r.id);
  m.set_task_id(r.task_id);
  m.set_index(r.index);
  m.set_es_idx(r.es_idx);
  FromStdMap(r.seq_idx, m.mutable_seq_idx());
  FromStdMap(r.src_idx, m.mutable_src_idx());
  for (auto id : r.iteration_ids) m.add_iteration_ids(id);
  return m;
}

ElementRecord Decode(const v1::Element& m) {
  ElementRecord r;
  r.id            = m.id();
  r.task_id       = m.task_id();
  r.index         = m.index();
  r.es_idx        = m.es_idx();
  r.seq_idx       = ToStdMap(m.seq_idx());
  r.src_idx       = ToStdMap(m.src_idx());
  r.iteration_ids = ToVector(m.iteration_ids());
  return r;
}

v1::ElementIteration Encode(const IterationRecord& r) {
  v1::ElementIteration m;
  m.set_id(r.id);
  m.set_element_id(r.element_id);
  m.set_runs_initialised(r.runs_initialised);
  EncodeDataIndex(r.data_idx, m.mutable_data_idx());
  for (const auto& p : r.schema_parameters) m.add_schema_parameters(p);
  FromStdMap(r.loop_idx, m.mutable_loop_idx());
  for (const auto& [action_idx, ids] : r.run_ids) {
    auto& list = (*m.mutable_run_ids())[action_idx];
    for (auto id : ids) list.add_ids(id);
  }
  return m;
}

IterationRecord Decode(const v1::ElementIteration& m) {
  IterationRecord r;
  r.id               = m.id();
  r.element_id       = m.element_id();
  r.runs_initialised = m.runs_initialised();
  r.data_idx         = DecodeDataIndex(m.data_idx());
  r.schema_parameters.assign(m.schema_parameters().begin(), m.schema_parameters().end());
  r.loop_idx = ToStdMap(m.loop_idx());
  for (const auto& [action_idx, list] : m.run_ids()) r.run_ids[action_idx] = ToVector(list.ids());
  return r;
}

// ------------------------------------------------------------
// Runs
// ------------------------------------------------------------

v1::Run Encode(const RunRecord& r) {
  v1::Run m;
  m.set_id(r.id);
  m.set_iteration_id(r.iteration_id);
  m.set_action_idx(r.action_idx);
  for (auto idx : r.commands_idx) m.add_commands_idx(idx);
  EncodeDataIndex(r.data_idx, m.mutable_data_idx());
  *m.mutable_metadata() = r.metadata;
  if (r.submission_idx) {
    m.set_has_submission_idx(true);
    m.set_submission_idx(*r.submission_idx);
  }
  m.set_skip(r.skip);
  if (r.start_time) *m.mutable_start_time() = util::ToProto(*r.start_time);
  if (r.end_time) *m.mutable_end_time() = util::ToProto(*r.end_time);
  if (r.snapshot_start) *m.mutable_snapshot_start() = *r.snapshot_start;
  if (r.snapshot_end) *m.mutable_snapshot_end() = *r.snapshot_end;
  if (r.exit_code) {
    m.set_has_exit_code(true);
    m.set_exit_code(*r.exit_code);
  }
  if (r.success) {
    m.set_has_success(true);
    m.set_success(*r.success);
  }
  if (r.run_hostname) m.set_run_hostname(*r.run_hostname);
  return m;
}

RunRecord Decode(const v1::Run& m) {
  RunRecord r;
  r.id           = m.id();
  r.iteration_id = m.iteration_id();
  r.action_idx   = m.action_idx();
  r.commands_idx = ToVector(m.commands_idx());
  r.data_idx     = DecodeDataIndex(m.data_idx());
  r.metadata     = m.metadata();
  if (m.has_submission_idx()) r.submission_idx = m.submission_idx();
  r.skip = m.skip();
  if (m.has_start_time()) r.start_time = util::FromProto(m.start_time());
  if (m.has_end_time()) r.end_time = util::FromProto(m.end_time());
  if (m.has_snapshot_start()) r.snapshot_start = m.snapshot_start();
  if (m.has_snapshot_end()) r.snapshot_end = m.snapshot_end();
  if (m.has_exit_code()) r.exit_code = m.exit_code();
  if (m.has_success()) r.success = m.success();
  if (!m.run_hostname().empty()) r.run_hostname = m.run_hostname();
  return r;
}

// ------------------------------------------------------------
// Parameters
// ------------------------------------------------------------

v1::Parameter Encode(const ParameterRecord& r) {
  v1::Parameter m;
  m.set_id(r.id);
  m.set_is_set(r.is_set);
  *m.mutable_data() = r.data;
  FromStdMap(r.type_lookup, m.mutable_type_lookup());
  if (r.file) {
    auto* f = m.mutable_file();
    f->set_store_contents(r.file->store_contents);
    f->set_path(r.file->path);
    f->set_content_key(r.file->content_key);
  }
  if (r.array) {
    auto* a = m.mutable_array();
    a->set_content_key(r.array->content_key);
    a->set_dtype(r.array->dtype);
    for (auto dim : r.array->shape) a->add_shape(dim);
    a->set_chunk_length(r.array->chunk_length);
  }
  EncodeSource(r.source, m.mutable_source());
  return m;
}

ParameterRecord Decode(const v1::Parameter& m) {
  ParameterRecord r;
  r.id          = m.id();
  r.is_set      = m.is_set();
  r.data        = m.data();
  r.type_lookup = ToStdMap(m.type_lookup());
  if (m.has_file()) r.file = FileReference{m.file().store_contents(), m.file().path(), m.file().content_key()};
  if (m.has_array()) {
    const auto& a = m.array();
    r.array       = ArrayReference{a.content_key(), a.dtype(), {a.shape().begin(), a.shape().end()}, a.chunk_length()};
  }
  r.source = DecodeSource(m.source());
  return r;
}

// ------------------------------------------------------------
// Loops
// ------------------------------------------------------------

v1::Loop Encode(const LoopRecord& r) {
  v1::Loop m;
  m.set_id(r.id);
  m.set_name(r.name);
  for (auto idx : r.task_indices) m.add_task_indices(idx);
  for (const auto& p : r.parents) m.add_parents(p);
  for (const auto& [key, num] : r.num_added_iterations) {
    auto* count = m.add_num_added_iterations();
    for (auto k : key) count->add_parent_idx(k);
    count->set_num_iterations(num);
  }
  for (const auto& [type, param] : r.iterable_parameters) {
    auto& dst = (*m.mutable_iterable_parameters())[type];
    dst.set_input_task(param.input_task);
    for (auto t : param.output_tasks) dst.add_output_tasks(t);
  }
  return m;
}

LoopRecord Decode(const v1::Loop& m) {
  LoopRecord r;
  r.id           = m.id();
  r.name         = m.name();
  r.task_indices = ToVector(m.task_indices());
  r.parents.assign(m.parents().begin(), m.parents().end());
  for (const auto& count : m.num_added_iterations()) r.num_added_iterations[ToVector(count.parent_idx())] = count.num_iterations();
  for (const auto& [type, param] : m.iterable_parameters()) {
    r.iterable_parameters[type] = IterableParameter{param.input_task(), ToVector(param.output_tasks())};
  }
  return r;
}

// ------------------------------------------------------------
// Submissions
// ------------------------------------------------------------

v1::Submission Encode(const SubmissionRecord& r) {
  v1::Submission m;
  m.set_id(r.id);
  for (const auto& js : r.jobscripts) *m.add_jobscripts() = EncodeJobscript(js);
  for (const auto& part : r.submission_parts) {
    auto* dst                 = m.add_submission_parts();
    *dst->mutable_submit_time() = util::ToProto(part.submit_time);
    for (auto idx : part.jobscript_indices) dst->add_jobscript_indices(idx);
  }
  return m;
}

SubmissionRecord Decode(const v1::Submission& m) {
  SubmissionRecord r;
  r.id = m.id();
  for (const auto& js : m.jobscripts()) r.jobscripts.push_back(DecodeJobscript(js));
  for (const auto& part : m.submission_parts()) {
    r.submission_parts.push_back(SubmissionPart{util::FromProto(part.submit_time()), ToVector(part.jobscript_indices())});
  }
  return r;
}

// ------------------------------------------------------------
// Template components
// ------------------------------------------------------------

void EncodeComponents(const TemplateComponents& components, google::protobuf::Map<std::string, v1::ComponentSet>* out) {
  for (const auto& [type, by_hash] : components) {
    auto& dst = (*out)[type];
    for (const auto& [hash, doc] : by_hash) (*dst.mutable_by_hash())[hash] = doc;
  }
}

// ------------------------------------------------------------
// Workflow
// ------------------------------------------------------------

v1::WorkflowInfo Encode(const WorkflowInfo& r) {
  v1::WorkflowInfo m;
  m.set_name(r.name);
  auto* c = m.mutable_creation_info();
  c->set_app_name(r.creation.app_name);
  c->set_app_version(r.creation.app_version);
  *c->mutable_create_time() = util::ToProto(r.creation.create_time);
  c->set_ts_fmt(r.creation.ts_fmt);
  c->set_ts_name_fmt(r.creation.ts_name_fmt);
  *m.mutable_workflow_template() = r.workflow_template;
  return m;
}

WorkflowInfo Decode(const v1::WorkflowInfo& m) {
  WorkflowInfo r;
  r.name                 = m.name();
  const auto& c          = m.creation_info();
  r.creation.app_name    = c.app_name();
  r.creation.app_version = c.app_version();
  r.creation.create_time = util::FromProto(c.create_time());
  r.creation.ts_fmt      = c.ts_fmt();
  r.creation.ts_name_fmt = c.ts_name_fmt();
  r.workflow_template    = m.workflow_template();
  return r;
}

TemplateComponents DecodeComponents(const google::protobuf::Map<std::string, v1::ComponentSet>& m) {
  TemplateComponents components;
  for (const auto& [type, set] : m) {
    auto& dst = components[type];
    for (const auto& [hash, doc] : set.by_hash()) dst.emplace(hash, doc);
  }
  return components;
}

} // namespace jobflow::db::model
