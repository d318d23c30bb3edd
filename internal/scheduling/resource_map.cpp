#include "internal/scheduling/resource_map.hpp"

#include <algorithm>
#include <cstdio>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace jobflow::scheduling {

using namespace jobflow::db::model;

namespace {

void AppendCanonical(const google::protobuf::Value& value, std::string& out);

void AppendCanonical(const google::protobuf::Struct& doc, std::string& out) {
  std::map<std::string, const google::protobuf::Value*> sorted;
  for (const auto& [key, value] : doc.fields()) sorted.emplace(key, &value);

  out += '{';
  for (const auto& [key, value] : sorted) {
    out += key;
    out += ':';
    AppendCanonical(*value, out);
    out += ';';
  }
  out += '}';
}

void AppendCanonical(const google::protobuf::Value& value, std::string& out) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      out += "null";
      break;
    case google::protobuf::Value::kNumberValue: {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.17g", value.number_value());
      out += buf;
      break;
    }
    case google::protobuf::Value::kStringValue:
      out += '"';
      out += value.string_value();
      out += '"';
      break;
    case google::protobuf::Value::kBoolValue:
      out += value.bool_value() ? "true" : "false";
      break;
    case google::protobuf::Value::kStructValue:
      AppendCanonical(value.struct_value(), out);
      break;
    case google::protobuf::Value::kListValue:
      out += '[';
      for (const auto& item : value.list_value().values()) {
        AppendCanonical(item, out);
        out += ',';
      }
      out += ']';
      break;
  }
}

} // namespace

std::string CanonicalResources(const google::protobuf::Struct& document) {
  std::string canonical;
  AppendCanonical(document, canonical);
  return canonical;
}

std::string HashResources(const google::protobuf::Struct& document) {
  uint64_t h = 0xcbf29ce484222325ULL;
  for (unsigned char c : CanonicalResources(document)) {
    h ^= c;
    h *= 0x100000001b3ULL;
  }

  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(h));
  return buf;
}

ResolvedResources MetadataResourceResolver::Resolve(const TaskRecord&, const ElementRecord&, const RunRecord& run) {
  ResolvedResources out;

  const auto& fields = run.metadata.fields();
  if (auto it = fields.find("resources"); it != fields.end() && it->second.has_struct_value()) {
    out.document = it->second.struct_value();
  }

  const auto& doc = out.document.fields();
  if (auto it = doc.find("use_job_array"); it != doc.end()) {
    out.use_job_array = it->second.bool_value();
  }

  out.hash = HashResources(out.document);
  return out;
}

RunResourceMap GenerateRunResourceMap(const TaskRecord& task, const std::vector<store::ElementView>& elements, const LoopIndex& loop_idx,
                                      ResourceResolver& resolver) {
  uint64_t num_actions = 0;
  for (const auto& view : elements) {
    for (const auto& iteration : view.iterations) {
      for (const auto& [action_idx, runs] : iteration.runs) num_actions = std::max(num_actions, action_idx + 1);
    }
  }

  RunResourceMap out;
  out.resource_idx.assign(num_actions, std::vector<int64_t>(elements.size(), kNoRun));
  out.run_ids.assign(num_actions, std::vector<int64_t>(elements.size(), kNoRun));

  // keyed on the full document, not the hash alone
  std::map<std::pair<std::string, std::string>, int64_t> index_of_resources;

  for (const auto& view : elements) {
    const auto col = view.element.index;
    if (col >= elements.size()) {
      throw std::invalid_argument("element index " + std::to_string(col) + " outside task " + std::to_string(task.id));
    }

    for (const auto& iteration : view.iterations) {
      if (iteration.iteration.loop_idx != loop_idx) continue;
      if (!iteration.iteration.runs_initialised) continue;

      for (const auto& [action_idx, runs] : iteration.runs) {
        for (const auto& run : runs) {
          if (run.Status() != RunStatus::kPending) continue;

          auto resolved     = resolver.Resolve(task, view.element, run);
          auto key          = std::make_pair(resolved.hash, CanonicalResources(resolved.document));
          auto [it, is_new] = index_of_resources.try_emplace(std::move(key), static_cast<int64_t>(out.resources.size()));
          if (is_new) out.resources.push_back(std::move(resolved));

          out.resource_idx[action_idx][col] = it->second;
          out.run_ids[action_idx][col]      = static_cast<int64_t>(run.id);
        }
      }
    }
  }

  return out;
}

} // namespace jobflow::scheduling
