#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace jobflow::db::model {

/*
  Provenance of a parameter value.

  Keys are kept sorted. Amending a source merges the update into the
  existing map, the update winning on shared keys.
*/

using SourceValue = std::variant<int64_t, std::string>;
using ParamSource = std::map<std::string, SourceValue>;

inline constexpr const char* kSourceTypeKey   = "type";
inline constexpr const char* kSourceRunIdKey  = "run_id";
inline constexpr const char* kSourceRunOutput = "run_output";

inline ParamSource MergeSource(const ParamSource& base, const ParamSource& update) {
  ParamSource merged = base;
  for (const auto& [key, value] : update) {
    merged[key] = value;
  }
  return merged;
}

// The run that produced this value, if it was a run output.
inline std::optional<uint64_t> ProducingRun(const ParamSource& source) {
  auto type = source.find(kSourceTypeKey);
  if (type == source.end()) return std::nullopt;
  const auto* type_name = std::get_if<std::string>(&type->second);
  if (!type_name || *type_name != kSourceRunOutput) return std::nullopt;

  auto run = source.find(kSourceRunIdKey);
  if (run == source.end()) return std::nullopt;
  const auto* run_id = std::get_if<int64_t>(&run->second);
  if (!run_id || *run_id < 0) return std::nullopt;
  return static_cast<uint64_t>(*run_id);
}

inline ParamSource RunOutputSource(uint64_t run_id) {
  return {{kSourceTypeKey, std::string(kSourceRunOutput)}, {kSourceRunIdKey, static_cast<int64_t>(run_id)}};
}

} // namespace jobflow::db::model
