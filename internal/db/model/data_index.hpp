#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace jobflow::db::model {

/*
  Data index: parameter path -> parameter ID.

  Grouped paths map to a list of IDs. An entry, once assigned, is never
  repointed; new data gets a new parameter ID instead.
*/

using ParameterIds   = std::vector<uint64_t>;
using DataIndexValue = std::variant<uint64_t, ParameterIds>;
using DataIndex      = std::map<std::string, DataIndexValue>;

inline constexpr const char* kRepeatsPathPrefix = "repeats.";

inline bool IsRepeatsPath(const std::string& path) {
  return path.rfind(kRepeatsPathPrefix, 0) == 0;
}

// Every parameter ID referenced by the index, in path order.
inline std::vector<uint64_t> ReferencedParameterIds(const DataIndex& data_idx, bool skip_repeats = false) {
  std::vector<uint64_t> ids;
  for (const auto& [path, value] : data_idx) {
    if (skip_repeats && IsRepeatsPath(path)) continue;
    if (const auto* single = std::get_if<uint64_t>(&value)) {
      ids.push_back(*single);
    } else {
      const auto& group = std::get<ParameterIds>(value);
      ids.insert(ids.end(), group.begin(), group.end());
    }
  }
  return ids;
}

} // namespace jobflow::db::model
