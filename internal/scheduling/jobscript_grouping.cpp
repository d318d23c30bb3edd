#include "internal/scheduling/jobscript_grouping.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace jobflow::scheduling {

namespace {

void ValidateResourceMap(const CellMatrix& resource_map) {
  if (resource_map.empty()) return;

  const auto width = resource_map.front().size();
  for (size_t a = 0; a < resource_map.size(); ++a) {
    if (resource_map[a].size() != width) {
      throw std::invalid_argument("resource map row " + std::to_string(a) + " has " + std::to_string(resource_map[a].size()) +
                                  " elements, expected " + std::to_string(width));
    }
    for (auto v : resource_map[a]) {
      if (v < kNoRun) throw std::invalid_argument("resource map entry " + std::to_string(v) + " is negative");
    }
  }
}

} // namespace

GroupingResult GroupResourceMapIntoJobscripts(const CellMatrix& resource_map) {
  ValidateResourceMap(resource_map);

  GroupingResult out;
  const size_t   num_actions  = resource_map.size();
  const size_t   num_elements = num_actions ? resource_map.front().size() : 0;
  out.js_map.assign(num_actions, std::vector<int64_t>(num_elements, kNoRun));
  if (num_actions == 0 || num_elements == 0) return out;

  std::set<int64_t> resource_indices;
  size_t            remaining = 0;
  for (const auto& row : resource_map) {
    for (auto v : row) {
      if (v == kNoRun) continue;
      resource_indices.insert(v);
      ++remaining;
    }
  }

  std::vector<std::vector<bool>> allocated(num_actions, std::vector<bool>(num_elements, false));

  // Working copy whose empty cells hold the last resource placed. The
  // presence test for a row runs against it, before the refill.
  CellMatrix filled = resource_map;
  auto       empty  = [&](size_t a, size_t e) { return resource_map[a][e] == kNoRun; };

  for (size_t act = 0; act < num_actions && remaining > 0; ++act) {
    for (auto res : resource_indices) {
      const auto& row = filled[act];
      if (std::find(row.begin(), row.end(), res) == row.end()) continue;

      for (size_t a = 0; a < num_actions; ++a) {
        for (size_t e = 0; e < num_elements; ++e) {
          if (empty(a, e)) filled[a][e] = res;
        }
      }

      JobscriptGroup                           js{res, {}};
      std::vector<std::pair<size_t, size_t>>   cells;

      for (size_t e = 0; e < num_elements; ++e) {
        if (filled[act][e] != res || allocated[act][e]) continue;

        if (!empty(act, e)) {
          js.elements[e].push_back(act);
          cells.emplace_back(act, e);
        }

        // extend downward while the column keeps the same resource
        for (size_t a = act + 1; a < num_actions && filled[a][e] == res; ++a) {
          if (empty(a, e)) continue;
          js.elements[e].push_back(a);
          cells.emplace_back(a, e);
        }
      }

      if (cells.empty()) continue;

      const auto js_idx = static_cast<int64_t>(out.jobscripts.size());
      for (const auto& [a, e] : cells) {
        if (!allocated[a][e]) --remaining;
        allocated[a][e]  = true;
        out.js_map[a][e] = js_idx;
      }
      out.jobscripts.push_back(std::move(js));

      if (remaining == 0) break;
    }
  }

  return out;
}

} // namespace jobflow::scheduling
