#include "internal/scheduling/jobscript_grouping.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

using jobflow::scheduling::CellMatrix;
using jobflow::scheduling::GroupResourceMapIntoJobscripts;
using jobflow::scheduling::JobscriptGroup;
using jobflow::scheduling::kNoRun;

void TestMixedResourcesAllocateInPassOrder() {
  const CellMatrix resources = {
      {1, 1, 1, 2, -1, 2, 4, -1, 1},
      {1, 3, 1, 2, 2, 2, 4, 4, 1},
      {1, 1, 3, 2, 2, 2, 4, -1, 1},
  };

  const std::vector<JobscriptGroup> expected = {
      {1, {{0, {0, 1, 2}}, {1, {0}}, {2, {0, 1}}, {8, {0, 1, 2}}}},
      {2, {{3, {0, 1, 2}}, {4, {1, 2}}, {5, {0, 1, 2}}}},
      {4, {{6, {0, 1, 2}}, {7, {1}}}},
      {3, {{1, {1}}}},
      {1, {{1, {2}}}},
      {3, {{2, {2}}}},
  };

  const auto result = GroupResourceMapIntoJobscripts(resources);
  assert(result.jobscripts == expected);

  // every non-empty cell lands in exactly one jobscript
  assert(result.js_map.size() == 3);
  assert(result.js_map[0][0] == 0);
  assert(result.js_map[1][1] == 3);
  assert(result.js_map[2][1] == 4);
  assert(result.js_map[2][2] == 5);
  assert(result.js_map[0][4] == kNoRun);
  assert(result.js_map[1][7] == 2);
  assert(result.js_map[2][7] == kNoRun);
}

void TestEmptyCellsDoNotBreakDownwardExtension() {
  const CellMatrix resources = {
      {2, 2, -1},
      {4, 4, 1},
      {4, 4, -1},
      {1, 1, 1},
  };

  const std::vector<JobscriptGroup> expected = {
      {2, {{0, {0}}, {1, {0}}}},
      {1, {{2, {1, 3}}}},
      {4, {{0, {1, 2}}, {1, {1, 2}}}},
      {1, {{0, {3}}, {1, {3}}}},
  };

  const auto result = GroupResourceMapIntoJobscripts(resources);
  assert(result.jobscripts == expected);
  assert(result.js_map[1][2] == 1);
  assert(result.js_map[3][2] == 1);
  assert(result.js_map[0][2] == kNoRun);
}

void TestUniformResourcesFormOneJobscript() {
  const CellMatrix resources = {
      {0, 0},
      {0, 0},
  };

  const auto result = GroupResourceMapIntoJobscripts(resources);
  assert(result.jobscripts.size() == 1);
  assert(result.jobscripts[0].resources == 0);
  assert((result.jobscripts[0].elements.at(0) == std::vector<uint64_t>{0, 1}));
  assert((result.jobscripts[0].elements.at(1) == std::vector<uint64_t>{0, 1}));
}

void TestEmptyMatrices() {
  assert(GroupResourceMapIntoJobscripts({}).jobscripts.empty());

  const auto all_empty = GroupResourceMapIntoJobscripts({{-1, -1}, {-1, -1}});
  assert(all_empty.jobscripts.empty());
  assert(all_empty.js_map.size() == 2);
}

void TestMalformedMatricesAreRejected() {
  bool threw = false;
  try {
    (void)GroupResourceMapIntoJobscripts({{0, 1}, {0}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "ragged rows must be rejected");

  threw = false;
  try {
    (void)GroupResourceMapIntoJobscripts({{0, -2}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "entries below -1 must be rejected");
}

} // namespace

int main() {
  TestMixedResourcesAllocateInPassOrder();
  TestEmptyCellsDoNotBreakDownwardExtension();
  TestUniformResourcesFormOneJobscript();
  TestEmptyMatrices();
  TestMalformedMatricesAreRejected();

  std::cout << "jobflow_unit_jobscript_grouping: pass\n";
  return 0;
}
