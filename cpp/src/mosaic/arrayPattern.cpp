/*
* SPDX-FileCopyrightText: Copyright (c) 2022 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
* SPDX-License-Identifier: Apache-2.0
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/

#include "arrayPattern.hpp"
#include "db/dbError.hpp"

PROJECT_NAMESPACE_START

namespace {

Real parseWeight(const String& s, const Int r, const Int c)
{
  size_t pos = 0;
  Real w = 0;
  try {
    w = std::stod(s, &pos);
  }
  catch (const std::exception&) {
    pos = 0;
  }
  if (pos != s.size() or w < 0) {
    throw ConfigError(fmt::format("array_data[{}][{}]: '{}' is not a non-negative number", r, c, s));
  }
  return w;
}

} // namespace

void ArrayPattern::init(const Vector<Vector<String>>& vvData, const Point<Int>& pitch)
{
  if (vvData.empty() or vvData[0].empty()) {
    throw ConfigError("array_data is empty");
  }
  if (pitch.x() <= 0 or pitch.y() <= 0) {
    throw ConfigError("array pitch must be positive");
  }
  const Int numRows = vvData.size();
  const Int numCols = vvData[0].size();
  _data.resize(numRows, numCols, "");
  _pitch = pitch;
  _vGroups.clear();

  Map<String, Int> mValue2GroupIdx;
  for (Int r = 0; r < numRows; ++r) {
    if (static_cast<Int>(vvData[r].size()) != numCols) {
      throw ConfigError(fmt::format("array_data row {} has {} cells, expected {}", r, vvData[r].size(), numCols));
    }
    for (Int c = 0; c < numCols; ++c) {
      const String& s = vvData[r][c];
      _data.set(r, c, s);
      if (s.empty()) {
        continue;
      }
      auto it = mValue2GroupIdx.find(s);
      if (it == mValue2GroupIdx.end()) {
        ArrayGroup grp;
        grp.value  = s;
        grp.weight = parseWeight(s, r, c);
        grp.count  = static_cast<Int>(std::floor(grp.weight));
        grp.bDummy = grp.weight == 0;
        it = mValue2GroupIdx.emplace(s, _vGroups.size()).first;
        _vGroups.push_back(grp);
      }
      _vGroups[it->second].vCells.emplace_back(r, c);
    }
  }
  if (_vGroups.empty()) {
    throw ConfigError("array_data has no units");
  }

  std::stable_sort(_vGroups.begin(), _vGroups.end(), [](const ArrayGroup& a, const ArrayGroup& b) {
    if (a.bDummy != b.bDummy) {
      return b.bDummy;
    }
    return a.weight > b.weight;
  });
  spdlog::debug("[ArrayPattern] {}x{} array, {} groups", numRows, numCols, _vGroups.size());
}

const ArrayGroup* ArrayPattern::dummyGroup() const
{
  for (const ArrayGroup& grp : _vGroups) {
    if (grp.bDummy) {
      return &grp;
    }
  }
  return nullptr;
}

ArrayGrid ArrayPattern::groupGrid(const Int i) const
{
  ArrayGrid grid(numRows(), numCols(), _pitch);
  for (const Pair<Int, Int>& cell : group(i).vCells) {
    grid.setOccupied(cell.first, cell.second);
  }
  return grid;
}

ArrayGrid ArrayPattern::maskGrid(const bool bDummy) const
{
  ArrayGrid grid(numRows(), numCols(), _pitch);
  for (const ArrayGroup& grp : _vGroups) {
    if (grp.bDummy != bDummy) {
      continue;
    }
    for (const Pair<Int, Int>& cell : grp.vCells) {
      grid.setOccupied(cell.first, cell.second);
    }
  }
  return grid;
}

ArrayGrid ArrayPattern::mainGrid() const
{
  return maskGrid(false);
}

ArrayGrid ArrayPattern::dummyGrid() const
{
  return maskGrid(true);
}

PROJECT_NAMESPACE_END
