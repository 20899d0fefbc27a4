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

#include "mosaicMgr.hpp"

PROJECT_NAMESPACE_START

Vector<MosaicRegion> MosaicMgr::merge(const ArrayGrid& grid) const
{
  using Key = Tuple<Int, Int, Point<Int>>;

  Vector<MosaicRegion> vRegions;
  // regions whose last row is the previous row, by column span and pitch
  Map<Key, Int> mOpen;

  for (Int r = 0; r < grid.numRows(); ++r) {
    Map<Key, Int> mNext;
    for (const Run& run : rowRuns(grid, r)) {
      const Key key(run.colStart, run.colEnd, run.pitch);
      auto it = mOpen.find(key);
      if (it != mOpen.end()) {
        vRegions[it->second].rowEnd = r;
        mNext.emplace(key, it->second);
      }
      else {
        vRegions.push_back({r, r, run.colStart, run.colEnd, run.pitch});
        mNext.emplace(key, static_cast<Int>(vRegions.size()) - 1);
      }
    }
    mOpen.swap(mNext);
  }

  std::sort(vRegions.begin(), vRegions.end(), [](const MosaicRegion& a, const MosaicRegion& b) {
    return a.rowStart != b.rowStart ? a.rowStart < b.rowStart : a.colStart < b.colStart;
  });
  spdlog::debug("[MosaicMgr] {}x{} grid, {} cells -> {} regions",
                grid.numRows(), grid.numCols(), grid.numOccupied(), vRegions.size());
  return vRegions;
}

Vector<MosaicMgr::Run> MosaicMgr::rowRuns(const ArrayGrid& grid, const Int r) const
{
  Vector<Run> vRuns;
  Int c = 0;
  while (c < grid.numCols()) {
    if (!grid.isOccupied(r, c)) {
      ++c;
      continue;
    }
    Run run{c, c, grid.pitch(r, c)};
    while (run.colEnd + 1 < grid.numCols() and
           grid.isOccupied(r, run.colEnd + 1) and
           grid.pitch(r, run.colEnd + 1) == run.pitch) {
      ++run.colEnd;
    }
    vRuns.push_back(run);
    c = run.colEnd + 1;
  }
  return vRuns;
}

Point<Int> MosaicMgr::cellOrigin(const ArrayGrid& grid, const Int r, const Int c,
                                 const Point<Int>& origin) const
{
  Point<Int> p(origin);
  for (Int i = 0; i < c; ++i) {
    p.shiftXY(grid.pitch(r, i).x(), 0);
  }
  for (Int i = 0; i <= r; ++i) {
    p.shiftXY(0, -grid.pitch(i, c).y());
  }
  return p;
}

Vector<MosaicPlacement> MosaicMgr::toPlacements(const Vector<MosaicRegion>& vRegions,
                                                const ArrayGrid& grid,
                                                const String& master,
                                                const Point<Int>& origin) const
{
  Vector<MosaicPlacement> vPlacements;
  vPlacements.reserve(vRegions.size());
  for (const MosaicRegion& reg : vRegions) {
    MosaicPlacement pl;
    pl.master  = master;
    pl.origin  = cellOrigin(grid, reg.rowEnd, reg.colStart, origin);
    pl.numRows = reg.numRows();
    pl.numCols = reg.numCols();
    pl.pitch   = reg.pitch;
    vPlacements.push_back(pl);
  }
  return vPlacements;
}

PROJECT_NAMESPACE_END
