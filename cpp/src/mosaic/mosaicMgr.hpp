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

#pragma once

#include "db/dbMosaic.hpp"

PROJECT_NAMESPACE_START

// Compresses an occupancy grid into rectangular repeated-placement regions.
//
// Pass 1 splits every row into maximal runs of occupied cells sharing one
// pitch. Pass 2 stacks a run onto the region directly above it when both
// cover the same columns with the same pitch. The result is an exact,
// disjoint cover of the occupied cells; the region count is not guaranteed
// to be minimal.
class MosaicMgr {
public:
  MosaicMgr() {}
  ~MosaicMgr() {}

  // regions sorted by (rowStart, colStart)
  Vector<MosaicRegion>    merge(const ArrayGrid& grid) const;

  // origin: upper-left corner of cell (0, 0), dbu
  Vector<MosaicPlacement> toPlacements(const Vector<MosaicRegion>& vRegions,
                                       const ArrayGrid& grid,
                                       const String& master,
                                       const Point<Int>& origin) const;

  // lower-left corner of a cell, accumulated over the pitches above/left of it
  Point<Int>              cellOrigin(const ArrayGrid& grid, const Int r, const Int c,
                                     const Point<Int>& origin) const;

private:
  struct Run {
    Int        colStart, colEnd;
    Point<Int> pitch;
  };
  Vector<Run> rowRuns(const ArrayGrid& grid, const Int r) const;
};

PROJECT_NAMESPACE_END
