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

#include "dbBasic.hpp"
#include "geo/point.hpp"
#include "ds/array2d.hpp"

PROJECT_NAMESPACE_START

// Occupancy of a unit-cell array plus the pitch (dbu) of every cell.
// Row 0 is the top row of the array.
class ArrayGrid {
public:
  ArrayGrid() {}
  ArrayGrid(const Int numRows, const Int numCols, const Point<Int>& pitch)
    : _occupied(numRows, numCols, 0), _pitch(numRows, numCols, pitch)
  {}

  Int                 numRows()                            const { return _occupied.numRows(); }
  Int                 numCols()                            const { return _occupied.numCols(); }
  bool                isOccupied(const Int r, const Int c) const { return _occupied.at(r, c) != 0; }
  const Point<Int>&   pitch(const Int r, const Int c)      const { return _pitch.at(r, c); }
  Int                 numOccupied()                        const { return std::count(_occupied.begin(), _occupied.end(), 1); }

  void                setOccupied(const Int r, const Int c, const bool b = true) { _occupied.set(r, c, b ? 1 : 0); }
  void                setPitch(const Int r, const Int c, const Point<Int>& p)    { _pitch.set(r, c, p); }

private:
  Array2d<Byte>       _occupied; // 0/1, not bool: at() has to return a reference
  Array2d<Point<Int>> _pitch;
};

// Rectangular block of occupied cells, bounds inclusive.
struct MosaicRegion {
  Int        rowStart, rowEnd;
  Int        colStart, colEnd;
  Point<Int> pitch;

  Int numRows() const { return rowEnd - rowStart + 1; }
  Int numCols() const { return colEnd - colStart + 1; }
  Int numCells() const { return numRows() * numCols(); }

  bool operator == (const MosaicRegion& r) const {
    return rowStart == r.rowStart and rowEnd == r.rowEnd and
           colStart == r.colStart and colEnd == r.colEnd and pitch == r.pitch;
  }
};

// One repeated placement of a master cell. The origin is the lower-left
// corner of the bottom-left cell; rows grow upwards.
struct MosaicPlacement {
  String     master;
  Point<Int> origin;
  Int        numRows;
  Int        numCols;
  Point<Int> pitch;
};

PROJECT_NAMESPACE_END
