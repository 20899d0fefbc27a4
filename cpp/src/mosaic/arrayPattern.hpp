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

// Cells sharing one value string.
struct ArrayGroup {
  String                  value;
  Int                     count;   // integer part of the value
  Real                    weight;  // numeric value
  bool                    bDummy;
  Vector<Pair<Int, Int>>  vCells;  // (row, col), row-major order
};

// CDAC array matrix. Each cell holds a value string: "0" is a dummy unit,
// "" an empty site, anything else a unit of the group with that value.
class ArrayPattern {
  friend class Parser;

public:
  ArrayPattern()
    : _unitCell("C_MAIN"), _dummyCell("C_DUMMY")
  {}
  ~ArrayPattern() {}

  // throws ConfigError on ragged/empty matrices or malformed values
  void                        init(const Vector<Vector<String>>& vvData, const Point<Int>& pitch);

  Int                         numRows()                            const { return _data.numRows(); }
  Int                         numCols()                            const { return _data.numCols(); }
  const String&               value(const Int r, const Int c)      const { return _data.at(r, c); }
  const Point<Int>&           pitch()                              const { return _pitch; }
  const Point<Int>&           origin()                             const { return _origin; } // upper-left corner
  const String&               unitCell()                           const { return _unitCell; }
  const String&               dummyCell()                          const { return _dummyCell; }

  // descending weight, dummy group last
  Int                         numGroups()                          const { return _vGroups.size(); }
  const ArrayGroup&           group(const Int i)                   const { return _vGroups.at(i); }
  const Vector<ArrayGroup>&   vGroups()                            const { return _vGroups; }
  const ArrayGroup*           dummyGroup()                         const;

  ArrayGrid                   groupGrid(const Int i)               const;
  // every non-dummy unit / every dummy unit
  ArrayGrid                   mainGrid()                           const;
  ArrayGrid                   dummyGrid()                          const;

private:
  Array2d<String>             _data;
  Point<Int>                  _pitch;
  Point<Int>                  _origin;
  String                      _unitCell;
  String                      _dummyCell;
  Vector<ArrayGroup>          _vGroups;

  ArrayGrid                   maskGrid(const bool bDummy) const;
};

PROJECT_NAMESPACE_END
