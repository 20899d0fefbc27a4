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

#include "global/global.hpp"

PROJECT_NAMESPACE_START

// Single point of truth for emitted numbers: snaps to the manufacturing grid
// and prints with a fixed number of decimals.
class NumFormat {
public:
  NumFormat(const Real grid, const Int precision)
    : _grid(grid), _precision(precision)
  {}

  Real    grid()                  const { return _grid; }
  Int     precision()             const { return _precision; }

  Real    snap(const Real v)      const { return std::round(v / _grid) * _grid; }
  Real    toUm(const Int dbu)     const { return snap(dbu * _grid); }
  bool    isOnGrid(const Real v)  const;

  // throws RenderError if v is not a grid multiple
  String  str(const Real v)       const;

private:
  Real _grid;
  Int  _precision;
};

PROJECT_NAMESPACE_END
