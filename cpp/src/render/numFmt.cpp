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

#include "numFmt.hpp"
#include "db/dbError.hpp"

PROJECT_NAMESPACE_START

bool NumFormat::isOnGrid(const Real v) const
{
  const Real q = v / _grid;
  return std::fabs(q - std::round(q)) <= GRID_TOL;
}

String NumFormat::str(const Real v) const
{
  if (!isOnGrid(v)) {
    throw RenderError(fmt::format("value {} is not on the {} grid", v, _grid));
  }
  Real s = snap(v);
  if (s == 0) {
    s = 0; // no "-0.000"
  }
  return fmt::format("{:.{}f}", s, _precision);
}

PROJECT_NAMESPACE_END
