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

#include "dbShape.hpp"

PROJECT_NAMESPACE_START

Box<Int> Wire::box() const
{
  const Int hw = width / 2;
  if (isHor()) {
    return Box<Int>(std::min(p0.x(), p1.x()), p0.y() - hw, std::max(p0.x(), p1.x()), p0.y() + hw);
  }
  return Box<Int>(p0.x() - hw, std::min(p0.y(), p1.y()), p0.x() + hw, std::max(p0.y(), p1.y()));
}

const NamedDim* Geometry::width(const String& n) const
{
  auto it = std::find_if(_vWidths.begin(), _vWidths.end(), [&n](const NamedDim& d) { return d.name == n; });
  return it != _vWidths.end() ? &(*it) : nullptr;
}

const NamedDim* Geometry::spacing(const String& n) const
{
  auto it = std::find_if(_vSpacings.begin(), _vSpacings.end(), [&n](const NamedDim& d) { return d.name == n; });
  return it != _vSpacings.end() ? &(*it) : nullptr;
}

Long Geometry::minRectArea(String* pName) const
{
  Long minArea = std::numeric_limits<Long>::max();
  for (const LayerGeom& lg : _vLayerGeoms) {
    for (const Wire& w : lg.vWires) {
      const Long a = w.box().area();
      if (a < minArea) {
        minArea = a;
        if (pName) {
          *pName = lg.layer + "/" + w.name;
        }
      }
    }
    for (const Box<Int>& b : lg.vPlates) {
      if (b.area() < minArea) {
        minArea = b.area();
        if (pName) {
          *pName = lg.layer + "/plate";
        }
      }
    }
  }
  return minArea;
}

PROJECT_NAMESPACE_END
