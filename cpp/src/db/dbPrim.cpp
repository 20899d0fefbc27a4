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

#include "dbPrim.hpp"

PROJECT_NAMESPACE_START

PrimTypeE Prim::type() const
{
  switch (_data.index()) {
    case 0: return PrimTypeE::path;
    case 1: return PrimTypeE::via;
    case 2: return PrimTypeE::label;
    case 3: return PrimTypeE::rect;
    default: assert(false);
  }
  return PrimTypeE::undef;
}

const String& Prim::layer() const
{
  switch (type()) {
    case PrimTypeE::path:  return path().layer;
    case PrimTypeE::via:   return via().viaName;
    case PrimTypeE::label: return label().layer;
    case PrimTypeE::rect:  return rect().layer;
    default: assert(false);
  }
  return path().layer;
}

Vector<Real> Prim::values() const
{
  Vector<Real> vVals;
  switch (type()) {
    case PrimTypeE::path:
      for (const Point<Real>& p : path().vPts) {
        vVals.push_back(p.x());
        vVals.push_back(p.y());
      }
      vVals.push_back(path().width);
      break;
    case PrimTypeE::via:
      vVals.push_back(via().origin.x());
      vVals.push_back(via().origin.y());
      break;
    case PrimTypeE::label:
      vVals.push_back(label().loc.x());
      vVals.push_back(label().loc.y());
      vVals.push_back(label().size);
      break;
    case PrimTypeE::rect:
      vVals.push_back(rect().bl.x());
      vVals.push_back(rect().bl.y());
      vVals.push_back(rect().tr.x());
      vVals.push_back(rect().tr.y());
      break;
    default:
      assert(false);
  }
  return vVals;
}

PROJECT_NAMESPACE_END
