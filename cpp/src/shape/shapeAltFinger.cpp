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

#include "shapeMgr.hpp"

PROJECT_NAMESPACE_START

// Two comb plates facing each other: pos fingers hang from the top bar, neg
// fingers rise from the bottom bar, alternating across the width.
void ShapeMgr::buildAltFinger(const ShapeParams& params, const Dims& d, Geometry& geo) const
{
  const Int barY   = d.aH - d.bw / 2;
  const Int innerY = d.aH - d.bw;

  requireSpan(2 * innerY - d.tip, "active_height", "finger");

  Vector<Wire> vCore;
  vCore.push_back({"top_bar",    Point<Int>(-d.ahw, barY),  Point<Int>(d.ahw, barY),  d.bw, PlateE::pos});
  vCore.push_back({"bottom_bar", Point<Int>(-d.ahw, -barY), Point<Int>(d.ahw, -barY), d.bw, PlateE::neg});
  for (Int i = 0; i < d.n; ++i) {
    const Int    x    = fingerX(d, i);
    const String name = fmt::format("finger_{}", i);
    if (i % 2 == 0) {
      vCore.push_back({name, Point<Int>(x, -innerY + d.tip), Point<Int>(x, innerY), d.fw, PlateE::pos});
    }
    else {
      vCore.push_back({name, Point<Int>(x, -innerY), Point<Int>(x, innerY - d.tip), d.fw, PlateE::neg});
    }
  }

  for (LayerGeom& lg : geo._vLayerGeoms) {
    lg.vWires.insert(lg.vWires.end(), vCore.begin(), vCore.end());
  }
  for (Int i = 0; i + 1 < static_cast<Int>(params.vLayers.size()); ++i) {
    addViaRows(params, i, vCore[0], geo);
    addViaRows(params, i, vCore[1], geo);
  }
  geo._posPin.setXY(0, barY);
  geo._negPin.setXY(0, -barY);
}

PROJECT_NAMESPACE_END
