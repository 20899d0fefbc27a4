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

////////////////////////////////////////
//   frame + fingers + middle bar     //
////////////////////////////////////////
//
//   +=========================+   top bar (pos)
//   |  |     |  |  |     |  |
//   |  |  |  |     |  |  |  |
//   |  +==================+ |   middle bar (neg)
//   |  |  |  |     |  |  |  |
//   |  |     |  |  |     |  |
//   +=========================+   bottom bar (pos)
//
// Even-index fingers are pos, odd-index fingers neg. The two outer fingers
// join the bars; inner pos fingers are split around the middle bar.
Vector<Wire> ShapeMgr::frameBarCore(const Dims& d, Point<Int>& posPin, Point<Int>& negPin) const
{
  const Int barY    = d.aH - d.bw / 2;
  const Int innerY  = d.aH - d.bw;       // inner edge of top bar
  const Int midEdge = d.mbw / 2;         // upper edge of middle bar

  requireSpan(2 * innerY, "active_height", "outer finger");
  // split pos fingers and the neg finger ends beyond the middle bar share this span
  requireSpan(innerY - midEdge - d.tip, "active_height", "inner finger");

  Vector<Wire> vWires;
  vWires.push_back({"top_bar",    Point<Int>(-d.ahw, barY),  Point<Int>(d.ahw, barY),  d.bw, PlateE::pos});
  vWires.push_back({"bottom_bar", Point<Int>(-d.ahw, -barY), Point<Int>(d.ahw, -barY), d.bw, PlateE::pos});

  // middle bar runs between the two outer fingers, finger_spacing away from both
  const Int midXl = fingerX(d, 1) - d.fw / 2;
  const Int midXh = fingerX(d, d.n - 2) + d.fw / 2;
  vWires.push_back({"middle_bar", Point<Int>(midXl, 0), Point<Int>(midXh, 0), d.mbw, PlateE::neg});

  for (Int i = 0; i < d.n; ++i) {
    const Int    x    = fingerX(d, i);
    const String name = fmt::format("finger_{}", i);
    if (i == 0 or i == d.n - 1) {
      vWires.push_back({name, Point<Int>(x, -innerY), Point<Int>(x, innerY), d.fw, PlateE::pos});
    }
    else if (i % 2 == 0) {
      Wire upper{name + "_upper", Point<Int>(x, midEdge + d.tip), Point<Int>(x, innerY), d.fw, PlateE::pos};
      Wire lower(upper);
      lower.name = name + "_lower";
      lower.p0.flipY(0);
      lower.p1.flipY(0);
      std::swap(lower.p0, lower.p1);
      vWires.push_back(upper);
      vWires.push_back(lower);
    }
    else {
      vWires.push_back({name, Point<Int>(x, -innerY + d.tip), Point<Int>(x, innerY - d.tip), d.fw, PlateE::neg});
    }
  }

  posPin.setXY(0, barY);
  negPin.setXY(0, 0);
  return vWires;
}

void ShapeMgr::buildFrameBar(const ShapeParams& params, const Dims& d, Geometry& geo) const
{
  const Vector<Wire> vCore = frameBarCore(d, geo._posPin, geo._negPin);
  for (LayerGeom& lg : geo._vLayerGeoms) {
    lg.vWires.insert(lg.vWires.end(), vCore.begin(), vCore.end());
  }
  // top, middle and bottom rows between every adjacent pair
  for (Int i = 0; i + 1 < static_cast<Int>(params.vLayers.size()); ++i) {
    addViaRows(params, i, vCore[0], geo);
    addViaRows(params, i, vCore[2], geo);
    addViaRows(params, i, vCore[1], geo);
  }
}

PROJECT_NAMESPACE_END
