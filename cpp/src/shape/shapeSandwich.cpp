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

// Layer 0 and 2 are solid plates over the active area; layer 1 carries the
// frame + middle bar core. Only the middle/bottom pair is connected by vias.
void ShapeMgr::buildSandwich(const ShapeParams& params, const Dims& d, Geometry& geo) const
{
  const Vector<Wire> vCore = frameBarCore(d, geo._posPin, geo._negPin);
  const Box<Int> plate(-d.ahw, -d.aH, d.ahw, d.aH);

  geo._vLayerGeoms[0].vPlates.push_back(plate);
  geo._vLayerGeoms[2].vPlates.push_back(plate);
  LayerGeom& core = geo._vLayerGeoms[1];
  core.vWires.insert(core.vWires.end(), vCore.begin(), vCore.end());

  addViaRows(params, 1, vCore[0], geo);
  addViaRows(params, 1, vCore[1], geo);
}

PROJECT_NAMESPACE_END
