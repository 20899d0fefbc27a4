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

#include "db/dbShape.hpp"
#include "db/dbPrim.hpp"
#include "numFmt.hpp"

PROJECT_NAMESPACE_START

// Flattens a geometry into ordered drawing primitives. Layers are emitted
// bottom -> top: metal of the layer, then the vias up from it; the two pin
// labels go last, on the top layer.
class RenderMgr {
public:
  RenderMgr() {}
  ~RenderMgr() {}

  // throws RenderError
  Vector<Prim> render(const Geometry& geo, const ShapeParams& params, const bool bIncludeShield) const;

private:
  Prim  wire2Path(const NumFormat& nf, const String& layer, const Wire& w) const;
  Prim  box2Rect(const NumFormat& nf, const String& layer, const Box<Int>& b) const;
  Prim  row2Via(const NumFormat& nf, const ViaRow& row) const;
  Prim  pinLabel(const NumFormat& nf, const String& layer, const Point<Int>& loc,
                 const String& text, const Real size) const;
  void  checkGrid(const NumFormat& nf, const Vector<Prim>& vPrims) const;
};

PROJECT_NAMESPACE_END
