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

#include "db/dbTech.hpp"
#include "db/dbShape.hpp"
#include "db/dbError.hpp"

PROJECT_NAMESPACE_START

// Derives the complete geometry of one unit capacitor. Stateless apart from
// the technology it is bound to; every call is independent of the others.
class ShapeMgr {
public:
  ShapeMgr(const TechProfile& tech)
    : _tech(tech)
  {}
  ~ShapeMgr() {}

  // throws GeometryError
  Geometry computeGeometry(const ShapeParams& params) const;

private:
  const TechProfile& _tech;

  // primary dimensions converted to database units
  struct Dims {
    Int n;      // finger count
    Int aH;     // active half height
    Int ahw;    // active half width
    Int fw, fs, pitch;
    Int bw, mbw, frw;
    Int sp, tip;
  };

  Dims  toDims(const ShapeParams& params) const;
  Int   positiveDim(const Real um, const String& field) const;
  void  checkLayers(const ShapeParams& params) const;

  // per-shape core (everything but the shield ring), top layer first
  void  buildFrameBar(const ShapeParams& params, const Dims& d, Geometry& geo) const;
  void  buildAltFinger(const ShapeParams& params, const Dims& d, Geometry& geo) const;
  void  buildSandwich(const ShapeParams& params, const Dims& d, Geometry& geo) const;

  // shared helpers
  Int           fingerX(const Dims& d, const Int i) const { return -d.ahw + d.fw / 2 + i * d.pitch; }
  Vector<Wire>  frameBarCore(const Dims& d, Point<Int>& posPin, Point<Int>& negPin) const;
  Vector<Wire>  shieldRing(const Geometry& geo, const Dims& d) const;
  void          addViaRows(const ShapeParams& params, const Int upperIdx, const Wire& bar, Geometry& geo) const;
  void          requireSpan(const Int span, const String& field, const String& what) const;
};

PROJECT_NAMESPACE_END
