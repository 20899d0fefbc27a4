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

#include "renderMgr.hpp"
#include "db/dbError.hpp"

PROJECT_NAMESPACE_START

Vector<Prim> RenderMgr::render(const Geometry& geo, const ShapeParams& params, const bool bIncludeShield) const
{
  const NumFormat nf(geo.grid(), geo.precision());
  Vector<Prim> vPrims;

  for (Int i = geo.numLayers() - 1; i >= 0; --i) {
    const LayerGeom& lg = geo.layerGeom(i);
    if (bIncludeShield) {
      for (const Wire& w : lg.vWires) {
        if (w.plate == PlateE::shield) {
          vPrims.emplace_back(wire2Path(nf, lg.layer, w));
        }
      }
    }
    for (const Box<Int>& b : lg.vPlates) {
      vPrims.emplace_back(box2Rect(nf, lg.layer, b));
    }
    for (const Wire& w : lg.vWires) {
      if (w.plate != PlateE::shield) {
        vPrims.emplace_back(wire2Path(nf, lg.layer, w));
      }
    }
    for (const ViaRow& row : geo.vViaRows()) {
      if (row.lower == lg.layer) {
        vPrims.emplace_back(row2Via(nf, row));
      }
    }
  }

  const String& topLayer = geo.layerGeom(0).layer;
  vPrims.emplace_back(pinLabel(nf, topLayer, geo.posPin(), params.posLabel, params.labelSize));
  vPrims.emplace_back(pinLabel(nf, topLayer, geo.negPin(), params.negLabel, params.labelSize));

  checkGrid(nf, vPrims);
  spdlog::debug("[RenderMgr] {} primitives ({} shield)", vPrims.size(), bIncludeShield ? "with" : "without");
  return vPrims;
}

Prim RenderMgr::wire2Path(const NumFormat& nf, const String& layer, const Wire& w) const
{
  PathPrim path;
  path.layer  = layer;
  path.vPts   = {Point<Real>(nf.toUm(w.p0.x()), nf.toUm(w.p0.y())),
                 Point<Real>(nf.toUm(w.p1.x()), nf.toUm(w.p1.y()))};
  path.width  = nf.toUm(w.width);
  path.extend = PathExtendE::truncate;
  return Prim(path, w.plate == PlateE::shield);
}

Prim RenderMgr::box2Rect(const NumFormat& nf, const String& layer, const Box<Int>& b) const
{
  RectPrim rect;
  rect.layer = layer;
  rect.bl    = Point<Real>(nf.toUm(b.xl()), nf.toUm(b.yl()));
  rect.tr    = Point<Real>(nf.toUm(b.xh()), nf.toUm(b.yh()));
  return Prim(rect);
}

Prim RenderMgr::row2Via(const NumFormat& nf, const ViaRow& row) const
{
  ViaPrim via;
  via.viaName = row.viaName;
  via.origin  = Point<Real>(nf.toUm(row.center.x()), nf.toUm(row.center.y()));
  via.numRows = row.numRows;
  via.numCols = row.numCols;
  return Prim(via);
}

Prim RenderMgr::pinLabel(const NumFormat& nf, const String& layer, const Point<Int>& loc,
                         const String& text, const Real size) const
{
  if (nf.snap(size) <= 0) {
    throw RenderError(fmt::format("label {}: size {} vanishes on grid {}", text, size, nf.grid()));
  }
  LabelPrim label;
  label.layer  = layer;
  label.loc    = Point<Real>(nf.toUm(loc.x()), nf.toUm(loc.y()));
  label.text   = text;
  label.align  = "centerCenter";
  label.orient = Orient2dE::n;
  label.size   = nf.snap(size);
  return Prim(label);
}

void RenderMgr::checkGrid(const NumFormat& nf, const Vector<Prim>& vPrims) const
{
  for (const Prim& p : vPrims) {
    for (const Real v : p.values()) {
      if (!nf.isOnGrid(v)) {
        throw RenderError(fmt::format("{} on {}: value {} is off grid",
                                      util::enumUtil::val2Str(PrimTypeEStr, p.type()), p.layer(), v));
      }
    }
  }
}

PROJECT_NAMESPACE_END
