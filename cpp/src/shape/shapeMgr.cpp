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

Geometry ShapeMgr::computeGeometry(const ShapeParams& params) const
{
  if (params.shape == ShapeE::undef) {
    throw GeometryError(ViolationE::structural, "shape", "unknown shape");
  }
  checkLayers(params);
  if (!shape::isValidFingerCount(params.shape, params.fingerCount)) {
    throw GeometryError(ViolationE::parity_violation, "finger_count",
                        fmt::format("{} requires an {} finger count >= {}, got {}",
                                    util::enumUtil::val2Str(ShapeEStr, params.shape),
                                    shape::parity(params.shape) ? "odd" : "even",
                                    shape::minFingers(params.shape),
                                    params.fingerCount));
  }

  const Dims d = toDims(params);

  Geometry geo;
  geo._shape            = params.shape;
  geo._grid             = _tech.grid();
  geo._precision        = _tech.precision();
  geo._activeHalfWidth  = d.ahw;
  geo._activeHalfHeight = d.aH;
  geo._halfWidth        = d.ahw + d.sp + d.frw;
  geo._halfHeight       = d.aH + d.sp + d.frw;
  geo._totalHeight      = 2 * d.aH + 2 * d.sp + 2 * d.frw;

  geo._vWidths.push_back({"finger_width", d.fw, false});
  geo._vWidths.push_back({"bar_width", d.bw, true});
  if (params.shape != ShapeE::alt_finger) {
    geo._vWidths.push_back({"middle_bar_width", d.mbw, true});
  }
  geo._vWidths.push_back({"frame_width", d.frw, true});
  geo._vSpacings.push_back({"finger_spacing", d.fs, false});
  geo._vSpacings.push_back({"tip_spacing", d.tip, false});
  geo._vSpacings.push_back({"shield_spacing", d.sp, false});

  geo._vLayerGeoms.resize(params.vLayers.size());
  for (size_t i = 0; i < params.vLayers.size(); ++i) {
    geo._vLayerGeoms[i].layer = params.vLayers[i];
  }

  // the ring is derived even if it will not be drawn
  const Vector<Wire> vRing = shieldRing(geo, d);
  for (LayerGeom& lg : geo._vLayerGeoms) {
    lg.vWires = vRing;
  }

  switch (params.shape) {
    case ShapeE::frame_bar:  buildFrameBar(params, d, geo);  break;
    case ShapeE::alt_finger: buildAltFinger(params, d, geo); break;
    case ShapeE::sandwich:   buildSandwich(params, d, geo);  break;
    default: assert(false);
  }

  spdlog::debug("[ShapeMgr] {} fingers: {} size: {}x{} via rows: {}",
                util::enumUtil::val2Str(ShapeEStr, params.shape), d.n,
                _tech.toUm(2 * geo._halfWidth), _tech.toUm(2 * geo._halfHeight),
                geo._vViaRows.size());
  return geo;
}

void ShapeMgr::checkLayers(const ShapeParams& params) const
{
  if (params.vLayers.empty()) {
    throw GeometryError(ViolationE::structural, "layers", "layer stack is empty");
  }
  FlatHashSet<String> sSeen;
  for (const String& l : params.vLayers) {
    if (!sSeen.insert(l).second) {
      throw GeometryError(ViolationE::structural, "layers", fmt::format("layer {} used twice", l));
    }
  }
  if (params.shape == ShapeE::sandwich and params.vLayers.size() != 3) {
    throw GeometryError(ViolationE::structural, "layers",
                        fmt::format("sandwich needs exactly 3 layers, got {}", params.vLayers.size()));
  }
}

Int ShapeMgr::positiveDim(const Real um, const String& field) const
{
  if (!_tech.isOnGrid(um)) {
    throw GeometryError(ViolationE::structural, field, fmt::format("{} is not a multiple of grid {}", um, _tech.grid()));
  }
  const Int v = _tech.toDBUnit(um);
  if (v <= 0) {
    throw GeometryError(ViolationE::structural, field, fmt::format("must be positive, got {}", um));
  }
  return v;
}

ShapeMgr::Dims ShapeMgr::toDims(const ShapeParams& params) const
{
  Dims d;
  d.n   = params.fingerCount;
  d.fw  = positiveDim(params.fingerWidth, "finger_width");
  d.fs  = positiveDim(params.fingerSpacing, "finger_spacing");
  d.sp  = positiveDim(params.spacing, "spacing");
  d.tip = positiveDim(params.tipSpacing, "tip_spacing");
  d.bw  = _tech.quantizeWidth(positiveDim(params.barWidth, "bar_width"));
  d.frw = _tech.quantizeWidth(positiveDim(params.frameWidth, "frame_width"));
  d.mbw = params.shape == ShapeE::alt_finger ? 0
        : _tech.quantizeWidth(positiveDim(params.middleBarWidth, "middle_bar_width"));

  const Int activeHeight = positiveDim(params.activeHeight, "active_height");

  // centerlines and the cell center have to land on grid points
  if (!util::num::isEven(d.fw)) {
    throw GeometryError(ViolationE::structural, "finger_width", "must be a multiple of two grid units");
  }
  if (!util::num::isEven(activeHeight)) {
    throw GeometryError(ViolationE::structural, "active_height", "must be a multiple of two grid units");
  }
  if (!util::num::isEven((d.n - 1) * d.fs)) {
    throw GeometryError(ViolationE::structural, "finger_spacing", "must be a multiple of two grid units for an even finger count");
  }

  d.aH    = activeHeight / 2;
  d.pitch = d.fw + d.fs;
  d.ahw   = (d.n * d.fw + (d.n - 1) * d.fs) / 2;
  return d;
}

Vector<Wire> ShapeMgr::shieldRing(const Geometry& geo, const Dims& d) const
{
  const Int hw = geo._halfWidth;
  const Int hh = geo._halfHeight;
  const Int c  = d.frw / 2;
  Vector<Wire> vWires;
  vWires.push_back({"shield_top",    Point<Int>(-hw, hh - c),       Point<Int>(hw, hh - c),        d.frw, PlateE::shield});
  vWires.push_back({"shield_bottom", Point<Int>(-hw, -hh + c),      Point<Int>(hw, -hh + c),       d.frw, PlateE::shield});
  // sides are shortened to butt against the horizontal segments
  vWires.push_back({"shield_left",   Point<Int>(-hw + c, -hh + d.frw), Point<Int>(-hw + c, hh - d.frw), d.frw, PlateE::shield});
  vWires.push_back({"shield_right",  Point<Int>(hw - c, -hh + d.frw),  Point<Int>(hw - c, hh - d.frw),  d.frw, PlateE::shield});
  return vWires;
}

void ShapeMgr::requireSpan(const Int span, const String& field, const String& what) const
{
  if (span <= 0) {
    throw GeometryError(ViolationE::structural, field,
                        fmt::format("{} has non-positive length {}", what, _tech.toUm(span)));
  }
}

void ShapeMgr::addViaRows(const ShapeParams& params, const Int upperIdx, const Wire& bar, Geometry& geo) const
{
  const String& upper = params.vLayers.at(upperIdx);
  const String& lower = params.vLayers.at(upperIdx + 1);
  ViaRow row;
  row.name    = bar.name;
  row.upper   = upper;
  row.lower   = lower;
  row.viaName = _tech.viaName(upper, lower);
  row.center  = Point<Int>((bar.p0.x() + bar.p1.x()) / 2, bar.p0.y());
  row.numRows = _tech.numViaCuts(bar.width);
  row.numCols = _tech.numViaCuts(bar.length());
  geo._vViaRows.push_back(row);
}

PROJECT_NAMESPACE_END
