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

#include "drcMgr.hpp"

PROJECT_NAMESPACE_START

bool ValidationOutcome::has(const ViolationE kind) const
{
  return count(kind) > 0;
}

Int ValidationOutcome::count(const ViolationE kind) const
{
  return std::count_if(_vViolations.begin(), _vViolations.end(),
                       [kind](const Violation& v) { return v.kind == kind; });
}

ValidationOutcome DrcMgr::validate(const Geometry& geo, const ShapeParams& params) const
{
  ValidationOutcome out;
  checkSpacing(geo, out);
  checkWidth(geo, out);
  checkQuantization(geo, out);
  checkLayers(params, out);
  checkViaAdjacency(geo, out);
  checkFingerCount(params, out);
  checkHeight(geo, params, out);
  checkMinArea(geo, out);

  for (const Violation& v : out.vViolations()) {
    spdlog::debug("[DrcMgr] {} {}: {}", util::enumUtil::val2Str(ViolationEStr, v.kind), v.field, v.msg);
  }
  return out;
}

Int DrcMgr::spacingMin(const ShapeE shape, const String& name) const
{
  // plain and shape-qualified ("frame_bar.tip_spacing") rules only tighten the global minimum
  const String qualified = util::enumUtil::val2Str(ShapeEStr, shape) + "." + name;
  Int minSpc = _tech.minSpacing();
  minSpc = std::max(minSpc, _tech.namedSpacingMin(name));
  minSpc = std::max(minSpc, _tech.namedSpacingMin(qualified));
  return minSpc;
}

void DrcMgr::checkSpacing(const Geometry& geo, ValidationOutcome& out) const
{
  for (const NamedDim& s : geo.vSpacings()) {
    const Int minSpc = spacingMin(geo.shape(), s.name);
    if (s.value < minSpc) {
      out.add(ViolationE::spacing_too_small, s.name,
              fmt::format("{} < {}", _tech.toUm(s.value), _tech.toUm(minSpc)));
    }
  }
}

void DrcMgr::checkWidth(const Geometry& geo, ValidationOutcome& out) const
{
  for (const NamedDim& w : geo.vWidths()) {
    if (w.value < _tech.minWidth()) {
      out.add(ViolationE::width_too_small, w.name,
              fmt::format("{} < {}", _tech.toUm(w.value), _tech.toUm(_tech.minWidth())));
    }
  }
}

void DrcMgr::checkQuantization(const Geometry& geo, ValidationOutcome& out) const
{
  for (const NamedDim& w : geo.vWidths()) {
    if (w.bQuantized and !_tech.isQuantized(w.value)) {
      out.add(ViolationE::quantization_mismatch, w.name,
              fmt::format("{} is not {} + n * {}", _tech.toUm(w.value),
                          _tech.toUm(_tech.widthQuantBase()), _tech.toUm(_tech.widthQuantStep())));
    }
  }
}

void DrcMgr::checkLayers(const ShapeParams& params, ValidationOutcome& out) const
{
  for (const String& l : params.vLayers) {
    if (!_tech.hasLayer(l)) {
      out.add(ViolationE::layer_not_allowed, "layers", fmt::format("{} is not an allowed layer", l));
    }
    else if (params.bLowParasitic and _tech.isLowParasiticExcluded(l)) {
      out.add(ViolationE::layer_not_allowed, "layers", fmt::format("{} is excluded in low-parasitic mode", l));
    }
  }
}

void DrcMgr::checkViaAdjacency(const Geometry& geo, ValidationOutcome& out) const
{
  Set<Pair<String, String>> sReported;
  for (const ViaRow& row : geo.vViaRows()) {
    // unknown layers are already reported as layer_not_allowed
    if (!_tech.hasLayer(row.upper) or !_tech.hasLayer(row.lower)) {
      continue;
    }
    if (!_tech.isAdjacent(row.upper, row.lower) and sReported.emplace(row.upper, row.lower).second) {
      out.add(ViolationE::layers_not_adjacent, "layers",
              fmt::format("via {} connects {} and {} which are not adjacent", row.viaName, row.upper, row.lower));
    }
  }
}

void DrcMgr::checkFingerCount(const ShapeParams& params, ValidationOutcome& out) const
{
  if (params.shape == ShapeE::undef) {
    out.add(ViolationE::parity_violation, "finger_count", "unknown shape");
    return;
  }
  if (!shape::isValidFingerCount(params.shape, params.fingerCount)) {
    out.add(ViolationE::parity_violation, "finger_count",
            fmt::format("{} needs an {} count >= {}, got {}",
                        util::enumUtil::val2Str(ShapeEStr, params.shape),
                        shape::parity(params.shape) ? "odd" : "even",
                        shape::minFingers(params.shape), params.fingerCount));
  }
}

void DrcMgr::checkHeight(const Geometry& geo, const ShapeParams& params, ValidationOutcome& out) const
{
  if (!params.hasHeightCeiling()) {
    return;
  }
  const Int ceiling = _tech.toDBUnitFloor(params.heightCeiling);
  if (geo.totalHeight() > ceiling) {
    out.add(ViolationE::height_exceeds_ceiling, "height_ceiling",
            fmt::format("{} > {}", _tech.toUm(geo.totalHeight()), params.heightCeiling));
  }
}

void DrcMgr::checkMinArea(const Geometry& geo, ValidationOutcome& out) const
{
  if (!_tech.hasMinArea()) {
    return;
  }
  String name;
  const Long area = geo.minRectArea(&name);
  if (area < _tech.minArea()) {
    const Real g2 = _tech.grid() * _tech.grid();
    out.add(ViolationE::area_too_small, name,
            fmt::format("{:.6f} < {:.6f}", area * g2, _tech.minArea() * g2));
  }
}

PROJECT_NAMESPACE_END
