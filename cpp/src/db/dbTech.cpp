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

#include "dbTech.hpp"

PROJECT_NAMESPACE_START

Int TechProfile::layerIdx(const String& n) const
{
  auto it = _mLayerName2Idx.find(n);
  return it != _mLayerName2Idx.end() ? it->second : -1;
}

bool TechProfile::isAdjacent(const String& upper, const String& lower) const
{
  const Int u = layerIdx(upper);
  const Int l = layerIdx(lower);
  return u >= 0 and l >= 0 and u - l == 1;
}

String TechProfile::viaName(const String& upper, const String& lower) const
{
  const Int u = util::str::trailingNum(upper);
  const Int l = util::str::trailingNum(lower);
  if (u < 0 or l < 0) {
    return upper + "_" + lower;
  }
  return fmt::format("M{}_M{}", u, l);
}

Int TechProfile::namedSpacingMin(const String& n) const
{
  auto it = _mNamedSpacingMin.find(n);
  return it != _mNamedSpacingMin.end() ? it->second : 0;
}

bool TechProfile::isOnGrid(const Real um) const
{
  const Real q = um / _grid;
  return std::fabs(q - std::round(q)) <= GRID_TOL;
}

Int TechProfile::quantizeWidth(const Int w) const
{
  if (w <= _widthQuantBase) {
    return _widthQuantBase;
  }
  const Int n = util::num::ceilDiv(w - _widthQuantBase, _widthQuantStep);
  return _widthQuantBase + n * _widthQuantStep;
}

bool TechProfile::isQuantized(const Int w) const
{
  return w >= _widthQuantBase and (w - _widthQuantBase) % _widthQuantStep == 0;
}

Int TechProfile::numViaCuts(const Int span) const
{
  return std::max(1, util::num::floorDiv(span + _viaMargin, _viaPitch));
}

bool TechProfile::isValidLayerName(const String& n) const
{
  switch (_namingStyle) {
    case LayerNamingE::short_name:
      return n.size() > 1 and n[0] == 'M' and util::str::isDigits(n.substr(1))
             and util::str::trailingNum(n) >= 0;
    case LayerNamingE::long_name:
      return util::str::startsWith(n, "METAL") and util::str::isDigits(n.substr(5))
             and util::str::trailingNum(n) >= 0;
    default:
      return false;
  }
}

bool TechProfile::isWellFormed(String* pReason) const
{
  auto fail = [&](const String& reason) {
    if (pReason) {
      *pReason = reason;
    }
    return false;
  };

  if (_grid <= 0) {
    return fail("grid must be positive");
  }
  if (_precision < 0) {
    return fail("precision must be non-negative");
  }
  // the grid itself has to be printable with the given number of digits
  const Real scaled = _grid * std::pow(10.0, _precision);
  if (std::fabs(scaled - std::round(scaled)) > GRID_TOL) {
    return fail(fmt::format("grid {} is not representable with {} decimals", _grid, _precision));
  }
  if (_minSpacing <= 0) {
    return fail("min_spacing must be positive");
  }
  if (_minWidth <= 0) {
    return fail("min_width must be positive");
  }
  if (_minArea < 0) {
    return fail("min_area must be non-negative");
  }
  if (_viaPitch <= 0) {
    return fail("via_pitch must be positive");
  }
  if (_viaMargin < 0) {
    return fail("via_margin must be non-negative");
  }
  if (_widthQuantBase <= 0) {
    return fail("width_quant_base must be positive");
  }
  if (_widthQuantStep <= 0) {
    return fail("width_quant_step must be positive");
  }
  // quantized widths are drawn as path widths centered on grid points
  if (!util::num::isEven(_widthQuantBase) or !util::num::isEven(_widthQuantStep)) {
    return fail("width_quant_base/width_quant_step must be multiples of two grid units");
  }
  if (_namingStyle == LayerNamingE::undef) {
    return fail("layer_naming_style must be 'short' or 'long'");
  }
  if (_vLayers.empty()) {
    return fail("allowed_layers must not be empty");
  }
  for (const String& n : _vLayers) {
    if (!isValidLayerName(n)) {
      return fail(fmt::format("layer {} does not follow naming style {}", n,
                              util::enumUtil::val2Str(LayerNamingEStr, _namingStyle)));
    }
  }
  if (static_cast<Int>(_mLayerName2Idx.size()) != numLayers()) {
    return fail("allowed_layers contains duplicates");
  }
  for (const String& n : _sLowParasiticExcluded) {
    if (!hasLayer(n)) {
      return fail(fmt::format("low_parasitic_excluded_layers: unknown layer {}", n));
    }
  }
  for (const auto& item : _mNamedSpacingMin) {
    if (item.second <= 0) {
      return fail(fmt::format("named_spacing_min: {} must be positive", item.first));
    }
  }
  return true;
}

PROJECT_NAMESPACE_END
