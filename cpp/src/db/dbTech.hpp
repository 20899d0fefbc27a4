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

#include "dbBasic.hpp"

PROJECT_NAMESPACE_START

// Process constants of one technology node. Filled once by the Parser and
// read-only afterwards; all lengths are in database units (one unit = grid).
class TechProfile {
  friend class Parser;

public:
  TechProfile()
    : _name(""), _grid(0.005), _precision(3),
      _minSpacing(0), _minWidth(0), _minArea(0),
      _viaPitch(0), _viaMargin(0),
      _widthQuantBase(0), _widthQuantStep(0),
      _namingStyle(LayerNamingE::undef)
  {}
  ~TechProfile() {}

  const String&               name()                                  const { return _name; }
  Real                        grid()                                  const { return _grid; }
  Int                         precision()                             const { return _precision; }

  Int                         minSpacing()                            const { return _minSpacing; }
  Int                         minWidth()                              const { return _minWidth; }
  Long                        minArea()                               const { return _minArea; }
  bool                        hasMinArea()                            const { return _minArea > 0; }
  Int                         viaPitch()                              const { return _viaPitch; }
  Int                         viaMargin()                             const { return _viaMargin; }
  Int                         widthQuantBase()                        const { return _widthQuantBase; }
  Int                         widthQuantStep()                        const { return _widthQuantStep; }

  // layers, low -> high
  LayerNamingE                namingStyle()                           const { return _namingStyle; }
  Int                         numLayers()                             const { return _vLayers.size(); }
  const String&               layer(const Int i)                      const { return _vLayers.at(i); }
  const Vector<String>&       vLayers()                               const { return _vLayers; }
  Int                         layerIdx(const String& n)               const;
  bool                        hasLayer(const String& n)               const { return _mLayerName2Idx.find(n) != _mLayerName2Idx.end(); }
  bool                        isLowParasiticExcluded(const String& n) const { return _sLowParasiticExcluded.find(n) != _sLowParasiticExcluded.end(); }
  bool                        isAdjacent(const String& upper, const String& lower) const;
  String                      viaName(const String& upper, const String& lower) const;

  // stricter per-name spacing minimum, 0 if not declared
  Int                         namedSpacingMin(const String& n)        const;

  // unit conversion
  Int                         toDBUnit(const Real um)                 const { return std::lround(um / _grid); }
  Long                        toDBUnit2d(const Real um2)              const { return std::llround(um2 / _grid / _grid); }
  Real                        toUm(const Int dbu)                     const { return dbu * _grid; }
  // exact grid multiple test; floor conversion for upper bounds
  bool                        isOnGrid(const Real um)                 const;
  Int                         toDBUnitFloor(const Real um)            const { return static_cast<Int>(std::floor(um / _grid + GRID_TOL)); }

  // width quantization: base + step * n, n >= 0
  Int                         quantizeWidth(const Int w)              const;
  bool                        isQuantized(const Int w)                const;
  // via cuts fitting in a span: max(1, floor((span + margin) / pitch))
  Int                         numViaCuts(const Int span)              const;

  bool                        isWellFormed(String* pReason = nullptr) const;
  bool                        isValidLayerName(const String& n)       const;

private:
  String                      _name;
  Real                        _grid;       // um per database unit
  Int                         _precision;  // decimal digits of emitted literals
  Int                         _minSpacing;
  Int                         _minWidth;
  Long                        _minArea;    // dbu^2, 0 if unset
  Int                         _viaPitch;
  Int                         _viaMargin;
  Int                         _widthQuantBase;
  Int                         _widthQuantStep;
  LayerNamingE                _namingStyle;
  Vector<String>              _vLayers;
  FlatHashMap<String, Int>    _mLayerName2Idx;
  FlatHashSet<String>         _sLowParasiticExcluded;
  FlatHashMap<String, Int>    _mNamedSpacingMin;
};

PROJECT_NAMESPACE_END
