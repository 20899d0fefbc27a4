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
#include "geo/box.hpp"

PROJECT_NAMESPACE_START

// Caller-owned primary parameters, lengths in um.
struct ShapeParams {
  ShapeE          shape          = ShapeE::undef;
  Int             fingerCount    = 0;
  Real            activeHeight   = 0;   // height of the capacitor core
  Real            fingerWidth    = 0;
  Real            fingerSpacing  = 0;
  Real            barWidth       = 0;   // top/bottom plate bars, quantized
  Real            middleBarWidth = 0;   // frame_bar/sandwich only, quantized
  Real            frameWidth     = 0;   // shield ring, quantized
  Real            spacing        = 0;   // core <-> shield ring
  Real            tipSpacing     = 0;   // finger tip <-> opposite bar
  Vector<String>  vLayers;              // top -> bottom
  Real            heightCeiling  = 0;   // <= 0: no ceiling
  bool            bLowParasitic  = false;
  bool            bIncludeShield = true;
  Real            labelSize      = 0.1;
  String          posLabel       = "PLUS";
  String          negLabel       = "MINUS";

  bool hasHeightCeiling() const { return heightCeiling > 0; }
};

// A width or spacing the builder derived, kept by name for the validator.
struct NamedDim {
  String name;
  Int    value;
  bool   bQuantized; // widths only
};

// Straight wire drawn as a path: centerline p0 -> p1, ends truncated.
struct Wire {
  String     name;
  Point<Int> p0, p1;
  Int        width;
  PlateE     plate;

  bool     isHor()  const { return p0.y() == p1.y(); }
  Int      length() const { return Point<Int>::Mdistance(p0, p1); }
  Box<Int> box()    const;
};

struct LayerGeom {
  String           layer;
  Vector<Wire>     vWires;  // emission order: shield ring, bars, fingers
  Vector<Box<Int>> vPlates; // solid plates (sandwich outer layers)
};

// One via array site; instantiated once per adjacent layer pair.
struct ViaRow {
  String     name;     // top / middle / bottom
  String     upper;    // layer above
  String     lower;    // layer below
  String     viaName;  // layer-pair id, e.g. M7_M6
  Point<Int> center;
  Int        numRows;
  Int        numCols;
};

// Derived, read-only result of a shape builder; lengths in database units.
class Geometry {
  friend class ShapeMgr;

public:
  Geometry()
    : _shape(ShapeE::undef), _grid(0), _precision(0),
      _halfWidth(0), _halfHeight(0),
      _activeHalfWidth(0), _activeHalfHeight(0), _totalHeight(0)
  {}

  ShapeE                    shape()             const { return _shape; }
  Real                      grid()              const { return _grid; }
  Int                       precision()         const { return _precision; }

  Int                       halfWidth()         const { return _halfWidth; }
  Int                       halfHeight()        const { return _halfHeight; }
  Int                       activeHalfWidth()   const { return _activeHalfWidth; }
  Int                       activeHalfHeight()  const { return _activeHalfHeight; }
  Int                       totalHeight()       const { return _totalHeight; }
  Box<Int>                  bbox()              const { return Box<Int>(-_halfWidth, -_halfHeight, _halfWidth, _halfHeight); }

  const Vector<NamedDim>&   vWidths()           const { return _vWidths; }
  const Vector<NamedDim>&   vSpacings()         const { return _vSpacings; }
  const NamedDim*           width(const String& n)   const;
  const NamedDim*           spacing(const String& n) const;

  Int                       numLayers()         const { return _vLayerGeoms.size(); }
  const LayerGeom&          layerGeom(const Int i) const { return _vLayerGeoms.at(i); } // 0 = top
  const Vector<LayerGeom>&  vLayerGeoms()       const { return _vLayerGeoms; }

  const Vector<ViaRow>&     vViaRows()          const { return _vViaRows; }
  const Point<Int>&         posPin()            const { return _posPin; }
  const Point<Int>&         negPin()            const { return _negPin; }

  // smallest rectangle drawn on any layer, shield included
  Long                      minRectArea(String* pName = nullptr) const;

private:
  ShapeE                    _shape;
  Real                      _grid;
  Int                       _precision;
  Int                       _halfWidth, _halfHeight;
  Int                       _activeHalfWidth, _activeHalfHeight;
  Int                       _totalHeight;
  Vector<NamedDim>          _vWidths;
  Vector<NamedDim>          _vSpacings;
  Vector<LayerGeom>         _vLayerGeoms;
  Vector<ViaRow>            _vViaRows;
  Point<Int>                _posPin, _negPin;
};

PROJECT_NAMESPACE_END
