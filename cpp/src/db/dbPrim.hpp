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
#include "geo/point.hpp"

PROJECT_NAMESPACE_START

// Drawing primitives, coordinates in um and already snapped to the grid.

struct PathPrim {
  String              layer;
  Vector<Point<Real>> vPts;
  Real                width;
  PathExtendE         extend;
};

struct ViaPrim {
  String              viaName;  // layer-pair id
  Point<Real>         origin;
  Int                 numRows;
  Int                 numCols;
};

struct LabelPrim {
  String              layer;
  Point<Real>         loc;
  String              text;
  String              align;
  Orient2dE           orient;
  Real                size;
};

struct RectPrim {
  String              layer;
  Point<Real>         bl;
  Point<Real>         tr;
};

class Prim {
public:
  using Data = Variant<PathPrim, ViaPrim, LabelPrim, RectPrim>;

  Prim(Data data, const bool bShield = false)
    : _data(std::move(data)), _bShield(bShield)
  {}

  PrimTypeE           type()    const;
  bool                isShield() const { return _bShield; }
  bool                isPath()  const { return std::holds_alternative<PathPrim>(_data); }
  bool                isVia()   const { return std::holds_alternative<ViaPrim>(_data); }
  bool                isLabel() const { return std::holds_alternative<LabelPrim>(_data); }
  bool                isRect()  const { return std::holds_alternative<RectPrim>(_data); }

  const PathPrim&     path()    const { return std::get<PathPrim>(_data); }
  const ViaPrim&      via()     const { return std::get<ViaPrim>(_data); }
  const LabelPrim&    label()   const { return std::get<LabelPrim>(_data); }
  const RectPrim&     rect()    const { return std::get<RectPrim>(_data); }

  // layer the primitive is drawn on (via: its layer-pair id)
  const String&       layer()   const;
  // every numeric value carried by the primitive, in emission order
  Vector<Real>        values()  const;

private:
  Data _data;
  bool _bShield;
};

PROJECT_NAMESPACE_END
