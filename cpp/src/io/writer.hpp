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

#include <yaml-cpp/yaml.h>

#include "db/dbPrim.hpp"
#include "db/dbMosaic.hpp"
#include "render/numFmt.hpp"

PROJECT_NAMESPACE_START

// YAML output of primitives and mosaic placements. Every number is written
// as a fixed-precision literal through NumFormat.
class Writer {
public:
  Writer(const NumFormat& nf) : _nf(nf) {}

  String  prims2Str(const Vector<Prim>& vPrims) const;
  String  placements2Str(const Vector<MosaicPlacement>& vPlacements) const;

  bool    writePrims(const String& fileName, const Vector<Prim>& vPrims) const;
  bool    writePlacements(const String& fileName, const Vector<MosaicPlacement>& vPlacements) const;

private:
  const NumFormat& _nf;

  void    emitPrim(YAML::Emitter& out, const Prim& p) const;
  void    emitPoint(YAML::Emitter& out, const Point<Real>& p) const;
  void    emitDBUPoint(YAML::Emitter& out, const Point<Int>& p) const;
  bool    writeFile(const String& fileName, const String& content) const;
};

PROJECT_NAMESPACE_END
