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

#include <fstream>

#include "writer.hpp"

PROJECT_NAMESPACE_START

String Writer::prims2Str(const Vector<Prim>& vPrims) const
{
  YAML::Emitter out;
  out << YAML::BeginSeq;
  for (const Prim& p : vPrims) {
    emitPrim(out, p);
  }
  out << YAML::EndSeq;
  return out.c_str();
}

void Writer::emitPrim(YAML::Emitter& out, const Prim& p) const
{
  out << YAML::BeginMap;
  out << YAML::Key << "type" << YAML::Value << util::enumUtil::val2Str(PrimTypeEStr, p.type());
  switch (p.type()) {
    case PrimTypeE::path: {
      const PathPrim& path = p.path();
      out << YAML::Key << "layer" << YAML::Value << path.layer;
      out << YAML::Key << "points" << YAML::Value << YAML::Flow << YAML::BeginSeq;
      for (const Point<Real>& pt : path.vPts) {
        emitPoint(out, pt);
      }
      out << YAML::EndSeq;
      out << YAML::Key << "width" << YAML::Value << _nf.str(path.width);
      out << YAML::Key << "extend" << YAML::Value << util::enumUtil::val2Str(PathExtendEStr, path.extend);
      break;
    }
    case PrimTypeE::via: {
      const ViaPrim& via = p.via();
      out << YAML::Key << "via" << YAML::Value << via.viaName;
      out << YAML::Key << "origin" << YAML::Value;
      emitPoint(out, via.origin);
      out << YAML::Key << "cut_rows" << YAML::Value << via.numRows;
      out << YAML::Key << "cut_columns" << YAML::Value << via.numCols;
      break;
    }
    case PrimTypeE::label: {
      const LabelPrim& label = p.label();
      out << YAML::Key << "layer" << YAML::Value << label.layer;
      out << YAML::Key << "origin" << YAML::Value;
      emitPoint(out, label.loc);
      out << YAML::Key << "text" << YAML::Value << label.text;
      out << YAML::Key << "align" << YAML::Value << label.align;
      out << YAML::Key << "orient" << YAML::Value << util::enumUtil::val2Str(Orient2dEStr2, label.orient);
      out << YAML::Key << "size" << YAML::Value << _nf.str(label.size);
      break;
    }
    case PrimTypeE::rect: {
      const RectPrim& rect = p.rect();
      out << YAML::Key << "layer" << YAML::Value << rect.layer;
      out << YAML::Key << "bbox" << YAML::Value << YAML::Flow << YAML::BeginSeq;
      emitPoint(out, rect.bl);
      emitPoint(out, rect.tr);
      out << YAML::EndSeq;
      break;
    }
    default:
      assert(false);
  }
  if (p.isShield()) {
    out << YAML::Key << "shield" << YAML::Value << true;
  }
  out << YAML::EndMap;
}

void Writer::emitPoint(YAML::Emitter& out, const Point<Real>& p) const
{
  out << YAML::Flow << YAML::BeginSeq << _nf.str(p.x()) << _nf.str(p.y()) << YAML::EndSeq;
}

void Writer::emitDBUPoint(YAML::Emitter& out, const Point<Int>& p) const
{
  emitPoint(out, Point<Real>(_nf.toUm(p.x()), _nf.toUm(p.y())));
}

String Writer::placements2Str(const Vector<MosaicPlacement>& vPlacements) const
{
  YAML::Emitter out;
  out << YAML::BeginSeq;
  for (const MosaicPlacement& pl : vPlacements) {
    out << YAML::BeginMap;
    out << YAML::Key << "master" << YAML::Value << pl.master;
    out << YAML::Key << "origin" << YAML::Value;
    emitDBUPoint(out, pl.origin);
    out << YAML::Key << "rows" << YAML::Value << pl.numRows;
    out << YAML::Key << "columns" << YAML::Value << pl.numCols;
    out << YAML::Key << "pitch" << YAML::Value;
    emitDBUPoint(out, pl.pitch);
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  return out.c_str();
}

bool Writer::writePrims(const String& fileName, const Vector<Prim>& vPrims) const
{
  return writeFile(fileName, prims2Str(vPrims));
}

bool Writer::writePlacements(const String& fileName, const Vector<MosaicPlacement>& vPlacements) const
{
  return writeFile(fileName, placements2Str(vPlacements));
}

bool Writer::writeFile(const String& fileName, const String& content) const
{
  std::ofstream fout(fileName);
  if (!fout) {
    spdlog::error("[Writer] Cannot open {}", fileName);
    return false;
  }
  fout << content << std::endl;
  spdlog::info("[Writer] Wrote {}", fileName);
  return true;
}

PROJECT_NAMESPACE_END
