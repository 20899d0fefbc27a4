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

#include "io/parser.hpp"
#include "io/writer.hpp"
#include "shape/shapeMgr.hpp"
#include "drc/drcMgr.hpp"
#include "render/renderMgr.hpp"
#include "mosaic/mosaicMgr.hpp"
#include "cxxopts.hpp"

using namespace PROJECT_NAMESPACE;

namespace {

bool runArray(Parser& par, const Writer& wr, const String& arrayFile, const String& outFile)
{
  ArrayPattern pattern;
  par.parseArray(arrayFile, pattern);

  MosaicMgr mosaic;
  Vector<MosaicPlacement> vPlacements;
  auto addPlacements = [&](const ArrayGrid& grid, const String& master) {
    const Vector<MosaicRegion> vRegions = mosaic.merge(grid);
    const Vector<MosaicPlacement> vCur = mosaic.toPlacements(vRegions, grid, master, pattern.origin());
    vPlacements.insert(vPlacements.end(), vCur.begin(), vCur.end());
    spdlog::info("[Mosaic] {}: {} cells in {} placements", master, grid.numOccupied(), vRegions.size());
  };
  addPlacements(pattern.mainGrid(), pattern.unitCell());
  if (pattern.dummyGroup() != nullptr) {
    addPlacements(pattern.dummyGrid(), pattern.dummyCell());
  }
  for (const ArrayGroup& grp : pattern.vGroups()) {
    spdlog::info("[Mosaic] group {:>6} count {} units {}{}", grp.value, grp.count, grp.vCells.size(),
                 grp.bDummy ? " (dummy)" : "");
  }

  if (outFile.empty()) {
    std::cout << wr.placements2Str(vPlacements) << std::endl;
    return true;
  }
  return wr.writePlacements(outFile, vPlacements);
}

} // namespace

int main(int argc, char** argv) {

  spdlog::set_pattern("[%^%l%$] %v");

  cxxopts::Options options(argv[0], " - parametric MOM capacitor generator");
  options.add_options()
    ("tech", "technology profile (YAML)", cxxopts::value<std::string>())
    ("shape", "shape parameters (YAML)", cxxopts::value<std::string>())
    ("no_shield", "omit the shield ring from the output")
    ("array", "CDAC array pattern (YAML)", cxxopts::value<std::string>())
    ("out_prims", "primitive output (YAML), stdout if omitted", cxxopts::value<std::string>())
    ("out_array", "mosaic placement output (YAML), stdout if omitted", cxxopts::value<std::string>())
    ("v,verbose", "debug messages")
    ("h,help", "Print usage")
    ;

  auto args = options.parse(argc, argv);

  if (args.count("help")) {
    std::cout << options.help() << std::endl;
    return 0;
  }
  if (!args.count("tech") or !args.count("shape")) {
    spdlog::error("--tech and --shape are required");
    std::cout << options.help() << std::endl;
    return 1;
  }
  if (args.count("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  spdlog::stopwatch sw;
  try {
    TechProfile tech;
    Parser par(tech);
    par.parseTech(args["tech"].as<std::string>());

    ShapeParams params;
    par.parseShape(args["shape"].as<std::string>(), params);
    if (args.count("no_shield")) {
      params.bIncludeShield = false;
    }

    ShapeMgr shapeMgr(tech);
    const Geometry geo = shapeMgr.computeGeometry(params);

    DrcMgr drc(tech);
    const ValidationOutcome outcome = drc.validate(geo, params);
    if (!outcome.accepted()) {
      for (const Violation& v : outcome.vViolations()) {
        spdlog::error("[DrcMgr] {} {}: {}", util::enumUtil::val2Str(ViolationEStr, v.kind), v.field, v.msg);
      }
      spdlog::error("[DrcMgr] {} violations", outcome.numViolations());
      return 1;
    }
    spdlog::info("[DrcMgr] Geometry accepted, height {:.3f} um", tech.toUm(geo.totalHeight()));

    RenderMgr renderer;
    const Vector<Prim> vPrims = renderer.render(geo, params, params.bIncludeShield);
    spdlog::info("[RenderMgr] {} primitives", vPrims.size());

    const NumFormat nf(tech.grid(), tech.precision());
    Writer wr(nf);
    if (args.count("out_prims")) {
      if (!wr.writePrims(args["out_prims"].as<std::string>(), vPrims)) {
        return 1;
      }
    }
    else {
      std::cout << wr.prims2Str(vPrims) << std::endl;
    }

    if (args.count("array")) {
      const String outArray = args.count("out_array") ? args["out_array"].as<std::string>() : "";
      if (!runArray(par, wr, args["array"].as<std::string>(), outArray)) {
        return 1;
      }
    }
  }
  catch (const ConfigError& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
  catch (const GeometryError& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
  catch (const RenderError& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  spdlog::info("{:<30} Elapsed: {:.3f} s", "Total", sw);
  return 0;
}
