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

#include <gtest/gtest.h>

#include "testUtil.hpp"
#include "io/parser.hpp"
#include "io/writer.hpp"
#include "shape/shapeMgr.hpp"
#include "drc/drcMgr.hpp"
#include "render/renderMgr.hpp"

using namespace PROJECT_NAMESPACE;

class ParserTest : public ::testing::Test {
protected:
  ParserTest() : tech(testutil::makeT28()), par(tech) {}

  TechProfile tech;
  Parser      par;
};

TEST_F(ParserTest, ShapeKeys)
{
  bool bShield = true;
  EXPECT_EQ(Parser::parseShapeKey("H_shieldless", bShield), ShapeE::frame_bar);
  EXPECT_FALSE(bShield);
  EXPECT_EQ(Parser::parseShapeKey("I_shield", bShield), ShapeE::alt_finger);
  EXPECT_TRUE(bShield);
  bShield = false;
  EXPECT_EQ(Parser::parseShapeKey("sandwich", bShield), ShapeE::sandwich);
  EXPECT_FALSE(bShield);
  EXPECT_EQ(Parser::parseShapeKey("frame_bar", bShield), ShapeE::frame_bar);
  EXPECT_EQ(Parser::parseShapeKey("X", bShield), ShapeE::undef);
}

TEST_F(ParserTest, ParsesExampleShapes)
{
  ShapeParams h;
  par.parseShape(String(MOMGEN_DATA_DIR) + "/shape_H.yaml", h);
  EXPECT_EQ(h.shape, ShapeE::frame_bar);
  EXPECT_TRUE(h.bIncludeShield);
  EXPECT_EQ(h.fingerCount, 5);
  EXPECT_DOUBLE_EQ(h.activeHeight, 2.0);
  EXPECT_DOUBLE_EQ(h.heightCeiling, 3.0);
  EXPECT_TRUE(h.bLowParasitic);
  EXPECT_EQ(h.vLayers, Vector<String>({"M7", "M6", "M5", "M4", "M3"}));

  ShapeParams i;
  par.parseShape(String(MOMGEN_DATA_DIR) + "/shape_I.yaml", i);
  EXPECT_EQ(i.shape, ShapeE::alt_finger);
  EXPECT_FALSE(i.bIncludeShield);
  EXPECT_FALSE(i.hasHeightCeiling());

  // every shipped example is accepted by the reference profile
  const ShapeMgr shapeMgr(tech);
  const DrcMgr drc(tech);
  for (const String& name : {"shape_H.yaml", "shape_I.yaml", "shape_sandwich.yaml"}) {
    ShapeParams p;
    par.parseShape(String(MOMGEN_DATA_DIR) + "/" + name, p);
    EXPECT_TRUE(drc.validate(shapeMgr.computeGeometry(p), p).accepted()) << name;
  }
}

TEST_F(ParserTest, ShapeErrors)
{
  const YAML::Node base = YAML::Load(R"(
shape: H
finger_count: 5
active_height: 2.0
finger_width: 0.05
finger_spacing: 0.05
bar_width: 0.38
middle_bar_width: 0.38
frame_width: 0.38
spacing: 0.1
tip_spacing: 0.1
layers: [M7, M6]
)");
  {
    ShapeParams p;
    par.parseShape(YAML::Clone(base), p);
    EXPECT_EQ(p.shape, ShapeE::frame_bar);
    EXPECT_EQ(p.posLabel, "PLUS");
  }
  {
    YAML::Node node = YAML::Clone(base);
    node.remove("finger_count");
    ShapeParams p;
    try {
      par.parseShape(node, p);
      FAIL() << "missing finger_count accepted";
    }
    catch (const ConfigError& e) {
      EXPECT_NE(String(e.what()).find("finger_count"), String::npos);
    }
  }
  {
    YAML::Node node = YAML::Clone(base);
    node["shape"] = "hexagon";
    ShapeParams p;
    EXPECT_THROW(par.parseShape(node, p), ConfigError);
  }
  {
    YAML::Node node = YAML::Clone(base);
    node["finger_width"] = "wide";
    ShapeParams p;
    EXPECT_THROW(par.parseShape(node, p), ConfigError);
  }
  {
    YAML::Node node = YAML::Clone(base);
    node["layers"] = "M7";
    ShapeParams p;
    EXPECT_THROW(par.parseShape(node, p), ConfigError);
  }
  {
    ShapeParams p;
    EXPECT_THROW(par.parseShape(String(MOMGEN_DATA_DIR) + "/missing.yaml", p), ConfigError);
  }
}

TEST_F(ParserTest, ArrayErrors)
{
  ArrayPattern pattern;
  EXPECT_THROW(par.parseArray(YAML::Load("pitch: 1.6"), pattern), ConfigError);
  EXPECT_THROW(par.parseArray(YAML::Load("{pitch: 1.6, array_data: [[\"1\", \"1\"], [\"1\"]]}"), pattern), ConfigError);
  EXPECT_THROW(par.parseArray(YAML::Load("{pitch: 1.6013, array_data: [[\"1\"]]}"), pattern), ConfigError);
  par.parseArray(YAML::Load("{pitch: 1.6, array_data: [[1, 0], [0, ~]]}"), pattern);
  EXPECT_EQ(pattern.pitch(), Point<Int>(320, 320));
  EXPECT_EQ(pattern.numGroups(), 2);
  EXPECT_EQ(pattern.mainGrid().numOccupied(), 1);
  EXPECT_EQ(pattern.dummyGrid().numOccupied(), 2);
}

TEST_F(ParserTest, WriterEmitsFixedPrecisionLiterals)
{
  const ShapeParams p = testutil::frameBarParams();
  const Vector<Prim> vPrims = RenderMgr().render(ShapeMgr(tech).computeGeometry(p), p, true);
  const NumFormat nf(tech.grid(), tech.precision());
  const YAML::Node out = YAML::Load(Writer(nf).prims2Str(vPrims));
  ASSERT_TRUE(out.IsSequence());
  ASSERT_EQ(out.size(), vPrims.size());

  const YAML::Node& first = out[0];
  EXPECT_EQ(first["type"].as<String>(), "path");
  EXPECT_EQ(first["layer"].as<String>(), "M3");
  EXPECT_EQ(first["extend"].as<String>(), "truncateExtend");
  EXPECT_EQ(first["width"].as<String>(), "0.380");
  EXPECT_TRUE(first["shield"].as<bool>());
  EXPECT_EQ(first["points"][0][0].as<String>(), "-" + nf.str(-first["points"][0][0].as<Real>()));

  Int numVias = 0;
  for (const YAML::Node& n : out) {
    if (n["type"].as<String>() == "via") {
      ++numVias;
      EXPECT_EQ(n["cut_rows"].as<Int>(), 1);
      EXPECT_TRUE(n["via"].as<String>().find("_M") != String::npos);
    }
  }
  EXPECT_EQ(numVias, 12);
  const YAML::Node& label = out[out.size() - 1];
  EXPECT_EQ(label["type"].as<String>(), "label");
  EXPECT_EQ(label["text"].as<String>(), "MINUS");
  EXPECT_EQ(label["orient"].as<String>(), "R0");
  EXPECT_EQ(label["size"].as<String>(), "0.100");
}

TEST_F(ParserTest, WriterPlacements)
{
  const NumFormat nf(tech.grid(), tech.precision());
  MosaicPlacement pl{"C_MAIN", Point<Int>(0, -660), 2, 3, Point<Int>(320, 660)};
  const YAML::Node out = YAML::Load(Writer(nf).placements2Str({pl}));
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0]["master"].as<String>(), "C_MAIN");
  EXPECT_EQ(out[0]["origin"][1].as<String>(), "-3.300");
  EXPECT_EQ(out[0]["rows"].as<Int>(), 2);
  EXPECT_EQ(out[0]["columns"].as<Int>(), 3);
  EXPECT_EQ(out[0]["pitch"][0].as<String>(), "1.600");
}
