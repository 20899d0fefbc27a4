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

using namespace PROJECT_NAMESPACE;

TEST(TechProfile, ParsesReferenceProfiles)
{
  TechProfile t28;
  Parser par28(t28);
  par28.parseTech(String(MOMGEN_TECH_DIR) + "/t28.yaml");
  EXPECT_EQ(t28.name(), "t28");
  EXPECT_EQ(t28.numLayers(), 9);
  EXPECT_EQ(t28.layerIdx("M3"), 2);
  EXPECT_EQ(t28.layerIdx("M10"), -1);
  EXPECT_EQ(t28.minSpacing(), 10);
  EXPECT_EQ(t28.viaPitch(), 104);
  EXPECT_EQ(t28.minArea(), 400);
  EXPECT_TRUE(t28.isLowParasiticExcluded("M1"));
  EXPECT_FALSE(t28.isLowParasiticExcluded("M3"));
  EXPECT_EQ(t28.namedSpacingMin("tip_spacing"), 20);
  EXPECT_EQ(t28.namedSpacingMin("finger_spacing"), 0);

  TechProfile t180;
  Parser par180(t180);
  par180.parseTech(String(MOMGEN_TECH_DIR) + "/t180.yaml");
  EXPECT_EQ(t180.namingStyle(), LayerNamingE::long_name);
  EXPECT_TRUE(t180.hasLayer("METAL6"));
  EXPECT_EQ(t180.viaName("METAL3", "METAL2"), "M3_M2");
}

TEST(TechProfile, LayerAdjacency)
{
  const TechProfile tech = testutil::makeT28();
  EXPECT_TRUE(tech.isAdjacent("M7", "M6"));
  EXPECT_FALSE(tech.isAdjacent("M6", "M7"));
  EXPECT_FALSE(tech.isAdjacent("M7", "M5"));
  EXPECT_FALSE(tech.isAdjacent("M7", "M10"));
  EXPECT_EQ(tech.viaName("M7", "M6"), "M7_M6");
}

TEST(TechProfile, QuantizationIsIdempotent)
{
  const TechProfile tech = testutil::makeT28();
  for (Int w = 1; w <= 600; ++w) {
    const Int q = tech.quantizeWidth(w);
    EXPECT_TRUE(tech.isQuantized(q)) << w;
    EXPECT_GE(q, w);
    EXPECT_LT(q - w, tech.widthQuantBase() + tech.widthQuantStep());
    EXPECT_EQ(tech.quantizeWidth(q), q) << w;
  }
  EXPECT_EQ(tech.quantizeWidth(tech.toDBUnit(0.40)), tech.toDBUnit(0.90));
}

TEST(TechProfile, ViaRowsGrowOnePerQuantStep)
{
  const TechProfile tech = testutil::makeT28();
  EXPECT_EQ(tech.numViaCuts(tech.toDBUnit(0.38)), 1);
  EXPECT_EQ(tech.numViaCuts(tech.toDBUnit(0.90)), 2);
  EXPECT_EQ(tech.numViaCuts(tech.toDBUnit(1.42)), 3);
  for (Int k = 0; k < 10; ++k) {
    const Int w = tech.widthQuantBase() + k * tech.widthQuantStep();
    EXPECT_EQ(tech.numViaCuts(w), k + 1);
  }
  EXPECT_EQ(tech.numViaCuts(1), 1);
}

TEST(TechProfile, RejectsMissingField)
{
  YAML::Node node = testutil::t28Node();
  node.remove("via_pitch");
  try {
    testutil::makeTech(node);
    FAIL() << "missing via_pitch accepted";
  }
  catch (const ConfigError& e) {
    EXPECT_NE(String(e.what()).find("via_pitch"), String::npos);
  }
}

TEST(TechProfile, RejectsMixedNaming)
{
  YAML::Node node = testutil::t28Node();
  node["allowed_layers"] = YAML::Load("[M1, METAL2, M3]");
  node.remove("low_parasitic_excluded_layers");
  EXPECT_THROW(testutil::makeTech(node), ConfigError);
}

TEST(TechProfile, RejectsOverlongLayerNumbers)
{
  YAML::Node node = testutil::t28Node();
  node["allowed_layers"] = YAML::Load("[M1, M2, M123456789012]");
  EXPECT_THROW(testutil::makeTech(node), ConfigError);

  const TechProfile tech = testutil::makeT28();
  EXPECT_EQ(util::str::trailingNum("M123456789012"), -1);
  EXPECT_EQ(util::str::trailingNum("METAL12"), 12);
  EXPECT_FALSE(tech.isAdjacent("M123456789012", "M9"));
  EXPECT_EQ(tech.viaName("M123456789012", "M9"), "M123456789012_M9");
}

TEST(TechProfile, RejectsMalformedValues)
{
  {
    YAML::Node node = testutil::t28Node();
    node["min_spacing"] = 0.052;
    EXPECT_THROW(testutil::makeTech(node), ConfigError);
  }
  {
    YAML::Node node = testutil::t28Node();
    node["min_width"] = 0;
    EXPECT_THROW(testutil::makeTech(node), ConfigError);
  }
  {
    // 103 grid units cannot be centered on the grid
    YAML::Node node = testutil::t28Node();
    node["width_quant_step"] = 0.515;
    EXPECT_THROW(testutil::makeTech(node), ConfigError);
  }
  {
    YAML::Node node = testutil::t28Node();
    node["allowed_layers"] = YAML::Load("[M1, M2, M2]");
    EXPECT_THROW(testutil::makeTech(node), ConfigError);
  }
  {
    YAML::Node node = testutil::t28Node();
    node["low_parasitic_excluded_layers"] = YAML::Load("[M0]");
    EXPECT_THROW(testutil::makeTech(node), ConfigError);
  }
  {
    YAML::Node node = testutil::t28Node();
    node["layer_naming_style"] = "mixed";
    EXPECT_THROW(testutil::makeTech(node), ConfigError);
  }
}

TEST(TechProfile, OptionalMinArea)
{
  YAML::Node node = testutil::t28Node();
  node.remove("min_area");
  const TechProfile tech = testutil::makeTech(node);
  EXPECT_FALSE(tech.hasMinArea());
}
