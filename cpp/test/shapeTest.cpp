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
#include "shape/shapeMgr.hpp"

using namespace PROJECT_NAMESPACE;

namespace {

const Wire* findWire(const LayerGeom& lg, const String& name)
{
  for (const Wire& w : lg.vWires) {
    if (w.name == name) {
      return &w;
    }
  }
  return nullptr;
}

Int countPlate(const LayerGeom& lg, const PlateE plate)
{
  return std::count_if(lg.vWires.begin(), lg.vWires.end(), [plate](const Wire& w) { return w.plate == plate; });
}

ViolationE errorTag(const ShapeMgr& mgr, const ShapeParams& params)
{
  try {
    mgr.computeGeometry(params);
  }
  catch (const GeometryError& e) {
    return e.tag();
  }
  return ViolationE::undef;
}

String errorField(const ShapeMgr& mgr, const ShapeParams& params)
{
  try {
    mgr.computeGeometry(params);
  }
  catch (const GeometryError& e) {
    return e.field();
  }
  return "";
}

} // namespace

class ShapeTest : public ::testing::Test {
protected:
  ShapeTest() : tech(testutil::makeT28()), mgr(tech) {}

  TechProfile tech;
  ShapeMgr    mgr;
};

TEST_F(ShapeTest, TotalHeightIsActivePlusSpacingPlusFrame)
{
  const Vector<ShapeParams> vBase = {testutil::frameBarParams(), testutil::altFingerParams(), testutil::sandwichParams()};
  const Vector<Real> vActive  = {1.5, 2.0, 3.5, 5.0};
  const Vector<Real> vSpacing = {0.05, 0.1, 0.235};
  const Vector<Real> vFrame   = {0.38, 0.90, 1.42};
  for (const ShapeParams& base : vBase) {
    for (const Real aH : vActive) {
      for (const Real sp : vSpacing) {
        for (const Real frw : vFrame) {
          ShapeParams p = base;
          p.activeHeight = aH;
          p.spacing      = sp;
          p.frameWidth   = frw;
          const Geometry geo = mgr.computeGeometry(p);
          EXPECT_EQ(geo.totalHeight(), tech.toDBUnit(aH) + 2 * tech.toDBUnit(sp) + 2 * tech.toDBUnit(frw));
          EXPECT_EQ(geo.halfHeight() * 2, geo.totalHeight());
          EXPECT_EQ(geo.halfWidth(), geo.activeHalfWidth() + tech.toDBUnit(sp) + tech.toDBUnit(frw));
        }
      }
    }
  }
}

TEST_F(ShapeTest, OddVariantParity)
{
  for (const ShapeParams& base : {testutil::frameBarParams(), testutil::sandwichParams()}) {
    for (const Int n : {2, 4, 6}) {
      ShapeParams p = base;
      p.fingerCount = n;
      EXPECT_EQ(errorTag(mgr, p), ViolationE::parity_violation) << n;
    }
    for (const Int n : {3, 5, 7}) {
      ShapeParams p = base;
      p.fingerCount = n;
      EXPECT_NO_THROW(mgr.computeGeometry(p)) << n;
    }
  }
}

TEST_F(ShapeTest, EvenVariantParity)
{
  for (const Int n : {1, 3, 5}) {
    ShapeParams p = testutil::altFingerParams();
    p.fingerCount = n;
    EXPECT_EQ(errorTag(mgr, p), ViolationE::parity_violation) << n;
  }
  for (const Int n : {2, 4, 6}) {
    ShapeParams p = testutil::altFingerParams();
    p.fingerCount = n;
    EXPECT_NO_THROW(mgr.computeGeometry(p)) << n;
  }
}

TEST_F(ShapeTest, FrameBarLayout)
{
  const Geometry geo = mgr.computeGeometry(testutil::frameBarParams());
  ASSERT_EQ(geo.numLayers(), 5);
  const LayerGeom& top = geo.layerGeom(0);
  EXPECT_EQ(top.layer, "M7");

  // fingers on a 0.1um pitch centered on the origin
  const Wire* f0 = findWire(top, "finger_0");
  const Wire* f4 = findWire(top, "finger_4");
  ASSERT_NE(f0, nullptr);
  ASSERT_NE(f4, nullptr);
  EXPECT_EQ(f0->p0.x(), -40);
  EXPECT_EQ(f4->p0.x(), 40);
  EXPECT_EQ(f0->plate, PlateE::pos);
  EXPECT_EQ(findWire(top, "finger_1")->plate, PlateE::neg);

  // inner pos finger split around the middle bar, tip spacing away from it
  const Wire* upper = findWire(top, "finger_2_upper");
  const Wire* lower = findWire(top, "finger_2_lower");
  const Wire* mid   = findWire(top, "middle_bar");
  ASSERT_NE(upper, nullptr);
  ASSERT_NE(lower, nullptr);
  ASSERT_NE(mid, nullptr);
  EXPECT_EQ(findWire(top, "finger_2"), nullptr);
  EXPECT_EQ(upper->box().yl() - mid->box().yh(), tech.toDBUnit(0.1));
  EXPECT_EQ(mid->box().yl() - lower->box().yh(), tech.toDBUnit(0.1));
  EXPECT_EQ(mid->plate, PlateE::neg);

  // the middle bar keeps finger_spacing from the outer fingers
  EXPECT_EQ(mid->box().xl() - f0->box().xh(), tech.toDBUnit(0.05));
  EXPECT_EQ(f4->box().xl() - mid->box().xh(), tech.toDBUnit(0.05));

  // neg fingers stop tip_spacing short of the top bar
  const Wire* bar = findWire(top, "top_bar");
  ASSERT_NE(bar, nullptr);
  EXPECT_EQ(bar->box().yl() - findWire(top, "finger_1")->box().yh(), tech.toDBUnit(0.1));
  EXPECT_EQ(bar->box().yh(), geo.activeHalfHeight());

  EXPECT_EQ(countPlate(top, PlateE::shield), 4);

  // top, middle, bottom rows per adjacent pair
  ASSERT_EQ(geo.vViaRows().size(), 12u);
  EXPECT_EQ(geo.vViaRows()[0].name, "top_bar");
  EXPECT_EQ(geo.vViaRows()[1].name, "middle_bar");
  EXPECT_EQ(geo.vViaRows()[2].name, "bottom_bar");
  EXPECT_EQ(geo.vViaRows()[0].viaName, "M7_M6");
  EXPECT_EQ(geo.vViaRows()[11].viaName, "M4_M3");
  EXPECT_EQ(geo.vViaRows()[0].numRows, 1);
  EXPECT_EQ(geo.posPin(), Point<Int>(0, bar->p0.y()));
  EXPECT_EQ(geo.negPin(), Point<Int>(0, 0));
}

TEST_F(ShapeTest, AltFingerLayout)
{
  const Geometry geo = mgr.computeGeometry(testutil::altFingerParams());
  EXPECT_EQ(geo.width("middle_bar_width"), nullptr);
  ASSERT_EQ(geo.vViaRows().size(), 4u);
  for (const ViaRow& row : geo.vViaRows()) {
    EXPECT_NE(row.name, "middle_bar");
  }

  const LayerGeom& lg = geo.layerGeom(1);
  const Wire* top = findWire(lg, "top_bar");
  const Wire* bot = findWire(lg, "bottom_bar");
  ASSERT_NE(top, nullptr);
  ASSERT_NE(bot, nullptr);
  EXPECT_EQ(top->plate, PlateE::pos);
  EXPECT_EQ(bot->plate, PlateE::neg);
  for (Int i = 0; i < 6; ++i) {
    const Wire* f = findWire(lg, fmt::format("finger_{}", i));
    ASSERT_NE(f, nullptr);
    if (i % 2 == 0) {
      EXPECT_EQ(f->plate, PlateE::pos);
      EXPECT_EQ(f->box().yh(), top->box().yl());
      EXPECT_EQ(f->box().yl() - bot->box().yh(), tech.toDBUnit(0.1));
    }
    else {
      EXPECT_EQ(f->plate, PlateE::neg);
      EXPECT_EQ(f->box().yl(), bot->box().yh());
      EXPECT_EQ(top->box().yl() - f->box().yh(), tech.toDBUnit(0.1));
    }
  }
}

TEST_F(ShapeTest, SandwichLayout)
{
  const Geometry geo = mgr.computeGeometry(testutil::sandwichParams());
  ASSERT_EQ(geo.numLayers(), 3);
  for (const Int i : {0, 2}) {
    const LayerGeom& lg = geo.layerGeom(i);
    ASSERT_EQ(lg.vPlates.size(), 1u);
    EXPECT_EQ(lg.vPlates[0].width(), 2 * geo.activeHalfWidth());
    EXPECT_EQ(lg.vPlates[0].height(), 2 * geo.activeHalfHeight());
    EXPECT_EQ(countPlate(lg, PlateE::shield), static_cast<Int>(lg.vWires.size()));
  }
  EXPECT_NE(findWire(geo.layerGeom(1), "middle_bar"), nullptr);
  EXPECT_TRUE(geo.layerGeom(1).vPlates.empty());

  ASSERT_EQ(geo.vViaRows().size(), 2u);
  for (const ViaRow& row : geo.vViaRows()) {
    EXPECT_EQ(row.upper, "M4");
    EXPECT_EQ(row.lower, "M3");
  }

  ShapeParams p = testutil::sandwichParams();
  p.vLayers = {"M6", "M5", "M4", "M3"};
  EXPECT_EQ(errorTag(mgr, p), ViolationE::structural);
}

TEST_F(ShapeTest, WidthsAreQuantized)
{
  ShapeParams p = testutil::frameBarParams();
  p.activeHeight   = 4.0;
  p.barWidth       = 0.40;
  p.middleBarWidth = 0.91;
  p.frameWidth     = 0.38;
  const Geometry geo = mgr.computeGeometry(p);
  EXPECT_EQ(geo.width("bar_width")->value, tech.toDBUnit(0.90));
  EXPECT_EQ(geo.width("middle_bar_width")->value, tech.toDBUnit(1.42));
  EXPECT_EQ(geo.width("frame_width")->value, tech.toDBUnit(0.38));
  EXPECT_FALSE(geo.width("finger_width")->bQuantized);
  // wider bars carry more via rows
  EXPECT_EQ(geo.vViaRows()[0].numRows, 2);
  EXPECT_EQ(geo.vViaRows()[1].numRows, 3);
}

TEST_F(ShapeTest, ShieldRingAlwaysDerived)
{
  ShapeParams p = testutil::frameBarParams();
  p.bIncludeShield = false;
  const Geometry geo = mgr.computeGeometry(p);
  for (const LayerGeom& lg : geo.vLayerGeoms()) {
    ASSERT_EQ(countPlate(lg, PlateE::shield), 4);
    const Wire* left = findWire(lg, "shield_left");
    ASSERT_NE(left, nullptr);
    // sides butt against the top and bottom segments
    EXPECT_EQ(left->box().yh(), findWire(lg, "shield_top")->box().yl());
    EXPECT_EQ(left->box().xl(), geo.bbox().xl());
    EXPECT_EQ(findWire(lg, "shield_top")->box().yh(), geo.bbox().yh());
  }
  ASSERT_NE(geo.spacing("shield_spacing"), nullptr);
  EXPECT_EQ(geo.spacing("shield_spacing")->value, tech.toDBUnit(p.spacing));
  EXPECT_EQ(geo.spacing("tip_spacing")->value, tech.toDBUnit(p.tipSpacing));
  EXPECT_EQ(geo.spacing("no_such_spacing"), nullptr);
}

TEST_F(ShapeTest, StructuralErrors)
{
  {
    ShapeParams p = testutil::frameBarParams();
    p.vLayers.clear();
    EXPECT_EQ(errorTag(mgr, p), ViolationE::structural);
  }
  {
    ShapeParams p = testutil::frameBarParams();
    p.vLayers = {"M7", "M6", "M7"};
    EXPECT_EQ(errorTag(mgr, p), ViolationE::structural);
  }
  {
    // no room for the split fingers
    ShapeParams p = testutil::frameBarParams();
    p.activeHeight = 0.8;
    try {
      mgr.computeGeometry(p);
      FAIL() << "degenerate fingers accepted";
    }
    catch (const GeometryError& e) {
      EXPECT_EQ(e.tag(), ViolationE::structural);
      EXPECT_EQ(e.field(), "active_height");
    }
  }
  {
    ShapeParams p = testutil::frameBarParams();
    p.fingerSpacing = 0;
    EXPECT_EQ(errorTag(mgr, p), ViolationE::structural);
  }
  {
    // finger centerlines would fall between grid points
    ShapeParams p = testutil::frameBarParams();
    p.fingerWidth = 0.055;
    EXPECT_EQ(errorTag(mgr, p), ViolationE::structural);
  }
  {
    ShapeParams p = testutil::frameBarParams();
    p.shape = ShapeE::undef;
    EXPECT_EQ(errorTag(mgr, p), ViolationE::structural);
  }
}

TEST_F(ShapeTest, OffGridRequestsAreRejected)
{
  const Vector<Pair<String, Real ShapeParams::*>> vFields = {
      {"bar_width", &ShapeParams::barWidth},
      {"middle_bar_width", &ShapeParams::middleBarWidth},
      {"frame_width", &ShapeParams::frameWidth},
      {"finger_width", &ShapeParams::fingerWidth},
      {"finger_spacing", &ShapeParams::fingerSpacing},
      {"spacing", &ShapeParams::spacing},
      {"tip_spacing", &ShapeParams::tipSpacing},
      {"active_height", &ShapeParams::activeHeight}};
  for (const auto& f : vFields) {
    ShapeParams p = testutil::frameBarParams();
    p.activeHeight = 4.0;
    // 0.002 um under a grid point, never rounded to it
    p.*(f.second) -= 0.002;
    EXPECT_EQ(errorTag(mgr, p), ViolationE::structural) << f.first;
    EXPECT_EQ(errorField(mgr, p), f.first);
  }
}

TEST_F(ShapeTest, QuantizedWidthNeverNarrowerThanRequest)
{
  ShapeParams p = testutil::frameBarParams();
  p.activeHeight = 4.0;
  p.barWidth     = 0.385;
  const Geometry geo = mgr.computeGeometry(p);
  EXPECT_EQ(geo.width("bar_width")->value, tech.toDBUnit(0.90));

  p.barWidth = 0.382;
  EXPECT_THROW(mgr.computeGeometry(p), GeometryError);
}

TEST_F(ShapeTest, Deterministic)
{
  const Geometry a = mgr.computeGeometry(testutil::frameBarParams());
  const Geometry b = mgr.computeGeometry(testutil::frameBarParams());
  ASSERT_EQ(a.numLayers(), b.numLayers());
  for (Int i = 0; i < a.numLayers(); ++i) {
    ASSERT_EQ(a.layerGeom(i).vWires.size(), b.layerGeom(i).vWires.size());
    for (size_t j = 0; j < a.layerGeom(i).vWires.size(); ++j) {
      EXPECT_EQ(a.layerGeom(i).vWires[j].box(), b.layerGeom(i).vWires[j].box());
    }
  }
}
