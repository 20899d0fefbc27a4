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

#include <random>
#include <gtest/gtest.h>
#include <boost/polygon/polygon.hpp>

#include "mosaic/mosaicMgr.hpp"
#include "geo/box.hpp"

using namespace PROJECT_NAMESPACE;
namespace gtl = boost::polygon;

namespace {

ArrayGrid fullGrid(const Int numRows, const Int numCols)
{
  ArrayGrid grid(numRows, numCols, Point<Int>(320, 660));
  for (Int r = 0; r < numRows; ++r) {
    for (Int c = 0; c < numCols; ++c) {
      grid.setOccupied(r, c);
    }
  }
  return grid;
}

// regions are disjoint and cover exactly the occupied cells
void expectExactCover(const ArrayGrid& grid, const Vector<MosaicRegion>& vRegions)
{
  using PolySet = gtl::polygon_90_set_data<Int>;
  using namespace gtl::operators;

  PolySet regions, cells;
  Long sumArea = 0;
  for (const MosaicRegion& reg : vRegions) {
    ASSERT_LE(reg.rowStart, reg.rowEnd);
    ASSERT_LE(reg.colStart, reg.colEnd);
    for (Int r = reg.rowStart; r <= reg.rowEnd; ++r) {
      for (Int c = reg.colStart; c <= reg.colEnd; ++c) {
        EXPECT_EQ(grid.pitch(r, c), reg.pitch);
      }
    }
    const Box<Int> box(reg.colStart, reg.rowStart, reg.colEnd + 1, reg.rowEnd + 1);
    regions.insert(box);
    sumArea += box.area();
  }
  for (Int r = 0; r < grid.numRows(); ++r) {
    for (Int c = 0; c < grid.numCols(); ++c) {
      if (grid.isOccupied(r, c)) {
        cells.insert(Box<Int>(c, r, c + 1, r + 1));
      }
    }
  }
  EXPECT_EQ(gtl::area(regions), sumArea) << "regions overlap";
  EXPECT_EQ(sumArea, grid.numOccupied());
  PolySet diff;
  gtl::assign(diff, regions ^ cells);
  EXPECT_EQ(gtl::area(diff), 0);
}

bool sortedByRowCol(const Vector<MosaicRegion>& vRegions)
{
  return std::is_sorted(vRegions.begin(), vRegions.end(), [](const MosaicRegion& a, const MosaicRegion& b) {
    return a.rowStart != b.rowStart ? a.rowStart < b.rowStart : a.colStart < b.colStart;
  });
}

} // namespace

TEST(MosaicMgr, FullGridIsOneRegion)
{
  const ArrayGrid grid = fullGrid(12, 6);
  const Vector<MosaicRegion> vRegions = MosaicMgr().merge(grid);
  ASSERT_EQ(vRegions.size(), 1u);
  EXPECT_EQ(vRegions[0], (MosaicRegion{0, 11, 0, 5, Point<Int>(320, 660)}));
  expectExactCover(grid, vRegions);
}

TEST(MosaicMgr, SingleHoleNeedsAtMostFourRegions)
{
  const MosaicMgr mosaic;
  for (Int hr = 0; hr < 12; ++hr) {
    for (Int hc = 0; hc < 6; ++hc) {
      ArrayGrid grid = fullGrid(12, 6);
      grid.setOccupied(hr, hc, false);
      const Vector<MosaicRegion> vRegions = mosaic.merge(grid);
      EXPECT_LE(vRegions.size(), 4u) << hr << " " << hc;
      EXPECT_TRUE(sortedByRowCol(vRegions));
      expectExactCover(grid, vRegions);
    }
  }
}

TEST(MosaicMgr, RandomGridsAreCoveredExactly)
{
  std::mt19937 rng(2024);
  std::uniform_int_distribution<Int> coin(0, 9);
  const MosaicMgr mosaic;
  for (Int iter = 0; iter < 50; ++iter) {
    ArrayGrid grid(9, 7, Point<Int>(100, 100));
    bool hasPair = false;
    for (Int r = 0; r < grid.numRows(); ++r) {
      for (Int c = 0; c < grid.numCols(); ++c) {
        grid.setOccupied(r, c, coin(rng) >= 3);
        if (coin(rng) == 0) {
          grid.setPitch(r, c, Point<Int>(120, 100));
        }
      }
    }
    for (Int r = 0; r < grid.numRows(); ++r) {
      for (Int c = 0; c + 1 < grid.numCols(); ++c) {
        hasPair |= grid.isOccupied(r, c) and grid.isOccupied(r, c + 1) and grid.pitch(r, c) == grid.pitch(r, c + 1);
      }
    }
    const Vector<MosaicRegion> vRegions = mosaic.merge(grid);
    expectExactCover(grid, vRegions);
    EXPECT_TRUE(sortedByRowCol(vRegions));
    if (hasPair) {
      EXPECT_LT(static_cast<Int>(vRegions.size()), grid.numOccupied());
    }
  }
}

TEST(MosaicMgr, PitchChangeSplitsRuns)
{
  ArrayGrid grid = fullGrid(2, 6);
  grid.setPitch(0, 3, Point<Int>(400, 660));
  grid.setPitch(0, 4, Point<Int>(400, 660));
  grid.setPitch(0, 5, Point<Int>(400, 660));
  const Vector<MosaicRegion> vRegions = MosaicMgr().merge(grid);
  ASSERT_EQ(vRegions.size(), 3u);
  EXPECT_EQ(vRegions[0], (MosaicRegion{0, 0, 0, 2, Point<Int>(320, 660)}));
  EXPECT_EQ(vRegions[1], (MosaicRegion{0, 0, 3, 5, Point<Int>(400, 660)}));
  EXPECT_EQ(vRegions[2], (MosaicRegion{1, 1, 0, 5, Point<Int>(320, 660)}));
  expectExactCover(grid, vRegions);
}

TEST(MosaicMgr, EmptyGrid)
{
  const ArrayGrid grid(4, 4, Point<Int>(100, 100));
  EXPECT_TRUE(MosaicMgr().merge(grid).empty());
}

TEST(MosaicMgr, PlacementsGrowUpFromBottomLeft)
{
  ArrayGrid grid = fullGrid(3, 4);
  grid.setOccupied(1, 1, false);
  const MosaicMgr mosaic;
  const Vector<MosaicRegion> vRegions = mosaic.merge(grid);
  const Vector<MosaicPlacement> vPlacements = mosaic.toPlacements(vRegions, grid, "C_MAIN", Point<Int>(1000, 0));
  ASSERT_EQ(vPlacements.size(), vRegions.size());

  // row 0 (top) first: a 1x4 strip whose lower-left is one pitch below the origin
  EXPECT_EQ(vPlacements[0].master, "C_MAIN");
  EXPECT_EQ(vPlacements[0].origin, Point<Int>(1000, -660));
  EXPECT_EQ(vPlacements[0].numRows, 1);
  EXPECT_EQ(vPlacements[0].numCols, 4);
  EXPECT_EQ(vPlacements[0].pitch, Point<Int>(320, 660));

  Int numCells = 0;
  for (size_t i = 0; i < vPlacements.size(); ++i) {
    const MosaicPlacement& pl = vPlacements[i];
    const MosaicRegion& reg = vRegions[i];
    EXPECT_EQ(pl.origin.x(), 1000 + reg.colStart * 320);
    EXPECT_EQ(pl.origin.y(), -(reg.rowEnd + 1) * 660);
    numCells += pl.numRows * pl.numCols;
  }
  EXPECT_EQ(numCells, grid.numOccupied());
}
