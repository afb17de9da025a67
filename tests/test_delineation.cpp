// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_delineation.cpp
 *
 * Tests for snapping, upstream tracing, polygonization and the
 * sub-catchment stage.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>

#include "hydrodem/delineation/catchment.hpp"
#include "hydrodem/delineation/catchment_delineator.hpp"
#include "hydrodem/hydrology/conditioning.hpp"
#include "hydrodem/hydrology/flow_routing.hpp"

using namespace hydrodem;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

GeoTransform unitTransform(int rows) {
  GeoTransform gt;
  gt.pixel_width = 1.0;
  gt.origin_y = rows;
  gt.pixel_height = -1.0;
  return gt;
}

AccumulationRaster emptyAccumulation(int rows, int cols) {
  AccumulationRaster acc(rows, cols, unitTransform(rows), "");
  acc.data().setZero();
  return acc;
}

FlowDirectionRaster uniformDirections(int rows, int cols, std::uint8_t code) {
  FlowDirectionRaster dirs(rows, cols, unitTransform(rows), "", d8::kNoData);
  dirs.data().setConstant(code);
  return dirs;
}

CatchmentMask maskOf(int rows, int cols,
                     const std::vector<std::pair<int, int>>& cells) {
  CatchmentMask mask;
  mask.cells = Raster<std::uint8_t>(rows, cols, unitTransform(rows), "");
  mask.cells.data().setZero();
  for (const auto& [r, c] : cells) mask.cells(r, c) = 1;
  mask.count = cells.size();
  return mask;
}

std::array<double, 4> ringBounds(const Ring& ring) {
  std::array<double, 4> b{1e300, 1e300, -1e300, -1e300};
  for (const auto& p : ring) {
    b[0] = std::min(b[0], p.x);
    b[1] = std::min(b[1], p.y);
    b[2] = std::max(b[2], p.x);
    b[3] = std::max(b[3], p.y);
  }
  return b;
}

}  // namespace

// ─── Snapping ────────────────────────────────────────────────────────────────

TEST(SnapToChannelTest, PointOnChannelIsUnchanged) {
  auto acc = emptyAccumulation(5, 5);
  acc(2, 2) = 5;
  const Point2 p{2.3, 2.7};
  auto snapped = snapToChannel(p, acc);
  ASSERT_TRUE(snapped.has_value());
  EXPECT_EQ(*snapped, p);
}

TEST(SnapToChannelTest, MovesToNearestChannelCentre) {
  auto acc = emptyAccumulation(5, 5);
  acc(2, 2) = 3;
  acc(0, 4) = 40;
  auto snapped = snapToChannel({0.5, 2.5}, acc);
  ASSERT_TRUE(snapped.has_value());
  EXPECT_EQ(*snapped, (Point2{2.5, 2.5}));
}

TEST(SnapToChannelTest, TiesPreferLowerRow) {
  auto acc = emptyAccumulation(5, 5);
  acc(1, 2) = 1;
  acc(3, 2) = 1;
  auto snapped = snapToChannel({2.5, 2.5}, acc);
  ASSERT_TRUE(snapped.has_value());
  EXPECT_EQ(*snapped, (Point2{2.5, 3.5}));
}

TEST(SnapToChannelTest, RadiusLimitsSearch) {
  auto acc = emptyAccumulation(5, 5);
  acc(0, 4) = 1;
  EXPECT_FALSE(snapToChannel({0.5, 0.5}, acc, 2).has_value());
  EXPECT_TRUE(snapToChannel({0.5, 0.5}, acc, 0).has_value());
}

TEST(SnapToChannelTest, OffGridPointSnapsOntoGrid) {
  auto acc = emptyAccumulation(5, 5);
  acc(2, 0) = 7;
  auto snapped = snapToChannel({-3.0, 2.5}, acc);
  ASSERT_TRUE(snapped.has_value());
  EXPECT_EQ(*snapped, (Point2{0.5, 2.5}));
}

TEST(SnapToChannelTest, NoChannelAnywhere) {
  EXPECT_FALSE(snapToChannel({1.5, 1.5}, emptyAccumulation(4, 4)).has_value());
}

// ─── Upstream Tracing ────────────────────────────────────────────────────────

TEST(TraceCatchmentTest, EastwardPlaneCollectsRow) {
  auto dirs = uniformDirections(4, 4, 1);
  auto mask = traceCatchment(dirs, {3.5, 2.5});  // cell (1, 3)
  EXPECT_EQ(mask.count, 4u);
  for (int c = 0; c < 4; ++c) EXPECT_EQ(mask.cells(1, c), 1);
  EXPECT_EQ(mask.cells(0, 3), 0);
}

TEST(TraceCatchmentTest, HeadCellContainsOnlyItself) {
  auto dirs = uniformDirections(4, 4, 1);
  auto mask = traceCatchment(dirs, {0.5, 0.5});  // cell (3, 0)
  EXPECT_EQ(mask.count, 1u);
}

TEST(TraceCatchmentTest, OffGridOrNoDataIsEmpty) {
  auto dirs = uniformDirections(4, 4, 1);
  dirs(0, 0) = d8::kNoData;
  EXPECT_TRUE(traceCatchment(dirs, {10.0, 10.0}).empty());
  EXPECT_TRUE(traceCatchment(dirs, {0.5, 3.5}).empty());
}

TEST(TraceCatchmentTest, Deterministic) {
  auto dirs = uniformDirections(6, 6, 4);  // S
  auto a = traceCatchment(dirs, {2.5, 0.5});
  auto b = traceCatchment(dirs, {2.5, 0.5});
  EXPECT_EQ(a.count, b.count);
  EXPECT_EQ(a.cells.data(), b.cells.data());
}

// ─── Polygonization ──────────────────────────────────────────────────────────

TEST(PolygonizeTest, ContiguousCellsMergeIntoOnePolygon) {
  auto polygons = polygonize(maskOf(4, 4, {{1, 0}, {1, 1}, {1, 2}, {1, 3}}));
  ASSERT_EQ(polygons.size(), 1u);
  const auto b = ringBounds(polygons[0].exterior);
  EXPECT_DOUBLE_EQ(b[0], 0.0);
  EXPECT_DOUBLE_EQ(b[1], 2.0);
  EXPECT_DOUBLE_EQ(b[2], 4.0);
  EXPECT_DOUBLE_EQ(b[3], 3.0);
}

TEST(PolygonizeTest, DisjointGroupsBecomeSeparateParts) {
  auto polygons = polygonize(maskOf(5, 5, {{0, 0}, {3, 3}, {3, 4}}));
  EXPECT_EQ(polygons.size(), 2u);
}

TEST(PolygonizeTest, DiagonalNeighboursDependOnConnectivity) {
  const auto mask = maskOf(3, 3, {{0, 0}, {1, 1}});
  EXPECT_EQ(polygonize(mask, false).size(), 2u);
  EXPECT_EQ(polygonize(mask, true).size(), 1u);
}

TEST(PolygonizeTest, EnclosedGapBecomesHole) {
  auto polygons = polygonize(maskOf(
      3, 3, {{0, 0}, {0, 1}, {0, 2}, {1, 0}, {1, 2}, {2, 0}, {2, 1}, {2, 2}}));
  ASSERT_EQ(polygons.size(), 1u);
  EXPECT_EQ(polygons[0].holes.size(), 1u);
}

TEST(PolygonizeTest, EmptyMaskHasNoPolygons) {
  EXPECT_TRUE(polygonize(maskOf(3, 3, {})).empty());
}

// ─── Catchment Delineator ────────────────────────────────────────────────────

class CatchmentDelineatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // V-shaped valley draining south along column 10
    ElevationRaster dem(30, 21, unitTransform(30), "",
                        std::optional<float>(NAN));
    for (int r = 0; r < 30; ++r)
      for (int c = 0; c < 21; ++c)
        dem(r, c) = 100.0f - 0.5f * r + static_cast<float>(std::abs(c - 10));
    dirs_ = flowDirection(resolveFlats(fillDepressions(std::move(dem))));
    acc_ = flowAccumulation(dirs_);

    path_ = testing::TempDir() + "delineation_sub_catchments.gpkg";
    std::filesystem::remove(path_);
  }

  void TearDown() override { std::filesystem::remove(path_); }

  FlowDirectionRaster dirs_;
  AccumulationRaster acc_;
  std::string path_;
};

TEST_F(CatchmentDelineatorTest, SkipsPointWithoutCellsAndKeepsOthers) {
  config::Delineation cfg;
  cfg.snap_radius = 3;
  CatchmentDelineator delineator(cfg, path_);

  std::vector<PourPoint> points = {
      {{10.5, 19.5}, PointType::Terminus},  // channel head, cell (10, 10)
      {{500.0, 500.0}, PointType::Terminus},  // far outside the grid
      {{10.5, 0.5}, PointType::Junction}};    // outlet

  auto result = delineator.run(points, dirs_, acc_, "");
  EXPECT_EQ(result.delineated_points, 2u);
  EXPECT_EQ(result.skipped_points, 1u);
  EXPECT_EQ(result.polygons.size(), 2u);
  ASSERT_TRUE(result.output_path.has_value());
  EXPECT_TRUE(std::filesystem::exists(path_));
}

TEST_F(CatchmentDelineatorTest, IdenticalCatchmentsAreAllKept) {
  CatchmentDelineator delineator(config::Delineation{}, path_);
  std::vector<PourPoint> points = {{{10.5, 0.5}, PointType::Junction},
                                   {{10.5, 0.5}, PointType::Junction}};
  auto result = delineator.run(points, dirs_, acc_, "");
  ASSERT_EQ(result.polygons.size(), 2u);
  EXPECT_EQ(result.polygons[0].exterior, result.polygons[1].exterior);
}

TEST_F(CatchmentDelineatorTest, NothingWrittenWhenAllPointsSkipped) {
  config::Delineation cfg;
  cfg.snap_radius = 2;
  CatchmentDelineator delineator(cfg, path_);
  const std::vector<PourPoint> points = {
      PourPoint{{-400.0, -400.0}, PointType::Terminus}};
  auto result = delineator.run(points, dirs_, acc_, "");
  EXPECT_TRUE(result.polygons.empty());
  EXPECT_EQ(result.skipped_points, 1u);
  EXPECT_FALSE(result.output_path.has_value());
  EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(CatchmentDelineatorTest, RepeatedRunsAreIdentical) {
  CatchmentDelineator delineator(config::Delineation{}, path_);
  std::vector<PourPoint> points = {{{10.5, 19.5}, PointType::Terminus},
                                   {{3.2, 12.9}, PointType::Terminus}};
  auto a = delineator.run(points, dirs_, acc_, "");
  auto b = delineator.run(points, dirs_, acc_, "");
  ASSERT_EQ(a.polygons.size(), b.polygons.size());
  for (std::size_t i = 0; i < a.polygons.size(); ++i) {
    EXPECT_EQ(a.polygons[i].exterior, b.polygons[i].exterior);
  }
}

TEST_F(CatchmentDelineatorTest, MismatchedGridsThrow) {
  CatchmentDelineator delineator(config::Delineation{}, path_);
  AccumulationRaster other(3, 3, unitTransform(3), "");
  other.data().setZero();
  const std::vector<PourPoint> points;
  EXPECT_THROW(delineator.run(points, dirs_, other, ""),
               std::invalid_argument);
}
