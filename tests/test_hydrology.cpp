// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_hydrology.cpp
 *
 * Tests for depression filling, flat resolution, D8 routing, accumulation
 * and stream extraction.
 */

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <functional>

#include "hydrodem/hydrology/conditioning.hpp"
#include "hydrodem/hydrology/flow_routing.hpp"
#include "hydrodem/hydrology/hydrology_engine.hpp"
#include "hydrodem/hydrology/stream_extraction.hpp"

using namespace hydrodem;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Unit cells, north-up, origin at the top-left corner (0, rows).
GeoTransform unitTransform(int rows) {
  GeoTransform gt;
  gt.origin_x = 0.0;
  gt.pixel_width = 1.0;
  gt.origin_y = rows;
  gt.pixel_height = -1.0;
  return gt;
}

ElevationRaster makeDem(int rows, int cols,
                        const std::function<float(int, int)>& z) {
  ElevationRaster dem(rows, cols, unitTransform(rows), "",
                      std::optional<float>(NAN));
  for (int r = 0; r < rows; ++r)
    for (int c = 0; c < cols; ++c) dem(r, c) = z(r, c);
  return dem;
}

/// V-shaped valley draining south along column 10.
ElevationRaster valleyDem() {
  return makeDem(30, 21, [](int r, int c) {
    return 100.0f - 0.5f * r + static_cast<float>(std::abs(c - 10));
  });
}

FlowDirectionRaster conditionAndRoute(ElevationRaster dem) {
  return flowDirection(resolveFlats(fillDepressions(std::move(dem))));
}

}  // namespace

// ─── Depression Filling ──────────────────────────────────────────────────────

TEST(FillDepressionsTest, RaisesSingleCellPit) {
  auto dem = makeDem(5, 5, [](int r, int c) {
    return (r == 2 && c == 2) ? 5.0f : 10.0f;
  });
  auto filled = fillDepressions(dem);
  EXPECT_FLOAT_EQ(filled(2, 2), 10.0f);
  EXPECT_FLOAT_EQ(filled(0, 0), 10.0f);
}

TEST(FillDepressionsTest, RaisesPitToSpillElevation) {
  // Rim of 10 with a notch of 8 on the east side
  auto dem = makeDem(5, 5, [](int r, int c) {
    if (r == 2 && c == 4) return 8.0f;
    if (r >= 1 && r <= 3 && c >= 1 && c <= 3) return 3.0f;
    return 10.0f;
  });
  auto filled = fillDepressions(dem);
  for (int r = 1; r <= 3; ++r)
    for (int c = 1; c <= 3; ++c) EXPECT_FLOAT_EQ(filled(r, c), 8.0f);
  EXPECT_FLOAT_EQ(filled(0, 2), 10.0f);
}

TEST(FillDepressionsTest, LeavesDrainingSurfaceUnchanged) {
  auto dem = valleyDem();
  auto filled = fillDepressions(dem);
  EXPECT_TRUE(filled.data().isApprox(dem.data()));
}

TEST(FillDepressionsTest, NoDataActsAsOutlet) {
  auto dem = makeDem(5, 5, [](int r, int c) {
    if (r == 2 && c == 3) return NAN;
    return (r == 2 && c == 2) ? 5.0f : 10.0f;
  });
  auto filled = fillDepressions(dem);
  EXPECT_FLOAT_EQ(filled(2, 2), 5.0f);
  EXPECT_TRUE(std::isnan(filled(2, 3)));
}

// ─── Flow Direction ──────────────────────────────────────────────────────────

TEST(FlowDirectionTest, EastDippingPlaneFlowsEast) {
  auto dem = makeDem(4, 5, [](int, int c) { return 10.0f - c; });
  auto dirs = flowDirection(dem);
  for (int r = 0; r < 4; ++r)
    for (int c = 0; c < 5; ++c) EXPECT_EQ(dirs(r, c), 1) << r << "," << c;
}

TEST(FlowDirectionTest, DiagonalDistanceIsLonger) {
  // Drop of 1.2 to the south-east (slope 0.85) loses to 1.0 east
  ElevationRaster dem = makeDem(3, 3, [](int, int) { return 10.0f; });
  dem(1, 2) = 9.0f;
  dem(2, 2) = 8.8f;
  auto dirs = flowDirection(dem);
  EXPECT_EQ(dirs(1, 1), 1);
}

TEST(FlowDirectionTest, NoDataCellsAreMarked) {
  auto dem = makeDem(3, 3, [](int r, int c) {
    return (r == 1 && c == 1) ? NAN : 10.0f;
  });
  auto dirs = flowDirection(dem);
  EXPECT_EQ(dirs(1, 1), d8::kNoData);
  EXPECT_NE(dirs(0, 0), d8::kNoFlow);
}

TEST(FlowDirectionTest, ValleyConvergesOnCentreColumn) {
  auto dirs = flowDirection(valleyDem());
  EXPECT_EQ(dirs(5, 10), 4);  // S
  EXPECT_EQ(dirs(5, 3), 2);   // SE
  EXPECT_EQ(dirs(5, 17), 8);  // SW
}

// ─── Flat Resolution ─────────────────────────────────────────────────────────

TEST(ResolveFlatsTest, PerfectlyLevelGridDrainsEverywhere) {
  auto dem = makeDem(5, 5, [](int, int) { return 10.0f; });
  auto surface = resolveFlats(fillDepressions(dem));

  // Gradient towards the border
  EXPECT_GT(surface(2, 2), surface(2, 1));
  EXPECT_GT(surface(2, 1), surface(2, 0));
  EXPECT_LT(surface(2, 2) - 10.0, 1.0);

  auto dirs = flowDirection(surface);
  for (int r = 0; r < 5; ++r)
    for (int c = 0; c < 5; ++c) EXPECT_NE(dirs(r, c), d8::kNoFlow);
}

TEST(ResolveFlatsTest, FilledPitStaysBelowRim) {
  auto dem = makeDem(7, 7, [](int r, int c) {
    if (r == 3 && c == 6) return 8.0f;
    if (r >= 1 && r <= 5 && c >= 1 && c <= 5) return 3.0f;
    return 10.0f;
  });
  auto surface = resolveFlats(fillDepressions(dem));
  for (int r = 1; r <= 5; ++r) {
    for (int c = 1; c <= 5; ++c) {
      EXPECT_GE(surface(r, c), 8.0);
      EXPECT_LT(surface(r, c), 10.0);
    }
  }

  // Every flat cell drains and the flat empties through the notch
  auto dirs = flowDirection(surface);
  auto acc = flowAccumulation(dirs);
  EXPECT_GE(acc(3, 6), 25u);
}

TEST(ResolveFlatsTest, AllCellsReachAnOutlet) {
  // Pseudo-random terrain with many pits and flats
  auto dem = makeDem(20, 20, [](int r, int c) {
    return static_cast<float>((r * 37 + c * 91 + r * c * 7) % 17);
  });
  auto dirs = conditionAndRoute(dem);

  std::uint64_t drained = 0;
  auto acc = flowAccumulation(dirs);
  for (int r = 0; r < 20; ++r) {
    for (int c = 0; c < 20; ++c) {
      EXPECT_NE(dirs(r, c), d8::kNoFlow) << r << "," << c;
      if (!downstreamCell(dirs, r, c)) drained += acc(r, c) + 1;
    }
  }
  EXPECT_EQ(drained, 400u);
}

// ─── Flow Accumulation ───────────────────────────────────────────────────────

TEST(FlowAccumulationTest, ChainCountsUpstreamCells) {
  auto dem = makeDem(3, 6, [](int, int c) { return 10.0f - c; });
  auto acc = flowAccumulation(flowDirection(dem));
  EXPECT_EQ(acc(1, 0), 0u);
  EXPECT_EQ(acc(1, 3), 3u);
  EXPECT_EQ(acc(1, 5), 5u);
}

TEST(FlowAccumulationTest, ValleyOutletCollectsEveryCell) {
  auto acc = flowAccumulation(conditionAndRoute(valleyDem()));
  EXPECT_EQ(acc(29, 10), 30u * 21u - 1u);
  EXPECT_EQ(acc.data().maxCoeff(), 629u);
}

TEST(FlowAccumulationTest, CycleThrows) {
  FlowDirectionRaster dirs(1, 2, unitTransform(1), "", d8::kNoData);
  dirs(0, 0) = 1;   // E
  dirs(0, 1) = 16;  // W
  EXPECT_THROW(flowAccumulation(dirs), std::runtime_error);
}

// ─── Stream Extraction ───────────────────────────────────────────────────────

class StreamExtractionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Two heads at the top corners meeting at (2, 2), then south off-grid
    dirs_ = FlowDirectionRaster(5, 5, unitTransform(5), "", d8::kNoData);
    dirs_.data().setConstant(d8::kNoFlow);
    acc_ = AccumulationRaster::sameGridAs(dirs_, 0u);

    const int chain[][3] = {{0, 0, 2}, {1, 1, 2}, {0, 4, 8}, {1, 3, 8},
                            {2, 2, 4}, {3, 2, 4}, {4, 2, 4}};
    for (const auto& cell : chain) {
      dirs_(cell[0], cell[1]) = static_cast<std::uint8_t>(cell[2]);
      acc_(cell[0], cell[1]) = 10;
    }
  }

  FlowDirectionRaster dirs_;
  AccumulationRaster acc_;
};

TEST_F(StreamExtractionTest, SplitsReachesAtJunction) {
  auto lines = extractStreams(dirs_, acc_, 5);
  ASSERT_EQ(lines.size(), 3u);

  const LineString west = {{0.5, 4.5}, {1.5, 3.5}, {2.5, 2.5}};
  const LineString east = {{4.5, 4.5}, {3.5, 3.5}, {2.5, 2.5}};
  const LineString trunk = {{2.5, 2.5}, {2.5, 1.5}, {2.5, 0.5}};
  EXPECT_EQ(lines[0], west);
  EXPECT_EQ(lines[1], east);
  EXPECT_EQ(lines[2], trunk);
}

TEST_F(StreamExtractionTest, ThresholdIsStrict) {
  EXPECT_TRUE(extractStreams(dirs_, acc_, 10).empty());
  EXPECT_EQ(extractStreams(dirs_, acc_, 9).size(), 3u);
}

TEST_F(StreamExtractionTest, MismatchedGridsThrow) {
  AccumulationRaster other(4, 4, unitTransform(4), "");
  other.data().setZero();
  EXPECT_THROW(extractStreams(dirs_, other, 5), std::invalid_argument);
}

// ─── Hydrology Engine ────────────────────────────────────────────────────────

class HydrologyEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = testing::TempDir() + "hydrology_engine_test";
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
    paths_.flow_direction = dir_ + "/flow_direction_d8.tif";
    paths_.flow_accumulation = dir_ + "/flow_accumulation.tif";
    paths_.stream_network = dir_ + "/stream_network.gpkg";
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::string dir_;
  HydrologyPaths paths_;
};

TEST_F(HydrologyEngineTest, ValleyProducesSingleReach) {
  config::Hydrology cfg;
  cfg.stream_threshold = 100;
  HydrologyEngine engine(cfg, paths_);

  auto result = engine.run(valleyDem());

  EXPECT_TRUE(std::filesystem::exists(paths_.flow_direction));
  EXPECT_TRUE(std::filesystem::exists(paths_.flow_accumulation));
  ASSERT_TRUE(result.stream_network_path.has_value());
  EXPECT_TRUE(std::filesystem::exists(*result.stream_network_path));

  ASSERT_EQ(result.streams.size(), 1u);
  const auto& reach = result.streams.front();
  for (const auto& p : reach) EXPECT_DOUBLE_EQ(p.x, 10.5);
  EXPECT_GT(reach.front().y, reach.back().y);
  EXPECT_DOUBLE_EQ(reach.back().y, 0.5);
}

TEST_F(HydrologyEngineTest, HighThresholdYieldsNoNetwork) {
  config::Hydrology cfg;
  cfg.stream_threshold = 100000;
  HydrologyEngine engine(cfg, paths_);

  auto result = engine.run(valleyDem());

  EXPECT_TRUE(result.streams.empty());
  EXPECT_FALSE(result.stream_network_path.has_value());
  EXPECT_FALSE(std::filesystem::exists(paths_.stream_network));
  EXPECT_TRUE(std::filesystem::exists(paths_.flow_direction));
  EXPECT_TRUE(std::filesystem::exists(paths_.flow_accumulation));
}

TEST_F(HydrologyEngineTest, MissingDemThrows) {
  HydrologyEngine engine(config::Hydrology{}, paths_);
  EXPECT_THROW(engine.run(std::string("/nonexistent/dem.tif")),
               std::runtime_error);
}
