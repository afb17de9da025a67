// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_workflow.cpp
 *
 * End-to-end runs of the state machine on a synthetic valley.
 */

#include <gtest/gtest.h>

#include <cpl_conv.h>
#include <ogr_spatialref.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "hydrodem/hydrodem.hpp"
#include "hydrodem/io/raster.hpp"

using namespace hydrodem;
namespace fs = std::filesystem;

namespace {

std::string utm15nWkt() {
  OGRSpatialReference srs;
  srs.importFromEPSG(32615);
  char* wkt = nullptr;
  srs.exportToWkt(&wkt);
  std::string out = wkt ? wkt : "";
  CPLFree(wkt);
  return out;
}

/// 30 x 21 V-shaped valley at 30 m draining south along column 10
void writeValleyDem(const std::string& path) {
  GeoTransform gt;
  gt.origin_x = 500000.0;
  gt.pixel_width = 30.0;
  gt.origin_y = 3400000.0;
  gt.pixel_height = -30.0;
  ElevationRaster dem(30, 21, gt, utm15nWkt(), -9999.0f);
  for (int r = 0; r < 30; ++r)
    for (int c = 0; c < 21; ++c)
      dem(r, c) = 100.0f - 0.5f * r + static_cast<float>(std::abs(c - 10));
  ASSERT_TRUE(io::writeGeoTiff(path, dem, io::CellType::Float32));
}

class StaticSource : public TileSource {
 public:
  explicit StaticSource(std::vector<std::string> tiles)
      : tiles_(std::move(tiles)) {}

  std::vector<std::string> fetch(const BoundingBox&, int,
                                 const std::string&) override {
    ++calls;
    return tiles_;
  }
  std::string name() const override { return "static"; }

  int calls = 0;

 private:
  std::vector<std::string> tiles_;
};

class ThrowingSource : public TileSource {
 public:
  std::vector<std::string> fetch(const BoundingBox&, int,
                                 const std::string&) override {
    throw std::runtime_error("service unavailable");
  }
  std::string name() const override { return "throwing"; }
};

}  // namespace

class WorkflowTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::path(testing::TempDir()) / "hydrodem_workflow";
    fs::remove_all(root_);
    fs::create_directories(root_);
    dem_path_ = (root_ / "valley.tif").string();
    writeValleyDem(dem_path_);

    cfg_.project_dir = (root_ / "project").string();
    cfg_.hydrology.stream_threshold = 100;
  }

  void TearDown() override { fs::remove_all(root_); }

  fs::path root_;
  std::string dem_path_;
  Config cfg_;
};

// ─── Halting ─────────────────────────────────────────────────────────────────

TEST_F(WorkflowTest, NoCoverageHalts) {
  auto source = std::make_shared<StaticSource>(std::vector<std::string>{});
  Workflow workflow(cfg_, source);
  auto report = workflow.run();

  EXPECT_EQ(report.state, WorkflowState::Halted);
  EXPECT_EQ(report.transitions, (std::vector<WorkflowState>{
                                    WorkflowState::Acquiring,
                                    WorkflowState::Halted}));
  EXPECT_FALSE(report.error.has_value());
  EXPECT_FALSE(report.dem_path.has_value());
  EXPECT_FALSE(fs::exists(workflow.paths().flow_direction));
  EXPECT_FALSE(fs::exists(workflow.paths().flow_accumulation));
}

TEST_F(WorkflowTest, FailingSourceHalts) {
  Workflow workflow(cfg_, std::make_shared<ThrowingSource>());
  auto report = workflow.run();
  EXPECT_EQ(report.state, WorkflowState::Halted);
  EXPECT_FALSE(report.visited(WorkflowState::Hydrology));
}

TEST_F(WorkflowTest, InvalidBoundingBoxHalts) {
  auto source = std::make_shared<StaticSource>(
      std::vector<std::string>{dem_path_});
  Workflow workflow(cfg_, source);
  auto report = workflow.run({-89.0, 30.0, -90.0, 31.0});

  EXPECT_EQ(report.state, WorkflowState::Halted);
  ASSERT_TRUE(report.error.has_value());
  EXPECT_NE(report.error->find("bounding box"), std::string::npos);
  EXPECT_EQ(source->calls, 0);
}

// ─── Complete Runs ───────────────────────────────────────────────────────────

TEST_F(WorkflowTest, ValleyRunProducesAllOutputs) {
  auto source = std::make_shared<StaticSource>(
      std::vector<std::string>{dem_path_});
  Workflow workflow(cfg_, source);
  auto report = workflow.run();

  EXPECT_EQ(report.state, WorkflowState::Done);
  EXPECT_EQ(report.transitions,
            (std::vector<WorkflowState>{
                WorkflowState::Acquiring, WorkflowState::Hydrology,
                WorkflowState::Topology, WorkflowState::Delineation,
                WorkflowState::Done}));
  EXPECT_FALSE(report.error.has_value());

  ASSERT_TRUE(report.dem_path.has_value());
  EXPECT_EQ(*report.dem_path, dem_path_);
  EXPECT_EQ(report.tile_count, 1u);
  EXPECT_EQ(report.stream_count, 1u);
  EXPECT_EQ(report.pour_point_count, 1u);  // the channel head
  EXPECT_EQ(report.catchment_count, 1u);

  const auto& paths = workflow.paths();
  EXPECT_TRUE(fs::exists(paths.flow_direction));
  EXPECT_TRUE(fs::exists(paths.flow_accumulation));
  EXPECT_TRUE(fs::exists(paths.stream_network));
  EXPECT_TRUE(fs::exists(paths.pour_points));
  EXPECT_TRUE(fs::exists(paths.sub_catchments));
  ASSERT_TRUE(report.sub_catchments_path.has_value());
  EXPECT_EQ(*report.sub_catchments_path, paths.sub_catchments);

  auto dirs = io::readRasterInfo(paths.flow_direction);
  ASSERT_TRUE(dirs.has_value());
  EXPECT_EQ(dirs->rows, 30);
  EXPECT_EQ(dirs->cols, 21);
}

TEST_F(WorkflowTest, HighThresholdEndsWithoutStreams) {
  cfg_.hydrology.stream_threshold = 100000;
  auto source = std::make_shared<StaticSource>(
      std::vector<std::string>{dem_path_});
  Workflow workflow(cfg_, source);
  auto report = workflow.run();

  EXPECT_EQ(report.state, WorkflowState::Done);
  EXPECT_TRUE(report.visited(WorkflowState::Topology));
  EXPECT_FALSE(report.visited(WorkflowState::Delineation));
  EXPECT_FALSE(report.error.has_value());
  EXPECT_EQ(report.stream_count, 0u);
  EXPECT_FALSE(report.stream_network_path.has_value());

  const auto& paths = workflow.paths();
  EXPECT_TRUE(fs::exists(paths.flow_direction));
  EXPECT_TRUE(fs::exists(paths.flow_accumulation));
  EXPECT_FALSE(fs::exists(paths.stream_network));
  EXPECT_FALSE(fs::exists(paths.pour_points));
  EXPECT_FALSE(fs::exists(paths.sub_catchments));
}

TEST_F(WorkflowTest, UnreadableDemEndsDoneWithError) {
  const auto bogus = (root_ / "bogus.tif").string();
  std::ofstream(bogus) << "not a raster";
  Workflow workflow(cfg_, std::make_shared<StaticSource>(
                              std::vector<std::string>{bogus}));
  auto report = workflow.run();

  EXPECT_EQ(report.state, WorkflowState::Done);
  EXPECT_TRUE(report.visited(WorkflowState::Hydrology));
  EXPECT_TRUE(report.error.has_value());
}

// ─── Construction ────────────────────────────────────────────────────────────

TEST_F(WorkflowTest, PathsFollowConfiguration) {
  cfg_.outputs.hydrology_dir = "out";
  cfg_.outputs.pour_points = "pp.gpkg";
  const auto paths = WorkflowPaths::fromConfig(cfg_);
  const fs::path project(cfg_.project_dir);
  EXPECT_EQ(paths.tile_dir, (project / "input_dem").string());
  EXPECT_EQ(paths.merged_dem,
            (project / "input_dem" / "dem_merged.tif").string());
  EXPECT_EQ(paths.pour_points, (project / "out" / "pp.gpkg").string());
  EXPECT_EQ(paths.flow_direction,
            (project / "out" / "flow_direction_d8.tif").string());
}

TEST_F(WorkflowTest, NullSourceIsRejected) {
  EXPECT_THROW({ Workflow workflow(cfg_, nullptr); }, std::invalid_argument);
}

TEST(WorkflowStateTest, Names) {
  EXPECT_STREQ(toString(WorkflowState::Acquiring), "ACQUIRING");
  EXPECT_STREQ(toString(WorkflowState::Delineation), "DELINEATION");
  EXPECT_STREQ(toString(WorkflowState::Halted), "HALTED");
}
