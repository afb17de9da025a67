// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * workflow.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/workflow.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>

#include "hydrodem/acquisition/acquisition.hpp"
#include "hydrodem/common/stage_timer.hpp"
#include "hydrodem/delineation/catchment_delineator.hpp"
#include "hydrodem/hydrology/hydrology_engine.hpp"
#include "hydrodem/topology/pour_points.hpp"

namespace fs = std::filesystem;

namespace hydrodem {

const char* toString(WorkflowState state) {
  switch (state) {
    case WorkflowState::Acquiring:
      return "ACQUIRING";
    case WorkflowState::Hydrology:
      return "HYDROLOGY";
    case WorkflowState::Topology:
      return "TOPOLOGY";
    case WorkflowState::Delineation:
      return "DELINEATION";
    case WorkflowState::Done:
      return "DONE";
    case WorkflowState::Halted:
      return "HALTED";
  }
  return "UNKNOWN";
}

WorkflowPaths WorkflowPaths::fromConfig(const Config& cfg) {
  const fs::path root(cfg.project_dir);
  const fs::path hydro = root / cfg.outputs.hydrology_dir;
  const auto& o = cfg.outputs;

  WorkflowPaths p;
  p.project_dir = root.string();
  p.tile_dir = (root / o.input_dem_dir).string();
  p.merged_dem = (root / o.input_dem_dir / o.merged_dem).string();
  p.hydrology_dir = hydro.string();
  p.flow_direction = (hydro / o.flow_direction).string();
  p.flow_accumulation = (hydro / o.flow_accumulation).string();
  p.stream_network = (hydro / o.stream_network).string();
  p.pour_points = (hydro / o.pour_points).string();
  p.sub_catchments = (hydro / o.sub_catchments).string();
  return p;
}

bool WorkflowReport::visited(WorkflowState s) const {
  return std::find(transitions.begin(), transitions.end(), s) !=
         transitions.end();
}

Workflow::Workflow(Config cfg)
    : Workflow(cfg, createTileSource(cfg.acquisition)) {}

Workflow::Workflow(Config cfg, TileSource::Ptr source)
    : cfg_(std::move(cfg)),
      source_(std::move(source)),
      paths_(WorkflowPaths::fromConfig(cfg_)) {
  if (!source_) throw std::invalid_argument("Workflow: tile source is null");
}

WorkflowReport Workflow::run() const { return run(cfg_.bbox); }

WorkflowReport Workflow::run(const BoundingBox& bbox) const {
  WorkflowReport report;
  auto enter = [&report](WorkflowState s) {
    report.state = s;
    report.transitions.push_back(s);
    spdlog::info("[Workflow] State: {}", toString(s));
  };

  spdlog::info("[Workflow] Starting hydrologic analysis in {}",
               paths_.project_dir);
  try {
    enter(WorkflowState::Acquiring);
    if (auto reason = bbox.validate(); !reason.empty()) {
      throw std::invalid_argument("invalid bounding box: " + reason);
    }
    fs::create_directories(paths_.project_dir);
    fs::create_directories(paths_.hydrology_dir);

    AcquisitionResult acquisition;
    {
      StageTimer timer("Acquisition");
      acquisition = acquireElevation(*source_, bbox, cfg_.acquisition.resolution,
                                     paths_.tile_dir, paths_.merged_dem);
    }

    const auto* acquired = std::get_if<Acquired>(&acquisition);
    if (!acquired) {
      if (const auto* failure = std::get_if<TransientFailure>(&acquisition)) {
        spdlog::error("[Workflow] DEM acquisition failed ({}), halting",
                      failure->reason);
      } else {
        spdlog::error("[Workflow] No elevation coverage for the box, halting");
      }
      enter(WorkflowState::Halted);
    } else {
      report.dem_path = acquired->path;
      report.tile_count = acquired->tile_count;

      // Hydrology
      enter(WorkflowState::Hydrology);
      HydrologyEngine engine(
          cfg_.hydrology,
          {paths_.flow_direction, paths_.flow_accumulation,
           paths_.stream_network});
      HydrologyResult hydrology;
      {
        StageTimer timer("Hydrology");
        hydrology = engine.run(acquired->path);
      }
      report.stream_network_path = hydrology.stream_network_path;
      report.stream_count = hydrology.streams.size();

      // Topology (no-op on an empty network)
      enter(WorkflowState::Topology);
      TopologyAnalyzer topology(paths_.pour_points);
      std::vector<PourPoint> points;
      {
        StageTimer timer("Topology");
        points = topology.run(hydrology.streams, hydrology.crs);
      }
      report.pour_point_count = points.size();

      if (points.empty()) {
        spdlog::warn("[Workflow] No pour points, skipping delineation");
        enter(WorkflowState::Done);
      } else {
        report.pour_points_path = topology.outputPath();

        enter(WorkflowState::Delineation);
        CatchmentDelineator delineator(cfg_.delineation, paths_.sub_catchments);
        DelineationResult catchments;
        {
          StageTimer timer("Delineation");
          catchments = delineator.run(points, hydrology.flow_direction,
                                      hydrology.accumulation, hydrology.crs);
        }
        report.sub_catchments_path = catchments.output_path;
        report.catchment_count = catchments.polygons.size();
        enter(WorkflowState::Done);
      }
    }
  } catch (const std::exception& e) {
    spdlog::error("[Workflow] Unexpected error during {}: {}",
                  toString(report.state), e.what());
    report.error = e.what();
    enter(report.state == WorkflowState::Acquiring ? WorkflowState::Halted
                                                   : WorkflowState::Done);
  }

  spdlog::info("[Workflow] Hydrologic analysis workflow has finished ({})",
               toString(report.state));
  return report;
}

}  // namespace hydrodem
