// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * workflow.hpp
 *
 * End-to-end hydrologic analysis for one bounding box.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_WORKFLOW_HPP
#define HYDRODEM_WORKFLOW_HPP

#include <optional>
#include <string>
#include <vector>

#include "hydrodem/acquisition/tile_source.hpp"
#include "hydrodem/config/hydrodem.hpp"

namespace hydrodem {

enum class WorkflowState {
  Acquiring,
  Hydrology,
  Topology,
  Delineation,
  Done,
  Halted  ///< Acquisition produced no raster
};

const char* toString(WorkflowState state);

/// Absolute output locations derived from the configuration.
struct WorkflowPaths {
  std::string project_dir;
  std::string tile_dir;
  std::string merged_dem;
  std::string hydrology_dir;
  std::string flow_direction;
  std::string flow_accumulation;
  std::string stream_network;
  std::string pour_points;
  std::string sub_catchments;

  static WorkflowPaths fromConfig(const Config& cfg);
};

/// What a run did and where its products are.
struct WorkflowReport {
  WorkflowState state = WorkflowState::Acquiring;
  std::vector<WorkflowState> transitions;  ///< Every state entered, in order

  std::optional<std::string> dem_path;
  std::optional<std::string> stream_network_path;
  std::optional<std::string> pour_points_path;
  std::optional<std::string> sub_catchments_path;

  std::size_t tile_count = 0;
  std::size_t stream_count = 0;
  std::size_t pour_point_count = 0;
  std::size_t catchment_count = 0;

  std::optional<std::string> error;  ///< Unexpected failure, if any

  bool visited(WorkflowState s) const;
};

/**
 * @brief Acquisition → hydrology → topology → delineation.
 *
 * A run never throws: acquisition failures end in Halted, empty
 * intermediate results end early in Done, and unexpected exceptions are
 * logged and recorded in the report. The project directory is owned by
 * the workflow for the duration of a run.
 *
 * Typical usage:
 * @code
 *   auto cfg = hydrodem::loadConfig("config/default.yaml");
 *   hydrodem::Workflow workflow(cfg);
 *   auto report = workflow.run();
 * @endcode
 */
class Workflow {
 public:
  /// Construct with the tile source named in the configuration
  explicit Workflow(Config cfg);

  /// Construct with an explicit tile source
  Workflow(Config cfg, TileSource::Ptr source);

  // Non-copyable
  Workflow(const Workflow&) = delete;
  Workflow& operator=(const Workflow&) = delete;

  /// Run for the configured bounding box
  WorkflowReport run() const;

  /// Run for another bounding box with the same settings
  WorkflowReport run(const BoundingBox& bbox) const;

  const Config& config() const { return cfg_; }
  const WorkflowPaths& paths() const { return paths_; }

 private:
  Config cfg_;
  TileSource::Ptr source_;
  WorkflowPaths paths_;
};

}  // namespace hydrodem

#endif  // HYDRODEM_WORKFLOW_HPP
