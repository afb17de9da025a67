// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * outputs.hpp
 *
 * Output file layout under the project directory, and log settings.
 */

#ifndef HYDRODEM_CONFIG_OUTPUTS_HPP
#define HYDRODEM_CONFIG_OUTPUTS_HPP

#include <string>

namespace hydrodem::config {

/// File names relative to the project directory.
struct Outputs {
  std::string input_dem_dir = "input_dem";
  std::string merged_dem = "dem_merged.tif";
  std::string hydrology_dir = "hydrology_outputs";
  std::string flow_accumulation = "flow_accumulation.tif";
  std::string flow_direction = "flow_direction_d8.tif";
  std::string stream_network = "stream_network.gpkg";
  std::string pour_points = "pour_points.gpkg";
  std::string sub_catchments = "sub_catchments.gpkg";
};

struct Logging {
  std::string level = "info";  ///< trace, debug, info, warn, error, off
  std::string directory = "logs";
  std::string file = "hydrologic_analysis.log";
};

}  // namespace hydrodem::config

#endif  // HYDRODEM_CONFIG_OUTPUTS_HPP
