// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * hydrology_engine.hpp
 *
 * Fill → flats → D8 → accumulation → streams, with persistence.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_HYDROLOGY_HYDROLOGY_ENGINE_HPP
#define HYDRODEM_HYDROLOGY_HYDROLOGY_ENGINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "hydrodem/config/hydrology.hpp"
#include "hydrodem/geometry.hpp"
#include "hydrodem/raster.hpp"

namespace hydrodem {

/// Where the engine writes its products.
struct HydrologyPaths {
  std::string flow_direction;
  std::string flow_accumulation;
  std::string stream_network;
};

struct HydrologyResult {
  std::string crs;  ///< Captured from the input DEM
  FlowDirectionRaster flow_direction;
  AccumulationRaster accumulation;
  std::vector<LineString> streams;
  /// Set only when a non-empty network was written
  std::optional<std::string> stream_network_path;
};

/**
 * @brief Derives hydrologic surfaces from one elevation raster.
 *
 * Each stage takes the previous stage's grid by value and returns a new
 * one, so no grid is shared between stages.
 */
class HydrologyEngine {
 public:
  HydrologyEngine(const config::Hydrology& cfg, HydrologyPaths paths);

  /**
   * @brief Run every stage on a DEM file and persist the products.
   *
   * @throws std::runtime_error if the DEM cannot be read or a raster
   *         cannot be written
   */
  HydrologyResult run(const std::string& dem_path) const;

  /// Run every stage on an in-memory DEM (persists like run(path)).
  HydrologyResult run(ElevationRaster dem) const;

 private:
  config::Hydrology cfg_;
  HydrologyPaths paths_;
};

}  // namespace hydrodem

#endif  // HYDRODEM_HYDROLOGY_HYDROLOGY_ENGINE_HPP
