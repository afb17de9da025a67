// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * hydrology_engine.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/hydrology/hydrology_engine.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "hydrodem/hydrology/conditioning.hpp"
#include "hydrodem/hydrology/flow_routing.hpp"
#include "hydrodem/hydrology/stream_extraction.hpp"
#include "hydrodem/io/raster.hpp"
#include "hydrodem/io/vector.hpp"

namespace hydrodem {

HydrologyEngine::HydrologyEngine(const config::Hydrology& cfg,
                                 HydrologyPaths paths)
    : cfg_(cfg), paths_(std::move(paths)) {}

HydrologyResult HydrologyEngine::run(const std::string& dem_path) const {
  spdlog::info("[Hydrology] Reading DEM: {}", dem_path);
  auto dem = io::readElevation(dem_path);
  if (!dem) {
    throw std::runtime_error("cannot read elevation raster: " + dem_path);
  }
  return run(std::move(*dem));
}

HydrologyResult HydrologyEngine::run(ElevationRaster dem) const {
  HydrologyResult result;
  result.crs = dem.crs();
  spdlog::info("[Hydrology] DEM grid {} x {} cells", dem.rows(), dem.cols());

  auto filled = fillDepressions(std::move(dem));
  spdlog::info("[Hydrology] Depressions filled");

  auto conditioned = resolveFlats(std::move(filled));
  spdlog::info("[Hydrology] Flats resolved");

  result.flow_direction = flowDirection(conditioned);
  spdlog::info("[Hydrology] Flow direction computed");

  result.accumulation = flowAccumulation(result.flow_direction);
  spdlog::info("[Hydrology] Flow accumulation computed (max {})",
               result.accumulation.data().maxCoeff());

  if (!io::writeGeoTiff(paths_.flow_direction, result.flow_direction,
                        io::CellType::Byte)) {
    throw std::runtime_error("cannot write flow direction raster: " +
                             paths_.flow_direction);
  }
  if (!io::writeGeoTiff(paths_.flow_accumulation, result.accumulation,
                        io::CellType::UInt32)) {
    throw std::runtime_error("cannot write flow accumulation raster: " +
                             paths_.flow_accumulation);
  }
  spdlog::info("[Hydrology] Flow rasters saved: {}, {}", paths_.flow_direction,
               paths_.flow_accumulation);

  result.streams = extractStreams(result.flow_direction, result.accumulation,
                                  cfg_.stream_threshold);
  if (result.streams.empty()) {
    spdlog::warn("[Hydrology] No streams were extracted at the given "
                 "threshold ({} cells).",
                 cfg_.stream_threshold);
    return result;
  }

  if (!io::writeLineStrings(paths_.stream_network, result.streams,
                            result.crs)) {
    throw std::runtime_error("cannot write stream network: " +
                             paths_.stream_network);
  }
  result.stream_network_path = paths_.stream_network;
  spdlog::info("[Hydrology] Stream network saved: {} ({} reaches)",
               paths_.stream_network, result.streams.size());
  return result;
}

}  // namespace hydrodem
