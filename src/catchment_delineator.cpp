// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * catchment_delineator.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/delineation/catchment_delineator.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "hydrodem/io/vector.hpp"

namespace hydrodem {

CatchmentDelineator::CatchmentDelineator(const config::Delineation& cfg,
                                         std::string output_path)
    : cfg_(cfg), output_path_(std::move(output_path)) {}

DelineationResult CatchmentDelineator::run(
    const std::vector<PourPoint>& points, const FlowDirectionRaster& directions,
    const AccumulationRaster& accumulation, const std::string& crs) const {
  if (!directions.sameGrid(accumulation)) {
    throw std::invalid_argument(
        "delineation: direction and accumulation grids differ");
  }

  DelineationResult result;
  for (std::size_t i = 0; i < points.size(); ++i) {
    const auto& pp = points[i];

    Point2 pour = pp.location;
    if (auto snapped =
            snapToChannel(pp.location, accumulation, cfg_.snap_radius)) {
      pour = *snapped;
    } else {
      spdlog::warn("[Delineation] Point {} ({}, {}) has no channel cell in "
                   "reach, tracing from its own cell",
                   i, pp.location.x, pp.location.y);
    }

    const auto mask = traceCatchment(directions, pour);
    if (mask.empty()) {
      spdlog::warn("[Delineation] Point {} {} ({}, {}) yields no catchment "
                   "cells, skipped",
                   i, toString(pp.type), pour.x, pour.y);
      ++result.skipped_points;
      continue;
    }

    auto parts = polygonize(mask, cfg_.eight_connected);
    if (parts.empty()) {
      spdlog::warn("[Delineation] Point {} produced no polygon, skipped", i);
      ++result.skipped_points;
      continue;
    }

    spdlog::debug("[Delineation] Point {} {}: {} cells, {} parts", i,
                  toString(pp.type), mask.count, parts.size());
    ++result.delineated_points;
    for (auto& part : parts) result.polygons.push_back(std::move(part));
  }

  spdlog::info("[Delineation] {} of {} pour points delineated",
               result.delineated_points, points.size());

  if (result.polygons.empty()) {
    spdlog::warn("[Delineation] No sub-catchments were delineated");
    return result;
  }

  if (!io::writePolygons(output_path_, result.polygons, crs)) {
    throw std::runtime_error("cannot write sub-catchments: " + output_path_);
  }
  result.output_path = output_path_;
  spdlog::info("[Delineation] {} sub-catchment polygons saved: {}",
               result.polygons.size(), output_path_);
  return result;
}

}  // namespace hydrodem
