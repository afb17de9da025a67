// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * catchment_delineator.hpp
 *
 * Sub-catchment polygons for a set of pour points.
 */

#ifndef HYDRODEM_DELINEATION_CATCHMENT_DELINEATOR_HPP
#define HYDRODEM_DELINEATION_CATCHMENT_DELINEATOR_HPP

#include <optional>
#include <string>
#include <vector>

#include "hydrodem/config/delineation.hpp"
#include "hydrodem/delineation/catchment.hpp"
#include "hydrodem/topology/pour_points.hpp"

namespace hydrodem {

struct DelineationResult {
  std::vector<Polygon> polygons;     ///< All parts of all catchments
  std::size_t delineated_points = 0; ///< Points with a non-empty catchment
  std::size_t skipped_points = 0;
  std::optional<std::string> output_path;  ///< Set only when written
};

class CatchmentDelineator {
 public:
  CatchmentDelineator(const config::Delineation& cfg, std::string output_path);

  /**
   * @brief Snap, trace and polygonize every pour point, then persist.
   *
   * Points yielding no cells are skipped with a warning. Nothing is written
   * when no polygon results. Identical catchments are all kept.
   *
   * @throws std::invalid_argument if the rasters are on different grids
   * @throws std::runtime_error if the polygon layer cannot be written
   */
  DelineationResult run(const std::vector<PourPoint>& points,
                        const FlowDirectionRaster& directions,
                        const AccumulationRaster& accumulation,
                        const std::string& crs) const;

 private:
  config::Delineation cfg_;
  std::string output_path_;
};

}  // namespace hydrodem

#endif  // HYDRODEM_DELINEATION_CATCHMENT_DELINEATOR_HPP
