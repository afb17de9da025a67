// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * catchment.hpp
 *
 * Pour-point snapping, upstream tracing and polygonization.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_DELINEATION_CATCHMENT_HPP
#define HYDRODEM_DELINEATION_CATCHMENT_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "hydrodem/geometry.hpp"
#include "hydrodem/raster.hpp"

namespace hydrodem {

/// Cell membership of one catchment.
struct CatchmentMask {
  Raster<std::uint8_t> cells;  ///< 1 inside, 0 outside
  std::size_t count = 0;

  bool empty() const { return count == 0; }
};

/**
 * @brief Move a point onto the nearest channel cell (accumulation > 0).
 *
 * A point whose containing cell is already a channel cell is returned
 * unchanged. Otherwise the centre of the nearest channel cell is returned,
 * searched in growing square rings; ties go to the lowest row, then column.
 *
 * @param max_radius Ring limit in cells, 0 for the whole grid
 * @return std::nullopt if no channel cell lies within reach
 */
std::optional<Point2> snapToChannel(const Point2& point,
                                    const AccumulationRaster& accumulation,
                                    int max_radius = 0);

/**
 * @brief Every cell that drains through the cell containing a point.
 *
 * Breadth-first inverse flood over the direction field. Points off the grid
 * or on nodata cells produce an empty mask.
 */
CatchmentMask traceCatchment(const FlowDirectionRaster& directions,
                             const Point2& point);

/**
 * @brief Vectorize the cells of a mask.
 *
 * Adjacent cells merge into one polygon; disjoint groups become separate
 * polygons. Only the mask's bounding window is polygonized.
 *
 * @param eight_connected Diagonal neighbours count as adjacent
 * @throws std::runtime_error on GDAL failure
 */
std::vector<Polygon> polygonize(const CatchmentMask& mask,
                                bool eight_connected = false);

}  // namespace hydrodem

#endif  // HYDRODEM_DELINEATION_CATCHMENT_HPP
