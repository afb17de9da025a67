// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * flow_routing.hpp
 *
 * D8 flow direction and flow accumulation.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_HYDROLOGY_FLOW_ROUTING_HPP
#define HYDRODEM_HYDROLOGY_FLOW_ROUTING_HPP

#include <optional>
#include <utility>

#include "hydrodem/hydrology/d8.hpp"
#include "hydrodem/raster.hpp"

namespace hydrodem {

/**
 * @brief Steepest-descent D8 direction.
 *
 * Slope uses real cell spacing (diagonals are longer). Ties keep the first
 * neighbour in E, SE, S, SW, W, NW, N, NE order. A cell without a lower
 * neighbour drains off the grid (border) or into an adjacent NaN cell;
 * otherwise it is d8::kNoFlow. NaN cells are d8::kNoData.
 *
 * @tparam T float or double surface
 */
template <typename T>
FlowDirectionRaster flowDirection(const Raster<T>& surface);

/**
 * @brief Count upstream cells for every cell (the cell itself excluded).
 *
 * Cells are processed in topological order (Kahn), so each count is final
 * before it is passed downstream.
 *
 * @throws std::runtime_error if the direction field contains a cycle
 */
AccumulationRaster flowAccumulation(const FlowDirectionRaster& directions);

/// Downstream neighbour of a cell; std::nullopt when flow leaves the grid
std::optional<std::pair<int, int>> downstreamCell(
    const FlowDirectionRaster& directions, int row, int col);

/// True if neighbour (nr, nc) of a cell drains into that cell
inline bool drainsInto(const FlowDirectionRaster& directions, int nr, int nc,
                       int neighbour_index) {
  return directions(nr, nc) ==
         d8::kCodes[d8::opposite(neighbour_index)];
}

}  // namespace hydrodem

#endif  // HYDRODEM_HYDROLOGY_FLOW_ROUTING_HPP
