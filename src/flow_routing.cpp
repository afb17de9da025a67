// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * flow_routing.cpp
 *
 * D8 flow direction and topological-order flow accumulation.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/hydrology/flow_routing.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <deque>
#include <stdexcept>
#include <string>

namespace hydrodem {

template <typename T>
FlowDirectionRaster flowDirection(const Raster<T>& surface) {
  auto dirs = FlowDirectionRaster::sameGridAs(surface, d8::kNoFlow, d8::kNoData);

  const double dx = std::abs(surface.transform().pixel_width);
  const double dy = std::abs(surface.transform().pixel_height);
  const double diagonal = std::hypot(dx, dy);
  std::array<double, 8> distance{};
  for (int i = 0; i < 8; ++i) {
    if (d8::isDiagonal(i)) {
      distance[i] = diagonal;
    } else {
      distance[i] = d8::kRowOffset[i] == 0 ? dx : dy;
    }
  }

  std::size_t pits = 0;
  for (int r = 0; r < surface.rows(); ++r) {
    for (int c = 0; c < surface.cols(); ++c) {
      if (surface.isNoData(r, c)) {
        dirs(r, c) = d8::kNoData;
        continue;
      }

      const double z = surface(r, c);
      double best_slope = 0.0;
      int best = -1;
      int off_grid = -1;
      int into_nodata = -1;

      for (int i = 0; i < 8; ++i) {
        const int nr = r + d8::kRowOffset[i];
        const int nc = c + d8::kColOffset[i];
        if (!surface.contains(nr, nc)) {
          if (off_grid < 0) off_grid = i;
          continue;
        }
        if (surface.isNoData(nr, nc)) {
          if (into_nodata < 0) into_nodata = i;
          continue;
        }
        const double drop = z - static_cast<double>(surface(nr, nc));
        if (drop <= 0.0) continue;
        const double slope = drop / distance[i];
        if (slope > best_slope) {
          best_slope = slope;
          best = i;
        }
      }

      if (best >= 0) {
        dirs(r, c) = d8::kCodes[best];
      } else if (off_grid >= 0) {
        dirs(r, c) = d8::kCodes[off_grid];
      } else if (into_nodata >= 0) {
        dirs(r, c) = d8::kCodes[into_nodata];
      } else {
        dirs(r, c) = d8::kNoFlow;
        ++pits;
      }
    }
  }

  if (pits > 0) {
    spdlog::debug("[Hydrology] {} cells without a downslope neighbour", pits);
  }
  return dirs;
}

template FlowDirectionRaster flowDirection(const Raster<float>&);
template FlowDirectionRaster flowDirection(const Raster<double>&);

std::optional<std::pair<int, int>> downstreamCell(
    const FlowDirectionRaster& directions, int row, int col) {
  const int index = d8::indexOf(directions(row, col));
  if (index < 0) return std::nullopt;
  const int nr = row + d8::kRowOffset[index];
  const int nc = col + d8::kColOffset[index];
  if (!directions.contains(nr, nc) || directions(nr, nc) == d8::kNoData) {
    return std::nullopt;
  }
  return std::make_pair(nr, nc);
}

AccumulationRaster flowAccumulation(const FlowDirectionRaster& directions) {
  const int rows = directions.rows();
  const int cols = directions.cols();
  auto acc = AccumulationRaster::sameGridAs(directions, 0u);

  // In-degree of every cell in the direction graph
  Eigen::Matrix<std::uint8_t, Eigen::Dynamic, Eigen::Dynamic> indegree =
      Eigen::Matrix<std::uint8_t, Eigen::Dynamic, Eigen::Dynamic>::Zero(rows,
                                                                       cols);
  std::size_t valid = 0;
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (directions(r, c) == d8::kNoData) continue;
      ++valid;
      if (auto down = downstreamCell(directions, r, c)) {
        ++indegree(down->first, down->second);
      }
    }
  }

  std::deque<std::pair<int, int>> ready;
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (directions(r, c) != d8::kNoData && indegree(r, c) == 0) {
        ready.emplace_back(r, c);
      }
    }
  }

  std::size_t processed = 0;
  while (!ready.empty()) {
    const auto [r, c] = ready.front();
    ready.pop_front();
    ++processed;

    auto down = downstreamCell(directions, r, c);
    if (!down) continue;
    const auto [dr, dc] = *down;
    acc(dr, dc) += acc(r, c) + 1;
    if (--indegree(dr, dc) == 0) ready.emplace_back(dr, dc);
  }

  if (processed != valid) {
    throw std::runtime_error("flow direction field contains a cycle (" +
                             std::to_string(valid - processed) +
                             " cells unresolved)");
  }
  return acc;
}

}  // namespace hydrodem
