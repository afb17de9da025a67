// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * stream_extraction.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/hydrology/stream_extraction.hpp"

#include <stdexcept>

#include "hydrodem/hydrology/flow_routing.hpp"

namespace hydrodem {

std::vector<LineString> extractStreams(const FlowDirectionRaster& directions,
                                       const AccumulationRaster& accumulation,
                                       std::uint32_t threshold) {
  if (!directions.sameGrid(accumulation)) {
    throw std::invalid_argument(
        "extractStreams: direction and accumulation grids differ");
  }
  const int rows = directions.rows();
  const int cols = directions.cols();

  auto isStream = [&](int r, int c) {
    return directions(r, c) != d8::kNoData && accumulation(r, c) > threshold;
  };

  // Number of stream cells draining into each stream cell
  Eigen::MatrixXi upstream = Eigen::MatrixXi::Zero(rows, cols);
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (!isStream(r, c)) continue;
      for (int i = 0; i < 8; ++i) {
        const int nr = r + d8::kRowOffset[i];
        const int nc = c + d8::kColOffset[i];
        if (directions.contains(nr, nc) && isStream(nr, nc) &&
            drainsInto(directions, nr, nc, i)) {
          ++upstream(r, c);
        }
      }
    }
  }

  std::vector<LineString> reaches;
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (!isStream(r, c) || upstream(r, c) == 1) continue;

      LineString line;
      const auto start = directions.cellCenter(r, c);
      line.push_back({start.x(), start.y()});

      int cr = r;
      int cc = c;
      while (auto next = downstreamCell(directions, cr, cc)) {
        const auto [nr, nc] = *next;
        if (!isStream(nr, nc)) break;
        const auto p = directions.cellCenter(nr, nc);
        line.push_back({p.x(), p.y()});
        if (upstream(nr, nc) >= 2) break;
        cr = nr;
        cc = nc;
      }

      if (line.size() >= 2) reaches.push_back(std::move(line));
    }
  }
  return reaches;
}

}  // namespace hydrodem
