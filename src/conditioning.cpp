// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * conditioning.cpp
 *
 * Priority-Flood depression filling and flat resolution.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/hydrology/conditioning.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <queue>
#include <vector>

#include "hydrodem/hydrology/flow_routing.hpp"

namespace hydrodem {

namespace {

struct Cell {
  int row;
  int col;
};

struct FloodNode {
  float elevation;
  std::uint64_t order;  // insertion order keeps ties deterministic
  int row;
  int col;

  bool operator>(const FloodNode& o) const {
    if (elevation != o.elevation) return elevation > o.elevation;
    return order > o.order;
  }
};

bool touchesNoData(const ElevationRaster& dem, int r, int c) {
  for (int i = 0; i < 8; ++i) {
    const int nr = r + d8::kRowOffset[i];
    const int nc = c + d8::kColOffset[i];
    if (dem.contains(nr, nc) && dem.isNoData(nr, nc)) return true;
  }
  return false;
}

// ─── Flat resolution helpers ─────────────────────────────────────────────────

struct FlatEdges {
  std::deque<Cell> low;   // draining cells next to an undrained cell of equal height
  std::deque<Cell> high;  // undrained cells next to higher terrain
};

FlatEdges findFlatEdges(const ElevationRaster& dem,
                        const FlowDirectionRaster& dirs) {
  FlatEdges edges;
  for (int r = 0; r < dem.rows(); ++r) {
    for (int c = 0; c < dem.cols(); ++c) {
      if (dirs(r, c) == d8::kNoData) continue;
      const float z = dem(r, c);
      for (int i = 0; i < 8; ++i) {
        const int nr = r + d8::kRowOffset[i];
        const int nc = c + d8::kColOffset[i];
        if (!dirs.contains(nr, nc) || dirs(nr, nc) == d8::kNoData) continue;

        if (dirs(r, c) != d8::kNoFlow && dirs(nr, nc) == d8::kNoFlow &&
            dem(nr, nc) == z) {
          edges.low.push_back({r, c});
          break;
        }
        if (dirs(r, c) == d8::kNoFlow && z < dem(nr, nc)) {
          edges.high.push_back({r, c});
          break;
        }
      }
    }
  }
  return edges;
}

/// Flood-label the equal-elevation region around a seed.
void labelFlat(const ElevationRaster& dem, Eigen::MatrixXi& labels, Cell seed,
               int label) {
  const float z = dem(seed.row, seed.col);
  std::deque<Cell> queue{seed};
  labels(seed.row, seed.col) = label;
  while (!queue.empty()) {
    const Cell c = queue.front();
    queue.pop_front();
    for (int i = 0; i < 8; ++i) {
      const int nr = c.row + d8::kRowOffset[i];
      const int nc = c.col + d8::kColOffset[i];
      if (!dem.contains(nr, nc) || dem.isNoData(nr, nc)) continue;
      if (labels(nr, nc) != 0 || dem(nr, nc) != z) continue;
      labels(nr, nc) = label;
      queue.push_back({nr, nc});
    }
  }
}

/**
 * Breadth-first distance from the given edge cells over undrained cells of
 * the same flat. The visitor is called once per cell with the current ring
 * number (1-based) and returns false to skip expansion from that cell.
 */
template <typename Visit>
void ringBfs(std::deque<Cell> seeds, const FlowDirectionRaster& dirs,
             const Eigen::MatrixXi& labels, Visit visit) {
  constexpr Cell kMarker{-1, -1};
  int loops = 1;
  std::deque<Cell> queue = std::move(seeds);
  queue.push_back(kMarker);

  while (queue.size() > 1) {
    const Cell c = queue.front();
    queue.pop_front();
    if (c.row == kMarker.row) {
      ++loops;
      queue.push_back(kMarker);
      continue;
    }
    if (!visit(c, loops)) continue;

    for (int i = 0; i < 8; ++i) {
      const int nr = c.row + d8::kRowOffset[i];
      const int nc = c.col + d8::kColOffset[i];
      if (!dirs.contains(nr, nc)) continue;
      if (labels(nr, nc) == labels(c.row, c.col) &&
          dirs(nr, nc) == d8::kNoFlow) {
        queue.push_back({nr, nc});
      }
    }
  }
}

}  // namespace

ElevationRaster fillDepressions(ElevationRaster dem) {
  const int rows = dem.rows();
  const int cols = dem.cols();
  Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic> closed =
      Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic>::Constant(rows, cols,
                                                                    false);

  std::priority_queue<FloodNode, std::vector<FloodNode>,
                      std::greater<FloodNode>>
      open;
  std::uint64_t order = 0;

  // Seeds: border cells and cells next to missing data
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (dem.isNoData(r, c)) continue;
      const bool border = r == 0 || c == 0 || r == rows - 1 || c == cols - 1;
      if (border || touchesNoData(dem, r, c)) {
        closed(r, c) = true;
        open.push({dem(r, c), order++, r, c});
      }
    }
  }

  std::size_t raised = 0;
  while (!open.empty()) {
    const FloodNode node = open.top();
    open.pop();
    for (int i = 0; i < 8; ++i) {
      const int nr = node.row + d8::kRowOffset[i];
      const int nc = node.col + d8::kColOffset[i];
      if (!dem.contains(nr, nc) || closed(nr, nc) || dem.isNoData(nr, nc)) {
        continue;
      }
      closed(nr, nc) = true;
      if (dem(nr, nc) < node.elevation) {
        dem(nr, nc) = node.elevation;
        ++raised;
      }
      open.push({dem(nr, nc), order++, nr, nc});
    }
  }

  spdlog::debug("[Hydrology] Depression filling raised {} cells", raised);
  return dem;
}

ConditionedSurface resolveFlats(ElevationRaster filled) {
  const int rows = filled.rows();
  const int cols = filled.cols();

  ConditionedSurface surface(rows, cols, filled.transform(), filled.crs(),
                             std::optional<double>(NAN));
  surface.data() = filled.data().cast<double>();

  const FlowDirectionRaster dirs = flowDirection(filled);
  FlatEdges edges = findFlatEdges(filled, dirs);
  if (edges.low.empty()) {
    if (!edges.high.empty()) {
      spdlog::warn("[Hydrology] {} flat cells have no outlet",
                   edges.high.size());
    }
    return surface;
  }

  Eigen::MatrixXi labels = Eigen::MatrixXi::Zero(rows, cols);
  int label_count = 0;
  for (const auto& c : edges.low) {
    if (labels(c.row, c.col) == 0) labelFlat(filled, labels, c, ++label_count);
  }

  // High edges of flats that never drain cannot be resolved
  std::deque<Cell> high;
  for (const auto& c : edges.high) {
    if (labels(c.row, c.col) != 0) high.push_back(c);
  }
  if (high.size() != edges.high.size()) {
    spdlog::warn("[Hydrology] {} flat edge cells have no outlet",
                 edges.high.size() - high.size());
  }

  Eigen::MatrixXi mask = Eigen::MatrixXi::Zero(rows, cols);
  std::vector<int> flat_height(label_count + 1, 0);

  // Gradient away from higher terrain
  ringBfs(std::move(high), dirs, labels, [&](Cell c, int loops) {
    if (mask(c.row, c.col) > 0) return false;
    mask(c.row, c.col) = loops;
    flat_height[labels(c.row, c.col)] = loops;
    return true;
  });

  mask = -mask;

  // Gradient towards lower terrain, combined with the one above
  ringBfs(edges.low, dirs, labels, [&](Cell c, int loops) {
    int& m = mask(c.row, c.col);
    if (m > 0) return false;
    if (m < 0) {
      m = flat_height[labels(c.row, c.col)] + m + 2 * loops;
    } else {
      m = 2 * loops;
    }
    return true;
  });

  // Increment per flat: the largest mask value must stay below the lowest
  // higher neighbour
  std::vector<double> min_gap(label_count + 1,
                              std::numeric_limits<double>::infinity());
  std::vector<int> max_mask(label_count + 1, 0);
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      const int l = labels(r, c);
      if (l == 0) continue;
      max_mask[l] = std::max(max_mask[l], mask(r, c));
      for (int i = 0; i < 8; ++i) {
        const int nr = r + d8::kRowOffset[i];
        const int nc = c + d8::kColOffset[i];
        if (!filled.contains(nr, nc) || filled.isNoData(nr, nc)) continue;
        const double gap =
            static_cast<double>(filled(nr, nc)) - filled(r, c);
        if (gap > 0.0) min_gap[l] = std::min(min_gap[l], gap);
      }
    }
  }

  std::size_t resolved = 0;
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      const int l = labels(r, c);
      if (l == 0 || mask(r, c) <= 0) continue;
      const double gap = std::isfinite(min_gap[l]) ? min_gap[l] : 1.0;
      const double increment = gap / (2.0 * (max_mask[l] + 1));
      surface(r, c) += mask(r, c) * increment;
      ++resolved;
    }
  }

  spdlog::debug("[Hydrology] Resolved {} flats ({} cells)", label_count,
                resolved);
  return surface;
}

}  // namespace hydrodem
