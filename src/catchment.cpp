// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * catchment.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/delineation/catchment.hpp"

#include <cpl_string.h>
#include <gdal_alg.h>
#include <gdal_priv.h>
#include <ogrsf_frmts.h>

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <stdexcept>

#include "hydrodem/hydrology/flow_routing.hpp"
#include "hydrodem/io/raster.hpp"

namespace hydrodem {

namespace {

Ring toRing(const OGRLinearRing& ring) {
  Ring out;
  out.reserve(ring.getNumPoints());
  for (int i = 0; i < ring.getNumPoints(); ++i) {
    out.push_back({ring.getX(i), ring.getY(i)});
  }
  return out;
}

GDALDriver* vectorMemoryDriver() {
  auto* manager = GetGDALDriverManager();
  // "Memory" was folded into "MEM" in newer GDAL releases
  if (auto* driver = manager->GetDriverByName("Memory")) return driver;
  return manager->GetDriverByName("MEM");
}

}  // namespace

std::optional<Point2> snapToChannel(const Point2& point,
                                    const AccumulationRaster& accumulation,
                                    int max_radius) {
  const auto [row, col] = accumulation.cellIndex(point.x, point.y);
  if (accumulation.contains(row, col) && accumulation(row, col) > 0) {
    return point;
  }

  const int rows = accumulation.rows();
  const int cols = accumulation.cols();
  const int outside = std::max({0, -row, row - rows + 1, -col, col - cols + 1});
  int limit = std::max(rows, cols) + outside;
  if (max_radius > 0) limit = std::min(limit, max_radius);

  long best_dist = std::numeric_limits<long>::max();
  int best_row = -1;
  int best_col = -1;
  int search_to = limit;

  for (int k = 1; k <= search_to; ++k) {
    for (int dr = -k; dr <= k; ++dr) {
      // Full row on the top and bottom edges, end cells elsewhere
      const int step = (dr == -k || dr == k) ? 1 : 2 * k;
      for (int dc = -k; dc <= k; dc += step) {
        const int r = row + dr;
        const int c = col + dc;
        if (!accumulation.contains(r, c) || accumulation(r, c) == 0) continue;

        const long dist = static_cast<long>(dr) * dr + static_cast<long>(dc) * dc;
        if (dist < best_dist ||
            (dist == best_dist &&
             (r < best_row || (r == best_row && c < best_col)))) {
          best_dist = dist;
          best_row = r;
          best_col = c;
        }
      }
    }
    // A closer cell can only lie within ring sqrt(best_dist)
    if (best_row >= 0 && search_to == limit) {
      const int bound =
          static_cast<int>(std::ceil(std::sqrt(static_cast<double>(best_dist))));
      search_to = std::min(limit, bound);
    }
  }

  if (best_row < 0) return std::nullopt;
  const auto center = accumulation.cellCenter(best_row, best_col);
  return Point2{center.x(), center.y()};
}

CatchmentMask traceCatchment(const FlowDirectionRaster& directions,
                             const Point2& point) {
  CatchmentMask mask;
  mask.cells = Raster<std::uint8_t>::sameGridAs(directions, 0);

  const auto [row, col] = directions.cellIndex(point.x, point.y);
  if (!directions.contains(row, col) || directions(row, col) == d8::kNoData) {
    return mask;
  }

  std::deque<std::pair<int, int>> queue{{row, col}};
  mask.cells(row, col) = 1;
  mask.count = 1;
  while (!queue.empty()) {
    const auto [r, c] = queue.front();
    queue.pop_front();
    for (int i = 0; i < 8; ++i) {
      const int nr = r + d8::kRowOffset[i];
      const int nc = c + d8::kColOffset[i];
      if (!directions.contains(nr, nc) || mask.cells(nr, nc)) continue;
      if (!drainsInto(directions, nr, nc, i)) continue;
      mask.cells(nr, nc) = 1;
      ++mask.count;
      queue.emplace_back(nr, nc);
    }
  }
  return mask;
}

std::vector<Polygon> polygonize(const CatchmentMask& mask,
                                bool eight_connected) {
  if (mask.empty()) return {};

  // Bounding window of the mask
  const auto& cells = mask.cells;
  int r0 = cells.rows(), r1 = -1, c0 = cells.cols(), c1 = -1;
  for (int r = 0; r < cells.rows(); ++r) {
    for (int c = 0; c < cells.cols(); ++c) {
      if (!cells(r, c)) continue;
      r0 = std::min(r0, r);
      r1 = std::max(r1, r);
      c0 = std::min(c0, c);
      c1 = std::max(c1, c);
    }
  }
  const int height = r1 - r0 + 1;
  const int width = c1 - c0 + 1;

  io::initGdal();
  auto* raster_driver = GetGDALDriverManager()->GetDriverByName("MEM");
  auto* vector_driver = vectorMemoryDriver();
  if (!raster_driver || !vector_driver) {
    throw std::runtime_error("GDAL in-memory drivers are not available");
  }

  GDALDatasetUniquePtr raster(
      raster_driver->Create("", width, height, 1, GDT_Byte, nullptr));
  if (!raster) throw std::runtime_error("cannot create in-memory raster");

  auto gt = cells.transform().window(r0, c0).toArray();
  raster->SetGeoTransform(gt.data());

  Raster<std::uint8_t>::Matrix window = cells.data().block(r0, c0, height, width);
  auto* band = raster->GetRasterBand(1);
  if (band->RasterIO(GF_Write, 0, 0, width, height, window.data(), width,
                     height, GDT_Byte, 0, 0, nullptr) != CE_None) {
    throw std::runtime_error("cannot write catchment mask");
  }

  GDALDatasetUniquePtr vector(
      vector_driver->Create("", 0, 0, 0, GDT_Unknown, nullptr));
  if (!vector) throw std::runtime_error("cannot create in-memory layer");
  OGRLayer* layer =
      vector->CreateLayer("catchment", nullptr, wkbPolygon, nullptr);
  if (!layer) throw std::runtime_error("cannot create in-memory layer");
  OGRFieldDefn field("value", OFTInteger);
  if (layer->CreateField(&field) != OGRERR_NONE) {
    throw std::runtime_error("cannot create polygon value field");
  }

  CPLStringList options;
  if (eight_connected) options.SetNameValue("8CONNECTED", "8");

  // The band is its own mask: zero cells are not polygonized
  if (GDALPolygonize(GDALRasterBand::ToHandle(band),
                     GDALRasterBand::ToHandle(band), OGRLayer::ToHandle(layer),
                     0, options.List(), nullptr, nullptr) != CE_None) {
    throw std::runtime_error("GDALPolygonize failed");
  }

  std::vector<Polygon> polygons;
  layer->ResetReading();
  for (auto& feature : *layer) {
    if (feature->GetFieldAsInteger(0) != 1) continue;
    const OGRGeometry* geometry = feature->GetGeometryRef();
    if (!geometry || wkbFlatten(geometry->getGeometryType()) != wkbPolygon) {
      continue;
    }
    const auto* poly = geometry->toPolygon();
    Polygon out;
    out.exterior = toRing(*poly->getExteriorRing());
    for (int i = 0; i < poly->getNumInteriorRings(); ++i) {
      out.holes.push_back(toRing(*poly->getInteriorRing(i)));
    }
    polygons.push_back(std::move(out));
  }
  return polygons;
}

}  // namespace hydrodem
