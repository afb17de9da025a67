// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * acquisition.cpp
 *
 * Tile fetching and first-wins mosaicking.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/acquisition/acquisition.hpp"

#include <ogr_spatialref.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>

#include "hydrodem/io/raster.hpp"

namespace fs = std::filesystem;

namespace hydrodem {

namespace {

bool sameCrs(const std::string& a, const std::string& b) {
  if (a == b) return true;
  if (a.empty() || b.empty()) return false;
  OGRSpatialReference sa, sb;
  if (sa.importFromWkt(a.c_str()) != OGRERR_NONE ||
      sb.importFromWkt(b.c_str()) != OGRERR_NONE) {
    return false;
  }
  return sa.IsSame(&sb);
}

}  // namespace

void mosaic(const std::vector<std::string>& tiles,
            const std::string& output_path) {
  if (tiles.empty()) throw std::invalid_argument("mosaic: no tiles");

  std::vector<io::RasterInfo> infos;
  infos.reserve(tiles.size());
  for (const auto& path : tiles) {
    auto info = io::readRasterInfo(path);
    if (!info) throw std::runtime_error("cannot read tile: " + path);
    if (!infos.empty() && !sameCrs(infos.front().crs, info->crs)) {
      throw std::runtime_error("tile CRS differs from first tile: " + path);
    }
    infos.push_back(std::move(*info));
  }

  const auto& first = infos.front();
  const double res_x = std::abs(first.transform.pixel_width);
  const double res_y = std::abs(first.transform.pixel_height);

  // Union extent
  auto extent = first.bounds();
  for (const auto& info : infos) {
    const auto b = info.bounds();
    extent[0] = std::min(extent[0], b[0]);
    extent[1] = std::min(extent[1], b[1]);
    extent[2] = std::max(extent[2], b[2]);
    extent[3] = std::max(extent[3], b[3]);
  }
  const int width = static_cast<int>(std::lround((extent[2] - extent[0]) / res_x));
  const int height = static_cast<int>(std::lround((extent[3] - extent[1]) / res_y));
  if (width <= 0 || height <= 0) {
    throw std::runtime_error("mosaic extent is empty");
  }

  GeoTransform gt;
  gt.origin_x = extent[0];
  gt.pixel_width = res_x;
  gt.origin_y = extent[3];
  gt.pixel_height = -res_y;

  ElevationRaster merged(height, width, gt, first.crs);
  merged.data().setConstant(NAN);

  // Nearest-neighbour sampling; a cell keeps the first value it receives
  for (std::size_t t = 0; t < tiles.size(); ++t) {
    auto tile = io::readElevation(tiles[t]);
    if (!tile) throw std::runtime_error("cannot read tile: " + tiles[t]);

    const auto b = infos[t].bounds();
    const int c0 = std::max(0, static_cast<int>(std::floor((b[0] - extent[0]) / res_x)));
    const int c1 = std::min(width, static_cast<int>(std::ceil((b[2] - extent[0]) / res_x)));
    const int r0 = std::max(0, static_cast<int>(std::floor((extent[3] - b[3]) / res_y)));
    const int r1 = std::min(height, static_cast<int>(std::ceil((extent[3] - b[1]) / res_y)));

    std::size_t filled = 0;
    for (int r = r0; r < r1; ++r) {
      for (int c = c0; c < c1; ++c) {
        if (!std::isnan(merged(r, c))) continue;
        const auto center = merged.cellCenter(r, c);
        const auto [tr, tc] = tile->cellIndex(center.x(), center.y());
        if (!tile->contains(tr, tc) || tile->isNoData(tr, tc)) continue;
        merged(r, c) = (*tile)(tr, tc);
        ++filled;
      }
    }
    spdlog::debug("[Acquisition] Tile {} contributed {} cells", tiles[t],
                  filled);
  }

  merged.setNoData(first.nodata ? static_cast<float>(*first.nodata) : NAN);
  if (!io::writeElevation(output_path, merged, first.gdal_type,
                          first.driver)) {
    throw std::runtime_error("cannot write mosaic: " + output_path);
  }
  spdlog::info("[Acquisition] Mosaic {} x {} saved: {}", width, height,
               output_path);
}

AcquisitionResult acquireElevation(TileSource& source, const BoundingBox& bbox,
                                   int resolution,
                                   const std::string& tile_dir,
                                   const std::string& merged_path) {
  try {
    fs::create_directories(tile_dir);
    spdlog::info("[Acquisition] Fetching DEM for bbox ({}, {}, {}, {}) at {} m "
                 "from {}",
                 bbox.min_lon, bbox.min_lat, bbox.max_lon, bbox.max_lat,
                 resolution, source.name());

    const auto tiles = source.fetch(bbox, resolution, tile_dir);
    if (tiles.empty()) {
      spdlog::error("[Acquisition] No DEM tiles returned for the bounding box");
      return NoCoverage{};
    }
    if (tiles.size() == 1) {
      spdlog::info("[Acquisition] Single DEM tile: {}", tiles.front());
      return Acquired{tiles.front(), 1, false};
    }

    spdlog::info("[Acquisition] Merging {} DEM tiles", tiles.size());
    mosaic(tiles, merged_path);
    return Acquired{merged_path, tiles.size(), true};
  } catch (const std::exception& e) {
    spdlog::error("[Acquisition] Failed to acquire DEM: {}", e.what());
    return TransientFailure{e.what()};
  }
}

}  // namespace hydrodem
