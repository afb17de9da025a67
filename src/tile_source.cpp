// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * tile_source.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/acquisition/tile_source.hpp"

#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <stdexcept>

#include "hydrodem/io/raster.hpp"

namespace fs = std::filesystem;

namespace hydrodem {

namespace {

/// Box corners and edge midpoints, transformed into a raster's CRS
std::array<double, 4> bboxInCrs(const BoundingBox& bbox,
                                const std::string& crs_wkt) {
  std::array<double, 4> out{bbox.min_lon, bbox.min_lat, bbox.max_lon,
                            bbox.max_lat};
  if (crs_wkt.empty()) return out;

  OGRSpatialReference wgs84;
  wgs84.SetWellKnownGeogCS("WGS84");
  wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
  OGRSpatialReference target;
  if (target.importFromWkt(crs_wkt.c_str()) != OGRERR_NONE) {
    throw std::runtime_error("unparseable tile CRS");
  }
  target.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

  std::unique_ptr<OGRCoordinateTransformation> ct(
      OGRCreateCoordinateTransformation(&wgs84, &target));
  if (!ct) throw std::runtime_error("no transformation from WGS84 to tile CRS");

  const double mx = 0.5 * (bbox.min_lon + bbox.max_lon);
  const double my = 0.5 * (bbox.min_lat + bbox.max_lat);
  double xs[] = {bbox.min_lon, mx, bbox.max_lon, bbox.max_lon,
                 bbox.max_lon, mx, bbox.min_lon, bbox.min_lon};
  double ys[] = {bbox.min_lat, bbox.min_lat, bbox.min_lat, my,
                 bbox.max_lat, bbox.max_lat, bbox.max_lat, my};
  if (!ct->Transform(8, xs, ys)) {
    throw std::runtime_error("bounding box transformation failed");
  }
  out = {*std::min_element(xs, xs + 8), *std::min_element(ys, ys + 8),
         *std::max_element(xs, xs + 8), *std::max_element(ys, ys + 8)};
  return out;
}

bool intersects(const std::array<double, 4>& a, const std::array<double, 4>& b) {
  return a[0] < b[2] && b[0] < a[2] && a[1] < b[3] && b[1] < a[3];
}

bool isGeoTiffName(const fs::path& p) {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  return ext == ".tif" || ext == ".tiff";
}

}  // namespace

// ─── ThreeDepSource ──────────────────────────────────────────────────────────

ThreeDepSource::ThreeDepSource(const config::Acquisition& cfg)
    : base_url_(cfg.base_url), max_tile_size_(cfg.max_tile_size) {}

std::string ThreeDepSource::productUrl(int resolution) const {
  std::string code;
  switch (resolution) {
    case 10:
      code = "13";  // 1/3 arc-second
      break;
    case 30:
      code = "1";
      break;
    case 60:
      code = "2";
      break;
    default:
      return {};
  }
  return "/vsicurl/" + base_url_ + "/" + code + "/TIFF/USGS_Seamless_DEM_" +
         code + ".vrt";
}

std::vector<std::string> ThreeDepSource::fetch(const BoundingBox& bbox,
                                               int resolution,
                                               const std::string& output_dir) {
  const std::string url = productUrl(resolution);
  if (url.empty()) {
    throw std::invalid_argument("3DEP has no product at " +
                                std::to_string(resolution) + " m");
  }

  io::initGdal();
  spdlog::info("[Acquisition] Opening {}", url);
  GDALDatasetUniquePtr dataset(GDALDataset::Open(
      url.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr,
      nullptr));
  if (!dataset) throw std::runtime_error("cannot open " + url);

  std::array<double, 6> raw{};
  if (dataset->GetGeoTransform(raw.data()) != CE_None) {
    throw std::runtime_error("3DEP product has no geotransform");
  }
  const auto gt = GeoTransform::fromArray(raw);
  const std::string crs = dataset->GetProjectionRef();
  const auto box = bboxInCrs(bbox, crs);

  // Pixel window of the box, clipped to the product extent
  const int cols = dataset->GetRasterXSize();
  const int rows = dataset->GetRasterYSize();
  const int col0 = std::max(
      0, static_cast<int>(std::floor((box[0] - gt.origin_x) / gt.pixel_width)));
  const int col1 = std::min(
      cols, static_cast<int>(std::ceil((box[2] - gt.origin_x) / gt.pixel_width)));
  const int row0 = std::max(
      0, static_cast<int>(std::floor((box[3] - gt.origin_y) / gt.pixel_height)));
  const int row1 = std::min(
      rows, static_cast<int>(std::ceil((box[1] - gt.origin_y) / gt.pixel_height)));
  if (col0 >= col1 || row0 >= row1) {
    spdlog::warn("[Acquisition] Box lies outside the 3DEP extent");
    return {};
  }

  auto* band = dataset->GetRasterBand(1);
  int has_nodata = 0;
  const double nodata = band->GetNoDataValue(&has_nodata);
  const int gdal_type = static_cast<int>(band->GetRasterDataType());

  std::vector<std::string> tiles;
  for (int ty = row0, i = 0; ty < row1; ty += max_tile_size_, ++i) {
    for (int tx = col0, j = 0; tx < col1; tx += max_tile_size_, ++j) {
      const int h = std::min(max_tile_size_, row1 - ty);
      const int w = std::min(max_tile_size_, col1 - tx);

      ElevationRaster tile(h, w, gt.window(ty, tx), crs);
      if (has_nodata) tile.setNoData(static_cast<float>(nodata));
      if (band->RasterIO(GF_Read, tx, ty, w, h, tile.data().data(), w, h,
                         GDT_Float32, 0, 0, nullptr) != CE_None) {
        throw std::runtime_error("3DEP read failed at window " +
                                 std::to_string(tx) + "," + std::to_string(ty));
      }

      bool any_data = false;
      for (int r = 0; r < h && !any_data; ++r) {
        for (int c = 0; c < w; ++c) {
          if (!tile.isNoData(r, c)) {
            any_data = true;
            break;
          }
        }
      }
      if (!any_data) {
        spdlog::debug("[Acquisition] Tile {}_{} holds no data, skipped", i, j);
        continue;
      }

      const std::string path =
          (fs::path(output_dir) / ("dem_" + std::to_string(resolution) + "m_" +
                                   std::to_string(i) + "_" +
                                   std::to_string(j) + ".tif"))
              .string();
      if (!io::writeElevation(path, tile, gdal_type)) {
        throw std::runtime_error("cannot write tile " + path);
      }
      tiles.push_back(path);
    }
  }

  spdlog::info("[Acquisition] 3DEP returned {} tiles", tiles.size());
  return tiles;
}

// ─── DirectorySource ─────────────────────────────────────────────────────────

DirectorySource::DirectorySource(std::string directory)
    : directory_(std::move(directory)) {}

std::vector<std::string> DirectorySource::fetch(const BoundingBox& bbox,
                                                int /*resolution*/,
                                                const std::string& /*output_dir*/) {
  if (!fs::is_directory(directory_)) {
    throw std::runtime_error("tile directory does not exist: " + directory_);
  }

  std::vector<std::string> candidates;
  for (const auto& entry : fs::directory_iterator(directory_)) {
    if (entry.is_regular_file() && isGeoTiffName(entry.path())) {
      candidates.push_back(entry.path().string());
    }
  }
  std::sort(candidates.begin(), candidates.end());

  std::vector<std::string> tiles;
  for (const auto& path : candidates) {
    const auto info = io::readRasterInfo(path);
    if (!info) {
      spdlog::warn("[Acquisition] Unreadable tile skipped: {}", path);
      continue;
    }
    if (info->crs.empty()) {
      spdlog::warn("[Acquisition] {} has no CRS, assuming lon/lat", path);
    }
    if (intersects(info->bounds(), bboxInCrs(bbox, info->crs))) {
      tiles.push_back(path);
    }
  }

  spdlog::info("[Acquisition] {} of {} tiles in {} cover the box",
               tiles.size(), candidates.size(), directory_);
  return tiles;
}

std::unique_ptr<TileSource> createTileSource(const config::Acquisition& cfg) {
  switch (cfg.source) {
    case TileSourceType::ThreeDep:
      return std::make_unique<ThreeDepSource>(cfg);
    case TileSourceType::Directory:
      return std::make_unique<DirectorySource>(cfg.tile_directory);
  }
  return std::make_unique<ThreeDepSource>(cfg);
}

}  // namespace hydrodem
