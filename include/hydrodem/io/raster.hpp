// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raster.hpp
 *
 * GeoTIFF raster I/O through GDAL.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_IO_RASTER_HPP
#define HYDRODEM_IO_RASTER_HPP

#include <array>
#include <optional>
#include <string>

#include "hydrodem/raster.hpp"

namespace hydrodem::io {

/// Cell type written to disk (subset of GDALDataType).
enum class CellType { Byte, UInt32, Float32, Float64 };

/// Header of a raster file, read without touching the pixels.
struct RasterInfo {
  int rows = 0;
  int cols = 0;
  GeoTransform transform;
  std::string crs;             ///< WKT, empty when ungeoreferenced
  std::optional<double> nodata;
  int gdal_type = 0;           ///< GDALDataType of band 1
  std::string driver;          ///< GDAL short driver name (e.g. "GTiff")
  bool has_transform = false;  ///< False when the file carries none

  /// Bounds as (min_x, min_y, max_x, max_y) in CRS units
  std::array<double, 4> bounds() const;
};

/// Register GDAL drivers once per process.
void initGdal();

/**
 * @brief Read raster metadata.
 * @return std::nullopt if the file cannot be opened (error logged)
 */
std::optional<RasterInfo> readRasterInfo(const std::string& path);

/**
 * @brief Read band 1 as float elevation.
 *
 * Cells equal to the band nodata value become NaN. A file without a
 * geotransform or CRS is returned as-is and reported with a warning.
 *
 * @return std::nullopt on open/read failure (error logged)
 */
std::optional<ElevationRaster> readElevation(const std::string& path);

/**
 * @brief Write a raster as a single-band GeoTIFF (LZW).
 *
 * Floating NaN cells are written as the raster's nodata value when set.
 *
 * @return true on success, false on failure (error logged)
 */
template <typename T>
bool writeGeoTiff(const std::string& path, const Raster<T>& raster,
                  CellType type);

/// Write with an explicit GDALDataType and driver name (used by mosaicking).
bool writeElevation(const std::string& path, const ElevationRaster& raster,
                    int gdal_type, const std::string& driver = "GTiff");

}  // namespace hydrodem::io

#endif  // HYDRODEM_IO_RASTER_HPP
