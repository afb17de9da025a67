// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_raster.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/io/raster.hpp"

#include <cpl_string.h>
#include <gdal_priv.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <vector>

namespace hydrodem::io {

namespace detail {

GDALDataType toGdalType(CellType type) {
  switch (type) {
    case CellType::Byte:
      return GDT_Byte;
    case CellType::UInt32:
      return GDT_UInt32;
    case CellType::Float32:
      return GDT_Float32;
    case CellType::Float64:
      return GDT_Float64;
  }
  return GDT_Float32;
}

template <typename T>
GDALDataType bufferType();
template <>
GDALDataType bufferType<float>() { return GDT_Float32; }
template <>
GDALDataType bufferType<double>() { return GDT_Float64; }
template <>
GDALDataType bufferType<std::uint8_t>() { return GDT_Byte; }
template <>
GDALDataType bufferType<std::uint32_t>() { return GDT_UInt32; }

GDALDatasetUniquePtr openReadOnly(const std::string& path) {
  initGdal();
  return GDALDatasetUniquePtr(GDALDataset::Open(
      path.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY, nullptr, nullptr,
      nullptr));
}

RasterInfo describe(GDALDataset& dataset) {
  RasterInfo info;
  info.rows = dataset.GetRasterYSize();
  info.cols = dataset.GetRasterXSize();

  std::array<double, 6> gt{0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
  info.has_transform = dataset.GetGeoTransform(gt.data()) == CE_None;
  info.transform = GeoTransform::fromArray(gt);

  const char* wkt = dataset.GetProjectionRef();
  info.crs = wkt ? wkt : "";

  if (dataset.GetRasterCount() > 0) {
    auto* band = dataset.GetRasterBand(1);
    int has_nodata = 0;
    const double nodata = band->GetNoDataValue(&has_nodata);
    if (has_nodata) info.nodata = nodata;
    info.gdal_type = static_cast<int>(band->GetRasterDataType());
  }
  if (auto* driver = dataset.GetDriver()) {
    info.driver = driver->GetDescription();
  }
  return info;
}

/// Create a single-band raster file, replacing an existing one.
GDALDatasetUniquePtr createSingleBand(const std::string& path, int rows,
                                      int cols, GDALDataType type,
                                      const std::string& driver_name) {
  initGdal();
  auto* driver = GetGDALDriverManager()->GetDriverByName(driver_name.c_str());
  if (driver && !driver->GetMetadataItem(GDAL_DCAP_CREATE)) {
    spdlog::warn("[raster_io] Driver '{}' cannot create files, using GTiff",
                 driver_name);
    driver = GetGDALDriverManager()->GetDriverByName("GTiff");
  }
  if (!driver) {
    spdlog::error("[raster_io] GDAL driver '{}' not available", driver_name);
    return nullptr;
  }

  CPLStringList options;
  if (std::string(driver->GetDescription()) == "GTiff") {
    options.SetNameValue("COMPRESS", "LZW");
    options.SetNameValue("TILED", "YES");
  }
  return GDALDatasetUniquePtr(driver->Create(path.c_str(), cols, rows, 1, type,
                                             options.List()));
}

template <typename T>
bool writeBand(const std::string& path, const Raster<T>& raster,
               GDALDataType file_type, const std::string& driver_name) {
  if (raster.empty()) {
    spdlog::error("[raster_io] Refusing to write empty raster: {}", path);
    return false;
  }

  auto dataset = createSingleBand(path, raster.rows(), raster.cols(),
                                  file_type, driver_name);
  if (!dataset) {
    spdlog::error("[raster_io] Failed to create: {}", path);
    return false;
  }

  auto gt = raster.transform().toArray();
  dataset->SetGeoTransform(gt.data());
  if (raster.isGeoreferenced() &&
      dataset->SetProjection(raster.crs().c_str()) != CE_None) {
    spdlog::warn("[raster_io] Could not set CRS on {}", path);
  }

  auto* band = dataset->GetRasterBand(1);
  if (raster.nodata()) {
    band->SetNoDataValue(static_cast<double>(*raster.nodata()));
  }

  // NaN cells become the nodata value on disk
  typename Raster<T>::Matrix buffer = raster.data();
  if constexpr (std::is_floating_point_v<T>) {
    if (raster.nodata() && !std::isnan(*raster.nodata())) {
      buffer = buffer.unaryExpr([&](T v) {
        return std::isnan(v) ? *raster.nodata() : v;
      });
    }
  }

  const CPLErr err = band->RasterIO(
      GF_Write, 0, 0, raster.cols(), raster.rows(), buffer.data(),
      raster.cols(), raster.rows(), bufferType<T>(), 0, 0, nullptr);
  if (err != CE_None) {
    spdlog::error("[raster_io] Failed to write pixels: {}", path);
    return false;
  }
  return true;
}

}  // namespace detail

std::array<double, 4> RasterInfo::bounds() const {
  const double x0 = transform.origin_x;
  const double x1 = transform.origin_x + cols * transform.pixel_width;
  const double y0 = transform.origin_y;
  const double y1 = transform.origin_y + rows * transform.pixel_height;
  return {std::min(x0, x1), std::min(y0, y1), std::max(x0, x1),
          std::max(y0, y1)};
}

void initGdal() {
  static std::once_flag flag;
  std::call_once(flag, [] { GDALAllRegister(); });
}

std::optional<RasterInfo> readRasterInfo(const std::string& path) {
  auto dataset = detail::openReadOnly(path);
  if (!dataset) {
    spdlog::error("[raster_io] Failed to open: {}", path);
    return std::nullopt;
  }
  return detail::describe(*dataset);
}

std::optional<ElevationRaster> readElevation(const std::string& path) {
  auto dataset = detail::openReadOnly(path);
  if (!dataset) {
    spdlog::error("[raster_io] Failed to open: {}", path);
    return std::nullopt;
  }
  if (dataset->GetRasterCount() < 1) {
    spdlog::error("[raster_io] No raster band in: {}", path);
    return std::nullopt;
  }

  const auto info = detail::describe(*dataset);
  if (!info.has_transform) {
    spdlog::warn("[raster_io] {} has no geotransform, using pixel coordinates",
                 path);
  }
  if (info.crs.empty()) {
    spdlog::warn("[raster_io] {} has no CRS, outputs will be ungeoreferenced",
                 path);
  }

  std::optional<float> nodata;
  if (info.nodata) nodata = static_cast<float>(*info.nodata);
  ElevationRaster dem(info.rows, info.cols, info.transform, info.crs,
                      std::optional<float>(NAN));

  auto* band = dataset->GetRasterBand(1);
  const CPLErr err = band->RasterIO(GF_Read, 0, 0, info.cols, info.rows,
                                    dem.data().data(), info.cols, info.rows,
                                    GDT_Float32, 0, 0, nullptr);
  if (err != CE_None) {
    spdlog::error("[raster_io] Failed to read pixels: {}", path);
    return std::nullopt;
  }

  if (nodata && !std::isnan(*nodata)) {
    const float nd = *nodata;
    dem.data() = dem.data().unaryExpr(
        [nd](float v) { return v == nd ? NAN : v; });
  }
  return dem;
}

template <typename T>
bool writeGeoTiff(const std::string& path, const Raster<T>& raster,
                  CellType type) {
  return detail::writeBand(path, raster, detail::toGdalType(type), "GTiff");
}

bool writeElevation(const std::string& path, const ElevationRaster& raster,
                    int gdal_type, const std::string& driver) {
  return detail::writeBand(path, raster, static_cast<GDALDataType>(gdal_type),
                           driver);
}

template bool writeGeoTiff(const std::string&, const Raster<float>&, CellType);
template bool writeGeoTiff(const std::string&, const Raster<double>&,
                           CellType);
template bool writeGeoTiff(const std::string&, const Raster<std::uint8_t>&,
                           CellType);
template bool writeGeoTiff(const std::string&, const Raster<std::uint32_t>&,
                           CellType);

}  // namespace hydrodem::io
