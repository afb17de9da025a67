// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raster.hpp
 *
 * Georeferenced raster grid shared by every pipeline stage.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_RASTER_HPP
#define HYDRODEM_RASTER_HPP

#include <Eigen/Core>
#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace hydrodem {

/**
 * @brief Affine pixel-to-world transform (GDAL coefficient order).
 *
 * x = origin_x + col * pixel_width + row * row_rotation
 * y = origin_y + col * col_rotation + row * pixel_height
 *
 * Rotation terms are carried through I/O but the grid helpers below assume
 * a north-up raster (both rotations zero).
 */
struct GeoTransform {
  double origin_x = 0.0;
  double pixel_width = 1.0;
  double row_rotation = 0.0;
  double origin_y = 0.0;
  double col_rotation = 0.0;
  double pixel_height = 1.0;  ///< Negative for north-up rasters

  static GeoTransform fromArray(const std::array<double, 6>& gt) {
    return {gt[0], gt[1], gt[2], gt[3], gt[4], gt[5]};
  }

  std::array<double, 6> toArray() const {
    return {origin_x, pixel_width, row_rotation,
            origin_y, col_rotation, pixel_height};
  }

  /// World coordinates of a cell centre
  Eigen::Vector2d cellCenter(int row, int col) const {
    return {origin_x + (col + 0.5) * pixel_width + (row + 0.5) * row_rotation,
            origin_y + (col + 0.5) * col_rotation + (row + 0.5) * pixel_height};
  }

  /// (row, col) of the cell containing a world point; may be off-grid
  std::pair<int, int> cellIndex(double x, double y) const {
    const int col = static_cast<int>(std::floor((x - origin_x) / pixel_width));
    const int row = static_cast<int>(std::floor((y - origin_y) / pixel_height));
    return {row, col};
  }

  /// Transform of a sub-window starting at (row, col)
  GeoTransform window(int row, int col) const {
    GeoTransform gt = *this;
    gt.origin_x += col * pixel_width + row * row_rotation;
    gt.origin_y += col * col_rotation + row * pixel_height;
    return gt;
  }

  bool operator==(const GeoTransform& o) const {
    return toArray() == o.toArray();
  }
  bool operator!=(const GeoTransform& o) const { return !(*this == o); }
};

/**
 * @brief Single-band raster on a georeferenced grid.
 *
 * Storage is row-major so the buffer maps directly onto GDAL scanlines.
 * Stages receive rasters by value and return new ones; a raster is never
 * modified after it leaves the stage that produced it.
 *
 * @tparam T Cell type (float elevation, uint8 direction, uint32 count)
 */
template <typename T>
class Raster {
 public:
  using Matrix =
      Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

  Raster() = default;

  Raster(int rows, int cols, const GeoTransform& transform, std::string crs,
         std::optional<T> nodata = std::nullopt)
      : data_(rows, cols),
        transform_(transform),
        crs_(std::move(crs)),
        nodata_(nodata) {}

  /// Empty raster sharing the grid (transform, CRS) of another raster
  template <typename U>
  static Raster sameGridAs(const Raster<U>& other, T fill,
                           std::optional<T> nodata = std::nullopt) {
    Raster r(other.rows(), other.cols(), other.transform(), other.crs(),
             nodata);
    r.data_.setConstant(fill);
    return r;
  }

  int rows() const { return static_cast<int>(data_.rows()); }
  int cols() const { return static_cast<int>(data_.cols()); }
  bool empty() const { return data_.size() == 0; }

  T& operator()(int row, int col) { return data_(row, col); }
  const T& operator()(int row, int col) const { return data_(row, col); }

  Matrix& data() { return data_; }
  const Matrix& data() const { return data_; }

  const GeoTransform& transform() const { return transform_; }
  const std::string& crs() const { return crs_; }
  bool isGeoreferenced() const { return !crs_.empty(); }

  const std::optional<T>& nodata() const { return nodata_; }
  void setNoData(std::optional<T> value) { nodata_ = value; }

  bool contains(int row, int col) const {
    return row >= 0 && row < rows() && col >= 0 && col < cols();
  }

  /// True for cells holding no measurement (NaN or the nodata value)
  bool isNoData(int row, int col) const {
    const T v = data_(row, col);
    if constexpr (std::is_floating_point_v<T>) {
      if (std::isnan(v)) return true;
    }
    return nodata_.has_value() && v == *nodata_;
  }

  Eigen::Vector2d cellCenter(int row, int col) const {
    return transform_.cellCenter(row, col);
  }

  std::pair<int, int> cellIndex(double x, double y) const {
    return transform_.cellIndex(x, y);
  }

  template <typename U>
  bool sameGrid(const Raster<U>& other) const {
    return rows() == other.rows() && cols() == other.cols() &&
           transform_ == other.transform();
  }

 private:
  Matrix data_;
  GeoTransform transform_;
  std::string crs_;  ///< WKT; empty when ungeoreferenced
  std::optional<T> nodata_;
};

using ElevationRaster = Raster<float>;
using ConditionedSurface = Raster<double>;
using FlowDirectionRaster = Raster<std::uint8_t>;
using AccumulationRaster = Raster<std::uint32_t>;

}  // namespace hydrodem

#endif  // HYDRODEM_RASTER_HPP
