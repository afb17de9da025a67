// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * tile_source.hpp
 *
 * Elevation tile source interface and implementations.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_ACQUISITION_TILE_SOURCE_HPP
#define HYDRODEM_ACQUISITION_TILE_SOURCE_HPP

#include <memory>
#include <string>
#include <vector>

#include "hydrodem/config/acquisition.hpp"
#include "hydrodem/geometry.hpp"

namespace hydrodem {

/**
 * @brief Elevation tile provider.
 *
 * Semantic: "Which raster files cover this box?"
 * Implementations may write tiles into the output directory. An empty
 * result means no coverage; I/O or network failures throw.
 */
class TileSource {
 public:
  using Ptr = std::shared_ptr<TileSource>;

  virtual ~TileSource() = default;

  /**
   * @param bbox WGS84 bounding box
   * @param resolution Target resolution [m]
   * @param output_dir Directory for downloaded tiles (exists)
   * @return Paths of GDAL-readable rasters, possibly empty
   */
  virtual std::vector<std::string> fetch(const BoundingBox& bbox,
                                         int resolution,
                                         const std::string& output_dir) = 0;

  /// Short name for logs (e.g., "3dep")
  virtual std::string name() const = 0;
};

/**
 * @brief USGS 3DEP seamless DEM read through GDAL's /vsicurl/.
 *
 * The box is cut out of the national VRT of the requested resolution and
 * written as GeoTIFF tiles of at most max_tile_size pixels per side.
 */
class ThreeDepSource : public TileSource {
 public:
  explicit ThreeDepSource(const config::Acquisition& cfg);

  std::vector<std::string> fetch(const BoundingBox& bbox, int resolution,
                                 const std::string& output_dir) override;
  std::string name() const override { return "3dep"; }

  /// VRT location for a resolution; empty if the product does not exist
  std::string productUrl(int resolution) const;

 private:
  std::string base_url_;
  int max_tile_size_;
};

/**
 * @brief Pre-downloaded tiles in a local directory.
 *
 * Returns the *.tif / *.tiff files whose footprint intersects the box, in
 * lexicographic path order. Resolution is not checked.
 */
class DirectorySource : public TileSource {
 public:
  explicit DirectorySource(std::string directory);

  std::vector<std::string> fetch(const BoundingBox& bbox, int resolution,
                                 const std::string& output_dir) override;
  std::string name() const override { return "directory"; }

 private:
  std::string directory_;
};

/// Build the configured tile source.
std::unique_ptr<TileSource> createTileSource(const config::Acquisition& cfg);

}  // namespace hydrodem

#endif  // HYDRODEM_ACQUISITION_TILE_SOURCE_HPP
