// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * acquisition.hpp
 *
 * Elevation acquisition configuration: tile source and target resolution.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_CONFIG_ACQUISITION_HPP
#define HYDRODEM_CONFIG_ACQUISITION_HPP

#include <string>

namespace hydrodem {

/// Where elevation tiles come from.
enum class TileSourceType {
  ThreeDep,  ///< USGS 3DEP seamless DEM (network, via GDAL /vsicurl/)
  Directory  ///< Pre-downloaded GeoTIFF tiles in a local directory
};

namespace config {

/**
 * @brief Elevation acquisition parameters.
 */
struct Acquisition {
  TileSourceType source = TileSourceType::ThreeDep;
  int resolution = 10;        ///< Target resolution [m] (3DEP: 10, 30, 60)
  int max_tile_size = 4096;   ///< Max tile width/height [pixels]
  std::string tile_directory; ///< Used by the directory source
  std::string base_url =
      "https://prd-tnm.s3.amazonaws.com/StagedProducts/Elevation";
};

}  // namespace config
}  // namespace hydrodem

#endif  // HYDRODEM_CONFIG_ACQUISITION_HPP
