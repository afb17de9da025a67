// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * acquisition.hpp
 *
 * Elevation acquisition: fetch tiles, merge when more than one.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_ACQUISITION_ACQUISITION_HPP
#define HYDRODEM_ACQUISITION_ACQUISITION_HPP

#include <string>
#include <variant>
#include <vector>

#include "hydrodem/acquisition/tile_source.hpp"
#include "hydrodem/geometry.hpp"

namespace hydrodem {

/// A raster path ready for the hydrology stage.
struct Acquired {
  std::string path;
  std::size_t tile_count = 0;
  bool merged = false;  ///< True when path is a freshly written mosaic
};

/// The source returned no tiles for the box.
struct NoCoverage {};

/// Fetch or merge failed; not retried.
struct TransientFailure {
  std::string reason;
};

using AcquisitionResult = std::variant<Acquired, NoCoverage, TransientFailure>;

/**
 * @brief Merge tiles into one raster (first-wins).
 *
 * The output covers the union of all tile extents at the first tile's
 * resolution. Where tiles overlap, the first tile in order that has data
 * keeps its value. Driver, CRS, nodata and data type come from the first
 * tile.
 *
 * @throws std::runtime_error on unreadable tiles, mismatched CRS or a
 *         write failure
 */
void mosaic(const std::vector<std::string>& tiles,
            const std::string& output_path);

/**
 * @brief Fetch elevation for a box and produce a single raster path.
 *
 * One tile is used as-is; several are merged into merged_path. Every
 * exception is absorbed here and reported as TransientFailure.
 */
AcquisitionResult acquireElevation(TileSource& source, const BoundingBox& bbox,
                                   int resolution,
                                   const std::string& tile_dir,
                                   const std::string& merged_path);

}  // namespace hydrodem

#endif  // HYDRODEM_ACQUISITION_ACQUISITION_HPP
