// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * stream_extraction.hpp
 *
 * Vector stream network from thresholded accumulation.
 */

#ifndef HYDRODEM_HYDROLOGY_STREAM_EXTRACTION_HPP
#define HYDRODEM_HYDROLOGY_STREAM_EXTRACTION_HPP

#include <cstdint>
#include <vector>

#include "hydrodem/geometry.hpp"
#include "hydrodem/raster.hpp"

namespace hydrodem {

/**
 * @brief Trace stream reaches through cells with accumulation > threshold.
 *
 * A reach starts at a channel head (no upstream stream cell) or at a
 * junction (two or more upstream stream cells) and follows the flow
 * direction downstream. It ends at the next junction, which is included as
 * its last vertex, or where flow leaves the stream mask. Vertices are cell
 * centres ordered downstream. Reaches are emitted in row-major order of
 * their start cell.
 */
std::vector<LineString> extractStreams(const FlowDirectionRaster& directions,
                                       const AccumulationRaster& accumulation,
                                       std::uint32_t threshold);

}  // namespace hydrodem

#endif  // HYDRODEM_HYDROLOGY_STREAM_EXTRACTION_HPP
