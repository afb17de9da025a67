// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * conditioning.hpp
 *
 * DEM conditioning: depression filling and flat resolution.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_HYDROLOGY_CONDITIONING_HPP
#define HYDRODEM_HYDROLOGY_CONDITIONING_HPP

#include "hydrodem/raster.hpp"

namespace hydrodem {

/**
 * @brief Fill depressions with Priority-Flood.
 *
 * Cells on the grid border and cells next to NaN are seeds. Every filled
 * cell is raised to the lowest spill elevation on its way out, so each
 * valid cell has a non-ascending path to the border. NaN cells stay NaN.
 *
 * Reference: Barnes, Lehman & Mulla (2014), "Priority-Flood: An optimal
 * depression-filling and watershed-labeling algorithm for digital
 * elevation models".
 */
ElevationRaster fillDepressions(ElevationRaster dem);

/**
 * @brief Impose drainage on flat areas of a filled DEM.
 *
 * Every flat (connected cells of equal elevation without a lower
 * neighbour) receives a combined gradient towards its outlets and away from
 * higher terrain, added as increments small enough never to reach the next
 * higher elevation. The result drains strictly in every valid cell.
 *
 * Reference: Barnes, Lehman & Mulla (2014), "An efficient assignment of
 * drainage direction over flat surfaces in raster digital elevation models".
 *
 * @param filled Output of fillDepressions()
 * @return Conditioned surface in double precision
 */
ConditionedSurface resolveFlats(ElevationRaster filled);

}  // namespace hydrodem

#endif  // HYDRODEM_HYDROLOGY_CONDITIONING_HPP
