// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * delineation.hpp
 *
 * Catchment delineation configuration.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_CONFIG_DELINEATION_HPP
#define HYDRODEM_CONFIG_DELINEATION_HPP

namespace hydrodem::config {

/**
 * @brief Snapping and polygonization parameters.
 */
struct Delineation {
  int snap_radius = 0;           ///< Max snap search radius [cells], 0 = whole grid
  bool eight_connected = false;  ///< Polygonize with 8-connectivity
};

}  // namespace hydrodem::config

#endif  // HYDRODEM_CONFIG_DELINEATION_HPP
