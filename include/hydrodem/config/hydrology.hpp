// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * hydrology.hpp
 *
 * Hydrology engine configuration.
 */

#ifndef HYDRODEM_CONFIG_HYDROLOGY_HPP
#define HYDRODEM_CONFIG_HYDROLOGY_HPP

#include <cstdint>

namespace hydrodem::config {

struct Hydrology {
  /// Minimum upstream cell count for a cell to be a stream (strictly greater)
  std::uint32_t stream_threshold = 5000;
};

}  // namespace hydrodem::config

#endif  // HYDRODEM_CONFIG_HYDROLOGY_HPP
