// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * d8.hpp
 *
 * D8 direction encoding (ESRI power-of-two codes).
 */

#ifndef HYDRODEM_HYDROLOGY_D8_HPP
#define HYDRODEM_HYDROLOGY_D8_HPP

#include <array>
#include <cstdint>

namespace hydrodem::d8 {

constexpr std::uint8_t kNoFlow = 0;     ///< Pit or unresolved cell
constexpr std::uint8_t kNoData = 255;   ///< Outside the DEM footprint

/// Neighbour order: E, SE, S, SW, W, NW, N, NE
constexpr std::array<std::uint8_t, 8> kCodes = {1, 2, 4, 8, 16, 32, 64, 128};
constexpr std::array<int, 8> kRowOffset = {0, 1, 1, 1, 0, -1, -1, -1};
constexpr std::array<int, 8> kColOffset = {1, 1, 0, -1, -1, -1, 0, 1};

/// Index into the neighbour arrays for a code, -1 if not a direction
constexpr int indexOf(std::uint8_t code) {
  for (int i = 0; i < 8; ++i) {
    if (kCodes[i] == code) return i;
  }
  return -1;
}

/// Index of the neighbour pointing back at the centre cell
constexpr int opposite(int index) { return (index + 4) % 8; }

constexpr bool isDiagonal(int index) { return index % 2 == 1; }

}  // namespace hydrodem::d8

#endif  // HYDRODEM_HYDROLOGY_D8_HPP
