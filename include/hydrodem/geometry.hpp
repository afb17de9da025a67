// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * geometry.hpp
 *
 * Vector geometry types for hydrodem.
 */

#ifndef HYDRODEM_GEOMETRY_HPP
#define HYDRODEM_GEOMETRY_HPP

#include <string>
#include <tuple>
#include <vector>

namespace hydrodem {

/// Planar coordinate in CRS units. Equality is exact.
struct Point2 {
  double x = 0.0;
  double y = 0.0;

  bool operator==(const Point2& o) const { return x == o.x && y == o.y; }
  bool operator!=(const Point2& o) const { return !(*this == o); }
  bool operator<(const Point2& o) const {
    return std::tie(x, y) < std::tie(o.x, o.y);
  }
};

using LineString = std::vector<Point2>;
using Ring = std::vector<Point2>;

struct Polygon {
  Ring exterior;
  std::vector<Ring> holes;
};

/// Geographic bounding box in WGS84 degrees
struct BoundingBox {
  double min_lon = 0.0;
  double min_lat = 0.0;
  double max_lon = 0.0;
  double max_lat = 0.0;

  /// Empty string when valid, otherwise the reason
  std::string validate() const {
    if (!(min_lon < max_lon)) return "min_lon must be < max_lon";
    if (!(min_lat < max_lat)) return "min_lat must be < max_lat";
    if (min_lon < -180.0 || max_lon > 180.0)
      return "longitude outside [-180, 180]";
    if (min_lat < -90.0 || max_lat > 90.0) return "latitude outside [-90, 90]";
    return {};
  }

  bool valid() const { return validate().empty(); }
};

}  // namespace hydrodem

#endif  // HYDRODEM_GEOMETRY_HPP
