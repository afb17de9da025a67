// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * vector.hpp
 *
 * GeoPackage vector I/O through OGR. Each file holds one layer named
 * after the file stem; an existing file is replaced.
 */

#ifndef HYDRODEM_IO_VECTOR_HPP
#define HYDRODEM_IO_VECTOR_HPP

#include <string>
#include <vector>

#include "hydrodem/geometry.hpp"

namespace hydrodem::io {

/// Point with a single string attribute
struct AttributedPoint {
  Point2 location;
  std::string value;
};

bool writeLineStrings(const std::string& path,
                      const std::vector<LineString>& lines,
                      const std::string& crs);

bool writePoints(const std::string& path,
                 const std::vector<AttributedPoint>& points,
                 const std::string& field_name, const std::string& crs);

bool writePolygons(const std::string& path,
                   const std::vector<Polygon>& polygons,
                   const std::string& crs);

/// Read all LineString features of the first layer. Empty on failure.
std::vector<LineString> readLineStrings(const std::string& path);

}  // namespace hydrodem::io

#endif  // HYDRODEM_IO_VECTOR_HPP
