// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_vector.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/io/vector.hpp"

#include <gdal_priv.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <ogrsf_frmts.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <functional>
#include <memory>

#include "hydrodem/io/raster.hpp"

namespace fs = std::filesystem;

namespace hydrodem::io {

namespace detail {

OGRLinearRing toRing(const Ring& ring) {
  OGRLinearRing out;
  for (const auto& p : ring) out.addPoint(p.x, p.y);
  out.closeRings();
  return out;
}

/**
 * @brief Create a GeoPackage with one layer and fill it.
 *
 * @param fill Called once with the created layer; returns false on failure
 */
bool writeLayer(const std::string& path, OGRwkbGeometryType geometry_type,
                const std::string& crs,
                const std::function<bool(OGRLayer&)>& fill) {
  initGdal();
  auto* driver = GetGDALDriverManager()->GetDriverByName("GPKG");
  if (!driver) {
    spdlog::error("[vector_io] GPKG driver not available");
    return false;
  }

  std::error_code ec;
  fs::remove(path, ec);

  GDALDatasetUniquePtr dataset(
      driver->Create(path.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
  if (!dataset) {
    spdlog::error("[vector_io] Failed to create: {}", path);
    return false;
  }

  std::unique_ptr<OGRSpatialReference> srs;
  if (!crs.empty()) {
    srs = std::make_unique<OGRSpatialReference>();
    if (srs->importFromWkt(crs.c_str()) != OGRERR_NONE) {
      spdlog::warn("[vector_io] Unparseable CRS, writing {} without one",
                   path);
      srs.reset();
    }
  }

  const std::string layer_name = fs::path(path).stem().string();
  OGRLayer* layer = dataset->CreateLayer(layer_name.c_str(), srs.get(),
                                         geometry_type, nullptr);
  if (!layer) {
    spdlog::error("[vector_io] Failed to create layer '{}' in {}", layer_name,
                  path);
    return false;
  }

  const bool transaction = layer->StartTransaction() == OGRERR_NONE;
  if (!transaction) {
    spdlog::debug("[vector_io] Transactions unsupported for {}", path);
  }
  if (!fill(*layer)) {
    if (transaction) layer->RollbackTransaction();
    spdlog::error("[vector_io] Failed to write features to {}", path);
    return false;
  }
  if (transaction && layer->CommitTransaction() != OGRERR_NONE) {
    spdlog::error("[vector_io] Failed to commit features to {}", path);
    return false;
  }
  return true;
}

bool addFeature(OGRLayer& layer, const OGRGeometry& geometry) {
  OGRFeatureUniquePtr feature(OGRFeature::CreateFeature(layer.GetLayerDefn()));
  feature->SetGeometry(&geometry);
  return layer.CreateFeature(feature.get()) == OGRERR_NONE;
}

}  // namespace detail

bool writeLineStrings(const std::string& path,
                      const std::vector<LineString>& lines,
                      const std::string& crs) {
  return detail::writeLayer(path, wkbLineString, crs, [&](OGRLayer& layer) {
    for (const auto& line : lines) {
      OGRLineString geometry;
      for (const auto& p : line) geometry.addPoint(p.x, p.y);
      if (!detail::addFeature(layer, geometry)) return false;
    }
    return true;
  });
}

bool writePoints(const std::string& path,
                 const std::vector<AttributedPoint>& points,
                 const std::string& field_name, const std::string& crs) {
  return detail::writeLayer(path, wkbPoint, crs, [&](OGRLayer& layer) {
    OGRFieldDefn field(field_name.c_str(), OFTString);
    if (layer.CreateField(&field) != OGRERR_NONE) return false;

    for (const auto& point : points) {
      OGRFeatureUniquePtr feature(
          OGRFeature::CreateFeature(layer.GetLayerDefn()));
      feature->SetField(field_name.c_str(), point.value.c_str());
      OGRPoint geometry(point.location.x, point.location.y);
      feature->SetGeometry(&geometry);
      if (layer.CreateFeature(feature.get()) != OGRERR_NONE) return false;
    }
    return true;
  });
}

bool writePolygons(const std::string& path,
                   const std::vector<Polygon>& polygons,
                   const std::string& crs) {
  return detail::writeLayer(path, wkbPolygon, crs, [&](OGRLayer& layer) {
    for (const auto& polygon : polygons) {
      OGRPolygon geometry;
      auto exterior = detail::toRing(polygon.exterior);
      geometry.addRing(&exterior);
      for (const auto& hole : polygon.holes) {
        auto ring = detail::toRing(hole);
        geometry.addRing(&ring);
      }
      if (!detail::addFeature(layer, geometry)) return false;
    }
    return true;
  });
}

std::vector<LineString> readLineStrings(const std::string& path) {
  initGdal();
  GDALDatasetUniquePtr dataset(GDALDataset::Open(
      path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr,
      nullptr));
  if (!dataset || dataset->GetLayerCount() < 1) {
    spdlog::error("[vector_io] Failed to open: {}", path);
    return {};
  }

  std::vector<LineString> lines;
  OGRLayer* layer = dataset->GetLayer(0);
  layer->ResetReading();
  for (auto& feature : *layer) {
    const OGRGeometry* geometry = feature->GetGeometryRef();
    if (!geometry ||
        wkbFlatten(geometry->getGeometryType()) != wkbLineString) {
      continue;
    }
    const auto* ls = geometry->toLineString();
    LineString line;
    line.reserve(ls->getNumPoints());
    for (int i = 0; i < ls->getNumPoints(); ++i) {
      line.push_back({ls->getX(i), ls->getY(i)});
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

}  // namespace hydrodem::io
