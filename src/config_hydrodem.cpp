// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_hydrodem.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "hydrodem/config/hydrodem.hpp"

namespace hydrodem {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

TileSourceType parseTileSource(const std::string& type) {
  if (type == "3dep" || type == "usgs") return TileSourceType::ThreeDep;
  if (type == "directory" || type == "local") return TileSourceType::Directory;
  spdlog::warn("[Config] Unknown acquisition.source '{}', defaulting to 3dep",
               type);
  return TileSourceType::ThreeDep;
}

BoundingBox parseBoundingBox(const YAML::Node& node) {
  if (!node.IsSequence() || node.size() != 4) {
    throw std::invalid_argument(
        "bbox must be a sequence [min_lon, min_lat, max_lon, max_lat]");
  }
  return {node[0].as<double>(), node[1].as<double>(), node[2].as<double>(),
          node[3].as<double>()};
}

Config parse(const YAML::Node& root) {
  Config cfg;

  load(root, "project_dir", cfg.project_dir);
  if (auto n = root["bbox"]) cfg.bbox = parseBoundingBox(n);

  if (auto n = root["acquisition"]) {
    auto& a = cfg.acquisition;
    std::string source_str;
    load(n, "source", source_str);
    if (!source_str.empty()) a.source = parseTileSource(source_str);
    load(n, "resolution", a.resolution);
    load(n, "max_tile_size", a.max_tile_size);
    load(n, "tile_directory", a.tile_directory);
    load(n, "base_url", a.base_url);
  }

  if (auto n = root["hydrology"]) {
    load(n, "stream_threshold", cfg.hydrology.stream_threshold);
  }

  if (auto n = root["delineation"]) {
    load(n, "snap_radius", cfg.delineation.snap_radius);
    load(n, "eight_connected", cfg.delineation.eight_connected);
  }

  // Output layout (file names relative to project_dir)
  if (auto n = root["outputs"]) {
    auto& o = cfg.outputs;
    load(n, "input_dem_dir", o.input_dem_dir);
    load(n, "merged_dem", o.merged_dem);
    load(n, "hydrology_dir", o.hydrology_dir);
    load(n, "flow_accumulation", o.flow_accumulation);
    load(n, "flow_direction", o.flow_direction);
    load(n, "stream_network", o.stream_network);
    load(n, "pour_points", o.pour_points);
    load(n, "sub_catchments", o.sub_catchments);
  }

  if (auto n = root["logging"]) {
    load(n, "level", cfg.logging.level);
    load(n, "directory", cfg.logging.directory);
    load(n, "file", cfg.logging.file);
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: values the pipeline cannot run with ---
  if (cfg.project_dir.empty()) {
    throw std::invalid_argument("project_dir must not be empty");
  }
  if (auto reason = cfg.bbox.validate(); !reason.empty()) {
    throw std::invalid_argument("bbox: " + reason);
  }

  const auto& a = cfg.acquisition;
  if (a.source == TileSourceType::ThreeDep && a.resolution != 10 &&
      a.resolution != 30 && a.resolution != 60) {
    throw std::invalid_argument(
        "acquisition.resolution (" + std::to_string(a.resolution) +
        ") must be 10, 30 or 60 for the 3dep source");
  }
  if (a.source == TileSourceType::Directory && a.tile_directory.empty()) {
    throw std::invalid_argument(
        "acquisition.tile_directory is required for the directory source");
  }

  const auto& o = cfg.outputs;
  const std::vector<std::pair<const char*, const std::string*>> names = {
      {"merged_dem", &o.merged_dem},
      {"flow_accumulation", &o.flow_accumulation},
      {"flow_direction", &o.flow_direction},
      {"stream_network", &o.stream_network},
      {"pour_points", &o.pour_points},
      {"sub_catchments", &o.sub_catchments}};
  for (const auto& [key, value] : names) {
    if (value->empty()) {
      throw std::invalid_argument(std::string("outputs.") + key +
                                  " must not be empty");
    }
  }

  // --- Non-fatal: warn and clamp ---
  auto& acq = cfg.acquisition;
  if (acq.max_tile_size < 256) {
    spdlog::warn(
        "[Config] acquisition.max_tile_size ({}) must be >= 256, clamping",
        acq.max_tile_size);
    acq.max_tile_size = 256;
  }
  if (cfg.delineation.snap_radius < 0) {
    spdlog::warn("[Config] delineation.snap_radius ({}) must be >= 0, "
                 "clamping to 0 (unbounded)",
                 cfg.delineation.snap_radius);
    cfg.delineation.snap_radius = 0;
  }

  static const std::vector<std::string> levels = {
      "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
  if (std::find(levels.begin(), levels.end(), cfg.logging.level) ==
      levels.end()) {
    spdlog::warn("[Config] Unknown logging.level '{}', defaulting to info",
                 cfg.logging.level);
    cfg.logging.level = "info";
  }
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace hydrodem
