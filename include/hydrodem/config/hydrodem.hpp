// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef HYDRODEM_CONFIG_HYDRODEM_HPP
#define HYDRODEM_CONFIG_HYDRODEM_HPP

#include <string>

namespace YAML {
class Node;
}

#include "hydrodem/config/acquisition.hpp"
#include "hydrodem/config/delineation.hpp"
#include "hydrodem/config/hydrology.hpp"
#include "hydrodem/config/outputs.hpp"
#include "hydrodem/geometry.hpp"

namespace hydrodem {

/// Pipeline configuration for one workflow run. Resolved once at startup.
struct Config {
  std::string project_dir = "project";
  BoundingBox bbox{-90.0, 30.0, -89.0, 31.0};
  config::Acquisition acquisition;
  config::Hydrology hydrology;
  config::Delineation delineation;
  config::Outputs outputs;
  config::Logging logging;
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

}  // namespace hydrodem

#endif  // HYDRODEM_CONFIG_HYDRODEM_HPP
