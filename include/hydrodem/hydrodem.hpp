// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef HYDRODEM_HYDRODEM_HPP
#define HYDRODEM_HYDRODEM_HPP

// Configs
#include "hydrodem/config/hydrodem.hpp"

// Data types
#include "hydrodem/geometry.hpp"
#include "hydrodem/raster.hpp"

// Stages
#include "hydrodem/acquisition/acquisition.hpp"
#include "hydrodem/acquisition/tile_source.hpp"
#include "hydrodem/delineation/catchment.hpp"
#include "hydrodem/delineation/catchment_delineator.hpp"
#include "hydrodem/hydrology/conditioning.hpp"
#include "hydrodem/hydrology/flow_routing.hpp"
#include "hydrodem/hydrology/hydrology_engine.hpp"
#include "hydrodem/hydrology/stream_extraction.hpp"
#include "hydrodem/topology/pour_points.hpp"
#include "hydrodem/topology/stream_graph.hpp"

// Orchestration
#include "hydrodem/workflow.hpp"

#endif  // HYDRODEM_HYDRODEM_HPP
