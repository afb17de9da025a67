// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * pour_points.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "hydrodem/topology/pour_points.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "hydrodem/io/vector.hpp"

namespace hydrodem {

const char* toString(PointType type) {
  switch (type) {
    case PointType::Junction:
      return "JUNCTION";
    case PointType::Terminus:
      return "TERMINUS";
  }
  return "UNKNOWN";
}

std::optional<PointType> classify(const StreamGraph& graph,
                                  StreamGraph::NodeId id) {
  const std::size_t in = graph.inDegree(id);
  if (in >= 2) return PointType::Junction;
  if (in == 0) return PointType::Terminus;
  return std::nullopt;
}

std::vector<PourPoint> findPourPoints(const StreamGraph& graph) {
  std::vector<PourPoint> junctions;
  std::vector<PourPoint> termini;
  for (StreamGraph::NodeId id = 0; id < graph.nodeCount(); ++id) {
    const auto type = classify(graph, id);
    if (!type) continue;
    auto& group = *type == PointType::Junction ? junctions : termini;
    group.push_back({graph.node(id), *type});
  }

  junctions.insert(junctions.end(), termini.begin(), termini.end());
  return junctions;
}

TopologyAnalyzer::TopologyAnalyzer(std::string output_path)
    : output_path_(std::move(output_path)) {}

std::vector<PourPoint> TopologyAnalyzer::run(
    const std::vector<LineString>& streams, const std::string& crs) const {
  if (streams.empty()) {
    spdlog::warn("[Topology] No stream network available, no pour points");
    return {};
  }

  const auto graph = StreamGraph::fromLines(streams);
  auto points = findPourPoints(graph);
  if (points.empty()) {
    spdlog::warn("[Topology] No junctions or channel heads found");
    return points;
  }

  std::size_t junctions = 0;
  std::vector<io::AttributedPoint> features;
  features.reserve(points.size());
  for (const auto& p : points) {
    if (p.type == PointType::Junction) ++junctions;
    features.push_back({p.location, toString(p.type)});
  }

  if (!io::writePoints(output_path_, features, "point_type", crs)) {
    throw std::runtime_error("cannot write pour points: " + output_path_);
  }
  spdlog::info("[Topology] {} nodes, {} pour points ({} junctions, {} termini) "
               "saved: {}",
               graph.nodeCount(), points.size(), junctions,
               points.size() - junctions, output_path_);
  return points;
}

}  // namespace hydrodem
