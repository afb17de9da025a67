// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * pour_points.hpp
 *
 * Junction and channel-head classification of stream graph nodes.
 */

#ifndef HYDRODEM_TOPOLOGY_POUR_POINTS_HPP
#define HYDRODEM_TOPOLOGY_POUR_POINTS_HPP

#include <optional>
#include <string>
#include <vector>

#include "hydrodem/geometry.hpp"
#include "hydrodem/topology/stream_graph.hpp"

namespace hydrodem {

enum class PointType {
  Junction,  ///< In-degree >= 2 (confluence)
  Terminus   ///< In-degree == 0 (channel head)
};

/// "JUNCTION" or "TERMINUS"
const char* toString(PointType type);

struct PourPoint {
  Point2 location;
  PointType type;
};

/// Classification of a node from its current in-degree
std::optional<PointType> classify(const StreamGraph& graph,
                                  StreamGraph::NodeId id);

/**
 * @brief Pour points of a graph: junctions first, then termini.
 *
 * Within each group nodes keep graph order. Pass-through nodes are omitted.
 */
std::vector<PourPoint> findPourPoints(const StreamGraph& graph);

/**
 * @brief Builds the graph from a stream network and persists pour points.
 */
class TopologyAnalyzer {
 public:
  explicit TopologyAnalyzer(std::string output_path);

  /**
   * @brief Classify the network's nodes and write the point layer.
   *
   * An empty network yields an empty result and writes nothing.
   *
   * @throws std::runtime_error if the point layer cannot be written
   */
  std::vector<PourPoint> run(const std::vector<LineString>& streams,
                             const std::string& crs) const;

  const std::string& outputPath() const { return output_path_; }

 private:
  std::string output_path_;
};

}  // namespace hydrodem

#endif  // HYDRODEM_TOPOLOGY_POUR_POINTS_HPP
