// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * stream_graph.hpp
 *
 * Directed graph over stream network vertices.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef HYDRODEM_TOPOLOGY_STREAM_GRAPH_HPP
#define HYDRODEM_TOPOLOGY_STREAM_GRAPH_HPP

#include <cstddef>
#include <map>
#include <set>
#include <vector>

#include "hydrodem/geometry.hpp"

namespace hydrodem {

/**
 * @brief Directed graph whose nodes are distinct vertex coordinates.
 *
 * Nodes are identified by exact coordinate equality and kept in the order
 * they were first seen. Each consecutive vertex pair of a polyline adds one
 * edge in stored order; repeated edges collapse. Degrees are always counted
 * from the current edge set.
 */
class StreamGraph {
 public:
  using NodeId = std::size_t;

  StreamGraph() = default;

  /// Build from polylines (edges oriented in stored vertex order)
  static StreamGraph fromLines(const std::vector<LineString>& lines);

  /// Add a node if absent and return its id
  NodeId addNode(const Point2& p);

  /// Add a directed edge; self-loops and duplicates are ignored
  void addEdge(const Point2& from, const Point2& to);

  std::size_t nodeCount() const { return nodes_.size(); }
  std::size_t edgeCount() const;
  bool empty() const { return nodes_.empty(); }

  const Point2& node(NodeId id) const { return nodes_[id]; }
  const std::vector<Point2>& nodes() const { return nodes_; }

  std::size_t inDegree(NodeId id) const { return predecessors_[id].size(); }
  std::size_t outDegree(NodeId id) const { return successors_[id].size(); }

 private:
  std::vector<Point2> nodes_;
  std::map<Point2, NodeId> index_;
  std::vector<std::set<NodeId>> predecessors_;
  std::vector<std::set<NodeId>> successors_;
};

}  // namespace hydrodem

#endif  // HYDRODEM_TOPOLOGY_STREAM_GRAPH_HPP
