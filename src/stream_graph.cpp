// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "hydrodem/topology/stream_graph.hpp"

namespace hydrodem {

StreamGraph StreamGraph::fromLines(const std::vector<LineString>& lines) {
  StreamGraph graph;
  for (const auto& line : lines) {
    for (std::size_t i = 0; i < line.size(); ++i) {
      graph.addNode(line[i]);
      if (i > 0) graph.addEdge(line[i - 1], line[i]);
    }
  }
  return graph;
}

StreamGraph::NodeId StreamGraph::addNode(const Point2& p) {
  auto [it, inserted] = index_.emplace(p, nodes_.size());
  if (inserted) {
    nodes_.push_back(p);
    predecessors_.emplace_back();
    successors_.emplace_back();
  }
  return it->second;
}

void StreamGraph::addEdge(const Point2& from, const Point2& to) {
  const NodeId u = addNode(from);
  const NodeId v = addNode(to);
  if (u == v) return;
  successors_[u].insert(v);
  predecessors_[v].insert(u);
}

std::size_t StreamGraph::edgeCount() const {
  std::size_t count = 0;
  for (const auto& s : successors_) count += s.size();
  return count;
}

}  // namespace hydrodem
