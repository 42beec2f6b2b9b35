#include "graph.hpp"

NodeID Graph::addNode(const std::string &key, double lat, double lon) {
  auto it = key_map_.find(key);
  if (it != key_map_.end())
    return it->second;

  Node node;
  node.id = static_cast<NodeID>(nodes_.size());
  node.key = key;
  node.lat = lat;
  node.lon = lon;
  key_map_[key] = node.id;
  nodes_.push_back(node);
  return node.id;
}

void Graph::setEdge(NodeID from, NodeID to, Weight weight) {
  auto &outgoing = nodes_[from].outgoing;
  for (auto &edge : outgoing) {
    if (edge.to == to) {
      edge.weight = weight;
      return;
    }
  }
  outgoing.push_back({to, weight});
}

const Edge *Graph::findEdge(NodeID from, NodeID to) const {
  if (!hasNode(from))
    return nullptr;
  for (const auto &edge : nodes_[from].outgoing) {
    if (edge.to == to)
      return &edge;
  }
  return nullptr;
}

const Node *Graph::GetNode(NodeID id) const {
  if (!hasNode(id))
    return nullptr;
  return &nodes_[id];
}

const std::vector<Node> &Graph::GetNodes() const { return nodes_; }

NodeID Graph::getNodeId(const std::string &key) const {
  auto it = key_map_.find(key);
  if (it != key_map_.end())
    return it->second;
  return -1;
}

size_t Graph::edgeCount() const {
  size_t count = 0;
  for (const auto &node : nodes_)
    count += node.outgoing.size();
  return count;
}

void Graph::clear() {
  nodes_.clear();
  key_map_.clear();
}

void Graph::swap(Graph &other) {
  nodes_.swap(other.nodes_);
  key_map_.swap(other.key_map_);
}
