#ifndef GRAPH_HPP
#define GRAPH_HPP

#include "types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

// Arena of nodes indexed by NodeID. Neighbors are stored as ids, so the graph
// owns every node and holds no references between them.
class Graph {
public:
  // Returns the id of the node with this key, adding it when it is new.
  NodeID addNode(const std::string &key, double lat, double lon);

  // Sets the directed edge from -> to, replacing any previous weight.
  void setEdge(NodeID from, NodeID to, Weight weight);
  const Edge *findEdge(NodeID from, NodeID to) const;

  const Node *GetNode(NodeID id) const;
  const std::vector<Node> &GetNodes() const;
  NodeID getNodeId(const std::string &key) const;

  size_t nodeCount() const { return nodes_.size(); }
  size_t edgeCount() const;
  bool empty() const { return nodes_.empty(); }
  bool hasNode(NodeID id) const {
    return id >= 0 && id < static_cast<NodeID>(nodes_.size());
  }

  void clear();
  void swap(Graph &other);

private:
  std::vector<Node> nodes_;
  std::unordered_map<std::string, NodeID> key_map_;
};

#endif // GRAPH_HPP
