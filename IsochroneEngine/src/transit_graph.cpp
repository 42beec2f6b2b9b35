#include "transit_graph.hpp"
#include "errors.hpp"
#include <cmath>
#include <iostream>
#include <unordered_map>
#include <utility>

namespace {
bool validCoordinate(double lat, double lon) {
  return std::isfinite(lat) && std::isfinite(lon) && lat >= -90.0 &&
         lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}
} // namespace

TransitGraph::TransitGraph() : station_index_(STATION_CELL_SIZE) {}

NodeID TransitGraph::addNode(const std::string &key, double lat, double lon) {
  NodeID existing = graph_.getNodeId(key);
  if (existing != -1)
    return existing;

  NodeID id = graph_.addNode(key, lat, lon);
  stations_.push_back({id, lat, lon});
  station_index_.insert(lat, lon, id);
  return id;
}

bool TransitGraph::addEdge(NodeID a, NodeID b, double speedMetersPerSecond) {
  if (!(speedMetersPerSecond > 0.0) || !std::isfinite(speedMetersPerSecond))
    throw ConfigurationError("addEdge: speed must be positive");
  const Node *n1 = graph_.GetNode(a);
  const Node *n2 = graph_.GetNode(b);
  if (!n1 || !n2)
    return false;

  double dist = haversine(n1->lat, n1->lon, n2->lat, n2->lon);
  double time = dist / speedMetersPerSecond;
  graph_.setEdge(a, b, time);
  graph_.setEdge(b, a, time);
  return true;
}

bool TransitGraph::addWeightedEdge(NodeID a, NodeID b, double weightSeconds,
                                   bool directed) {
  if (!std::isfinite(weightSeconds) || weightSeconds < 0.0)
    throw ConfigurationError("addWeightedEdge: weight must be finite and >= 0");
  if (!graph_.hasNode(a) || !graph_.hasNode(b))
    return false;

  graph_.setEdge(a, b, weightSeconds);
  if (!directed)
    graph_.setEdge(b, a, weightSeconds);
  return true;
}

int TransitGraph::generateTransferEdges(double distanceThresholdMeters) {
  if (!(distanceThresholdMeters > 0.0))
    throw ConfigurationError("generateTransferEdges: threshold must be positive");

  // --- Spatial Grid Index (cell = threshold) ---
  SpatialGrid<NodeID> grid(distanceThresholdMeters);
  const auto &nodes = graph_.GetNodes();
  for (const auto &node : nodes)
    grid.insert(node.lat, node.lon, node.id);

  // Every node scans the cells around its own (a superset of the 3x3
  // neighborhood); both directions are produced when each end is visited.
  int edgesAdded = 0;
  for (size_t i = 0; i < nodes.size(); ++i) {
    const double lat = nodes[i].lat;
    const double lon = nodes[i].lon;
    const NodeID from = static_cast<NodeID>(i);

    for (NodeID to : grid.queryRadius(lat, lon, distanceThresholdMeters)) {
      if (to == from)
        continue;
      const Node &other = nodes[to];
      double dist = haversine(lat, lon, other.lat, other.lon);
      if (dist > distanceThresholdMeters)
        continue;

      double walkTime = dist / WALK_SPEED_MPS;
      const Edge *existing = graph_.findEdge(from, to);
      if (!existing || existing->weight > walkTime) {
        graph_.setEdge(from, to, walkTime);
        edgesAdded++;
      }
    }
  }

  std::cout << "[TransitGraph] Generated " << edgesAdded
            << " transfer edges (threshold " << distanceThresholdMeters
            << "m)." << std::endl;
  return edgesAdded;
}

std::vector<EntryNode> TransitGraph::findEntryNodes(double lat, double lon,
                                                    double radiusMeters,
                                                    double walkSpeed) const {
  if (radiusMeters < 0.0)
    throw ConfigurationError("findEntryNodes: negative radius");
  if (!(walkSpeed > 0.0))
    throw ConfigurationError("findEntryNodes: walk speed must be positive");

  std::vector<EntryNode> entries;
  for (NodeID id : station_index_.queryRadius(lat, lon, radiusMeters)) {
    const Node *node = graph_.GetNode(id);
    double dist = haversine(lat, lon, node->lat, node->lon);
    if (dist < radiusMeters)
      entries.push_back({id, dist / walkSpeed});
  }
  return entries;
}

void TransitGraph::loadDataset(const GraphDataset &dataset,
                               EdgeDirection direction) {
  // Validate everything first so a bad dataset never lands half-applied.
  for (const auto &n : dataset.nodes) {
    if (n.key.empty())
      throw DataError("transit dataset: node with empty id");
    if (!validCoordinate(n.lat, n.lon))
      throw DataError("transit dataset: invalid coordinates for node " + n.key);
  }
  for (const auto &e : dataset.edges) {
    if (e.from >= dataset.nodes.size() || e.to >= dataset.nodes.size())
      throw DataError("transit dataset: edge references a missing node");
    if (!std::isfinite(e.seconds) || e.seconds < 0.0)
      throw DataError("transit dataset: edge weight must be finite and >= 0");
  }

  std::vector<NodeID> ids;
  ids.reserve(dataset.nodes.size());
  for (const auto &n : dataset.nodes)
    ids.push_back(addNode(n.key, n.lat, n.lon));

  const bool directed = direction == EdgeDirection::Directed;
  for (const auto &e : dataset.edges)
    addWeightedEdge(ids[e.from], ids[e.to], e.seconds, directed);

  std::cout << "[TransitGraph] Loaded " << dataset.nodes.size() << " nodes, "
            << dataset.edges.size() << " " << directionToString(direction)
            << " edges (" << graph_.nodeCount() << " stations total)."
            << std::endl;
}

void TransitGraph::loadRouteRelations(const RouteTopology &topology) {
  for (const auto &n : topology.nodes) {
    if (!validCoordinate(n.lat, n.lon))
      throw DataError("route relations: invalid coordinates for node " + n.key);
  }

  std::unordered_map<std::string, const DatasetNode *> byKey;
  for (const auto &n : topology.nodes)
    byKey[n.key] = &n;

  int edgeCount = 0;
  for (const auto &route : topology.routes) {
    NodeID previous = -1;
    for (const auto &key : route) {
      auto it = byKey.find(key);
      if (it == byKey.end())
        continue;
      NodeID current = addNode(key, it->second->lat, it->second->lon);
      if (previous != -1 && previous != current) {
        addEdge(previous, current, TRANSIT_SPEED_MPS);
        edgeCount++;
      }
      previous = current;
    }
  }

  std::cout << "[TransitGraph] Built " << edgeCount << " route edges from "
            << topology.routes.size() << " relations." << std::endl;
}

void TransitGraph::clear() {
  graph_.clear();
  stations_.clear();
  station_index_.clear();
}

void TransitGraph::swap(TransitGraph &other) {
  graph_.swap(other.graph_);
  stations_.swap(other.stations_);
  std::swap(station_index_, other.station_index_);
}
