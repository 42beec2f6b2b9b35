#include "walking_network.hpp"
#include <algorithm>
#include "errors.hpp"
#include "priority_frontier.hpp"
#include <cmath>
#include <iostream>

WalkingNetwork::WalkingNetwork(double walkSpeed)
    : walkSpeed_(walkSpeed), grid_(WALK_CELL_SIZE) {
  if (!(walkSpeed > 0.0) || !std::isfinite(walkSpeed))
    throw ConfigurationError("WalkingNetwork: walk speed must be positive");
}

void WalkingNetwork::load(const GraphDataset &dataset) {
  for (const auto &e : dataset.edges) {
    if (e.from >= dataset.nodes.size() || e.to >= dataset.nodes.size())
      throw DataError("walking dataset: edge references a missing node");
    if (!std::isfinite(e.seconds) || e.seconds < 0.0)
      throw DataError("walking dataset: edge weight must be finite and >= 0");
  }

  Graph graph;
  SpatialGrid<NodeID> grid(WALK_CELL_SIZE);
  std::vector<NodeID> ids;
  ids.reserve(dataset.nodes.size());
  for (const auto &n : dataset.nodes) {
    if (!std::isfinite(n.lat) || !std::isfinite(n.lon) ||
        std::fabs(n.lat) > 90.0 || std::fabs(n.lon) > 180.0)
      throw DataError("walking dataset: invalid coordinates for node " + n.key);
    NodeID id = graph.addNode(n.key, n.lat, n.lon);
    if (id == static_cast<NodeID>(grid.size()))
      grid.insert(n.lat, n.lon, id);
    ids.push_back(id);
  }
  // Edges are one-way as stored; datasets list both directions explicitly.
  for (const auto &e : dataset.edges)
    graph.setEdge(ids[e.from], ids[e.to], e.seconds);

  graph_.swap(graph);
  std::swap(grid_, grid);
  times_.clear();
  reached_ = 0;
  hasOrigin_ = false;
  loaded_ = true;

  std::cout << "[Walking] Loaded " << graph_.nodeCount() << " nodes, "
            << graph_.edgeCount() << " edges." << std::endl;
}

void WalkingNetwork::clear() {
  graph_.clear();
  grid_.clear();
  times_.clear();
  reached_ = 0;
  hasOrigin_ = false;
  loaded_ = false;
}

NearestNode WalkingNetwork::findNearestNode(double lat, double lon,
                                            double maxSearchMeters) const {
  if (maxSearchMeters < 0.0)
    throw ConfigurationError("findNearestNode: negative search distance");

  NearestNode best;
  if (!loaded_ || grid_.empty())
    return best;

  // Rings are measured in meters (ring * cellSize) so the bound does not
  // depend on how cells skew with latitude. queryRadius returns every node
  // within the radius, so a hit inside the current radius is the closest.
  const auto &nodes = graph_.GetNodes();
  const double cell = grid_.cellSize();
  const int maxRing = static_cast<int>(std::ceil(maxSearchMeters / cell));
  for (int ring = 0; ring <= maxRing; ++ring) {
    const double radius = std::min(ring * cell, maxSearchMeters);
    for (NodeID id : grid_.queryRadius(lat, lon, radius)) {
      double dist = haversine(lat, lon, nodes[id].lat, nodes[id].lon);
      if (dist < maxSearchMeters && dist < best.distance) {
        best.distance = dist;
        best.id = id;
      }
    }
    if (best.found() && best.distance <= radius)
      break;
  }
  return best;
}

bool WalkingNetwork::computeFromOrigin(double lat, double lon) {
  if (!loaded_ || !enabled_)
    return false;

  if (hasOrigin_ && std::fabs(origin_.lat - lat) < ORIGIN_EPSILON_DEG &&
      std::fabs(origin_.lon - lon) < ORIGIN_EPSILON_DEG)
    return reached_ > 0;

  times_.assign(graph_.nodeCount(), INF);
  reached_ = 0;
  hasOrigin_ = true;
  origin_ = {lat, lon};

  NearestNode start = findNearestNode(lat, lon, ORIGIN_SNAP_RADIUS);
  if (!start.found()) {
    std::cerr << "[Walking] No network node near origin (" << lat << ", "
              << lon << ")." << std::endl;
    return false;
  }

  const auto &nodes = graph_.GetNodes();
  PriorityFrontier frontier;
  double startTime = start.distance / walkSpeed_;
  times_[start.id] = startTime;
  reached_ = 1;
  frontier.push(start.id, startTime);

  while (!frontier.empty()) {
    PriorityFrontier::Item top = frontier.pop();
    if (top.priority > times_[top.id])
      continue;

    for (const auto &edge : nodes[top.id].outgoing) {
      double newTime = top.priority + edge.weight;
      if (newTime > WALK_TIME_CEILING)
        continue;
      if (newTime < times_[edge.to]) {
        if (times_[edge.to] == INF)
          reached_++;
        times_[edge.to] = newTime;
        frontier.push(edge.to, newTime);
      }
    }
  }

  std::cout << "[Walking] Reached " << reached_ << " nodes from origin."
            << std::endl;
  return true;
}

double WalkingNetwork::getWalkingTime(double lat, double lon) const {
  if (!isActive())
    return INF;

  NearestNode nearest = findNearestNode(lat, lon, QUERY_SNAP_RADIUS);
  if (!nearest.found() || times_[nearest.id] == INF)
    return INF;
  return times_[nearest.id] + nearest.distance / walkSpeed_;
}

std::shared_ptr<WalkingGrid> WalkingNetwork::sampleGrid(const Bounds &bounds,
                                                        int size) const {
  if (size <= 0)
    throw ConfigurationError("sampleGrid: size must be positive");
  if (!(bounds.north > bounds.south) || !(bounds.east > bounds.west))
    throw ConfigurationError("sampleGrid: empty bounds");
  if (!isActive())
    return nullptr;

  auto grid = std::make_shared<WalkingGrid>();
  grid->size = size;
  grid->bounds = bounds;
  grid->data.assign(static_cast<size_t>(size) * size, -1.0f);

  const double latStep = (bounds.north - bounds.south) / size;
  const double lonStep = (bounds.east - bounds.west) / size;
  for (int row = 0; row < size; ++row) {
    double lat = bounds.south + (row + 0.5) * latStep;
    for (int col = 0; col < size; ++col) {
      double lon = bounds.west + (col + 0.5) * lonStep;
      double time = getWalkingTime(lat, lon);
      if (time != INF)
        grid->data[static_cast<size_t>(row) * size + col] =
            static_cast<float>(time);
    }
  }
  return grid;
}
