#ifndef WALKING_NETWORK_HPP
#define WALKING_NETWORK_HPP

#include "dataset.hpp"
#include "graph.hpp"
#include "spatial_grid.hpp"
#include "walking_grid.hpp"
#include <memory>
#include <vector>

struct NearestNode {
  NodeID id = -1;
  double distance = INF;

  bool found() const { return id != -1; }
};

// Street-level pedestrian graph. Times are computed once per origin and then
// looked up per point.
class WalkingNetwork {
public:
  explicit WalkingNetwork(double walkSpeed = WALK_SPEED_MPS);

  // Replaces the network. On DataError the previous network is kept.
  void load(const GraphDataset &dataset);
  void clear();

  bool isLoaded() const { return loaded_; }
  bool isEnabled() const { return enabled_; }
  void setEnabled(bool enabled) { enabled_ = enabled; }
  // Loaded, enabled and holding times for the current origin.
  bool isActive() const { return loaded_ && enabled_ && reached_ > 0; }

  // Closest node strictly within maxSearchMeters, searching outward in rings
  // one cell wide.
  NearestNode findNearestNode(double lat, double lon,
                              double maxSearchMeters) const;

  // Bounded Dijkstra from the node nearest the origin. Repeated calls for the
  // same origin (within ORIGIN_EPSILON_DEG) reuse the cached times. Returns
  // false when the network is unavailable or no node is near the origin.
  bool computeFromOrigin(double lat, double lon);

  // Walking seconds to (lat, lon), or INF when unknown.
  double getWalkingTime(double lat, double lon) const;

  // Samples getWalkingTime at size x size cell centers over bounds.
  std::shared_ptr<WalkingGrid> sampleGrid(const Bounds &bounds,
                                          int size = WALKING_GRID_SIZE) const;

  size_t nodeCount() const { return graph_.nodeCount(); }
  size_t reachedCount() const { return reached_; }
  const Graph &graph() const { return graph_; }

private:
  double walkSpeed_;
  Graph graph_;
  SpatialGrid<NodeID> grid_;
  std::vector<double> times_; // per node, INF when not reached
  size_t reached_ = 0;
  bool loaded_ = false;
  bool enabled_ = true;
  bool hasOrigin_ = false;
  GeoPoint origin_{0, 0};
};

#endif // WALKING_NETWORK_HPP
