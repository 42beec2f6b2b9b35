#ifndef TRANSIT_GRAPH_HPP
#define TRANSIT_GRAPH_HPP

#include "dataset.hpp"
#include "graph.hpp"
#include "spatial_grid.hpp"
#include <string>
#include <vector>

// Station exposed to the rasterizer.
struct StationEntry {
  NodeID id;
  double lat;
  double lon;
};

class TransitGraph {
public:
  TransitGraph();

  // Idempotent: a duplicate key returns the existing node unchanged.
  NodeID addNode(const std::string &key, double lat, double lon);

  // Edge weighted by haversine distance / speed, set in both directions.
  // Returns false when either node is unknown.
  bool addEdge(NodeID a, NodeID b, double speedMetersPerSecond);

  // Edge with a precomputed travel time, for time-weighted datasets.
  bool addWeightedEdge(NodeID a, NodeID b, double weightSeconds,
                       bool directed);

  // Adds walking edges (WALK_SPEED_MPS) between stations closer than the
  // threshold unless a faster edge already exists. Returns the number of
  // directed edges added or improved.
  int generateTransferEdges(double distanceThresholdMeters = TRANSFER_DISTANCE);

  // Stations strictly within radiusMeters of (lat, lon), with walk-in times.
  std::vector<EntryNode> findEntryNodes(double lat, double lon,
                                        double radiusMeters = ENTRY_RADIUS,
                                        double walkSpeed = WALK_SPEED_MPS) const;

  // Merges a time-weighted dataset. The dataset is validated before anything
  // is added; DataError leaves the graph untouched.
  void loadDataset(const GraphDataset &dataset, EdgeDirection direction);

  // Chains consecutive route members at TRANSIT_SPEED_MPS.
  void loadRouteRelations(const RouteTopology &topology);

  void clear();
  void swap(TransitGraph &other);

  const Graph &graph() const { return graph_; }
  const std::vector<StationEntry> &stations() const { return stations_; }
  size_t nodeCount() const { return graph_.nodeCount(); }
  size_t edgeCount() const { return graph_.edgeCount(); }
  bool empty() const { return graph_.empty(); }

private:
  Graph graph_;
  std::vector<StationEntry> stations_;
  SpatialGrid<NodeID> station_index_;
};

#endif // TRANSIT_GRAPH_HPP
