#ifndef NETWORK_PROPAGATOR_HPP
#define NETWORK_PROPAGATOR_HPP

#include "transit_graph.hpp"
#include <unordered_map>
#include <vector>

// Earliest arrival (seconds) per reached node. A missing key is unreachable.
using NetworkTimes = std::unordered_map<NodeID, double>;

class NetworkTimePropagator {
public:
  // Multi-source Dijkstra. Each entry is seeded with walkSeconds plus the
  // one-off transferPenalty; every traversed edge costs its weight plus
  // stopPenalty.
  static NetworkTimes Propagate(const TransitGraph &graph,
                                const std::vector<EntryNode> &entries,
                                double transferPenalty = TRANSFER_PENALTY,
                                double stopPenalty = STOP_PENALTY);
};

#endif // NETWORK_PROPAGATOR_HPP
