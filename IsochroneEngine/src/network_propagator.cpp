#include "network_propagator.hpp"
#include "errors.hpp"
#include "priority_frontier.hpp"
#include <cmath>

NetworkTimes NetworkTimePropagator::Propagate(
    const TransitGraph &graph, const std::vector<EntryNode> &entries,
    double transferPenalty, double stopPenalty) {
  if (!std::isfinite(transferPenalty) || transferPenalty < 0.0 ||
      !std::isfinite(stopPenalty) || stopPenalty < 0.0)
    throw ConfigurationError("Propagate: penalties must be finite and >= 0");

  const auto &nodes = graph.graph().GetNodes();
  std::vector<double> best(nodes.size(), INF);
  PriorityFrontier frontier;
  frontier.reserve(entries.size() * 2);

  for (const auto &entry : entries) {
    if (!graph.graph().hasNode(entry.id))
      continue;
    if (!std::isfinite(entry.walkSeconds) || entry.walkSeconds < 0.0)
      throw ConfigurationError("Propagate: invalid entry walk time");
    double seed = entry.walkSeconds + transferPenalty;
    if (seed < best[entry.id]) {
      best[entry.id] = seed;
      frontier.push(entry.id, seed);
    }
  }

  while (!frontier.empty()) {
    PriorityFrontier::Item top = frontier.pop();
    if (top.priority > best[top.id])
      continue;

    for (const auto &edge : nodes[top.id].outgoing) {
      double newTime = top.priority + edge.weight + stopPenalty;
      if (newTime < best[edge.to]) {
        best[edge.to] = newTime;
        frontier.push(edge.to, newTime);
      }
    }
  }

  NetworkTimes times;
  for (size_t i = 0; i < best.size(); ++i) {
    if (best[i] != INF)
      times[static_cast<NodeID>(i)] = best[i];
  }
  return times;
}
