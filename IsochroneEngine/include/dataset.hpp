#ifndef DATASET_HPP
#define DATASET_HPP

#include "types.hpp"
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

// --- Raw Document Schemas ---

// {"nodes": [{"id", "lat", "lon"}], "edges": [{"from", "to", "time"}]}
struct LegacyFormat {
  struct NodeRecord {
    std::string id;
    double lat;
    double lon;
  };
  struct EdgeRecord {
    std::string from;
    std::string to;
    double time;
  };
  std::vector<NodeRecord> nodes;
  std::vector<EdgeRecord> edges;
};

// {"v": 2, "nodes": [[lat, lon]], "edges": [[fromIdx, toIdx, time]]}
struct OptimizedFormat {
  struct EdgeRecord {
    long long from;
    long long to;
    double time;
  };
  std::vector<GeoPoint> nodes;
  std::vector<EdgeRecord> edges;
};

using GraphDocument = std::variant<LegacyFormat, OptimizedFormat>;

// --- Canonical Representation ---
struct DatasetNode {
  std::string key;
  double lat;
  double lon;
};

struct DatasetEdge {
  size_t from; // index into GraphDataset::nodes
  size_t to;
  double seconds;
};

struct GraphDataset {
  std::vector<DatasetNode> nodes;
  std::vector<DatasetEdge> edges;
};

// Ordered stop sequences of transit routes (Overpass route relations).
struct RouteTopology {
  std::vector<DatasetNode> nodes;
  std::vector<std::vector<std::string>> routes; // node keys in travel order
};

#endif // DATASET_HPP
