#ifndef TYPES_HPP
#define TYPES_HPP

#include <cmath>
#include <limits>
#include <string>
#include <vector>

// --- Core Type Aliases ---
using NodeID = int;
using Weight = double;

// --- Constants ---
const double INF = std::numeric_limits<double>::max();
const double R_EARTH = 6371000.0;
const double PI = 3.14159265358979323846;
const double METERS_PER_DEGREE = 111000.0; // grid bucketing only

// Physics (m/s)
const double WALK_SPEED_MPS = 1.3;    // ~4.7 km/h
const double TRANSIT_SPEED_MPS = 8.3; // ~30 km/h, route relations

// Propagation Parameters
const double TRANSFER_PENALTY = 300.0;   // 5 min to enter the network
const double STOP_PENALTY = 15.0;        // dwell added per traversed edge
const double TRANSFER_DISTANCE = 200.0;  // max station-to-station walk (m)
const double ENTRY_RADIUS = 2000.0;      // max origin-to-station walk (m)
const double EGRESS_PENALTY = 1.4;       // street detour factor on exit walk
const double WALK_TIME_CEILING = 3600.0; // walking Dijkstra bound (s)

// Spatial Index Cell Sizes (m)
const double STATION_CELL_SIZE = 500.0;
const double WALK_CELL_SIZE = 50.0;
const double RENDER_STATION_CELL_SIZE = 300.0;

// Walking Network Snapping
const double ORIGIN_SNAP_RADIUS = 1000.0;
const double QUERY_SNAP_RADIUS = 500.0;
const double ORIGIN_EPSILON_DEG = 0.0001;

// Rendering
const int DEFAULT_PIXEL_SIZE = 2;
const int PREVIEW_PIXEL_SIZE = 8;
const double DEFAULT_OPACITY = 0.6;
const double DEFAULT_MAX_TIME_MINUTES = 30.0;
const int COLOR_BAND_COUNT = 6;
const double EGRESS_SEARCH_RADIUS = 2000.0; // station lookup per pixel (m)
const double EGRESS_COARSE_DEGREES = 0.03;  // |dLat| + |dLon| cut-off
const double STATION_VIEW_MARGIN_DEG = 0.1;
const double OBSTACLE_VIEW_MARGIN_DEG = 0.01;
const int OBSTACLE_ALPHA_THRESHOLD = 100;
const double LINE_OF_SIGHT_STEP_PX = 8.0;
const int WALKING_GRID_SIZE = 150;

// --- Haversine Distance (meters) ---
inline double toRadians(double degree) { return degree * PI / 180.0; }

inline double haversine(double lat1, double lon1, double lat2, double lon2) {
  double dLat = toRadians(lat2 - lat1);
  double dLon = toRadians(lon2 - lon1);
  lat1 = toRadians(lat1);
  lat2 = toRadians(lat2);
  double a =
      std::sin(dLat / 2) * std::sin(dLat / 2) +
      std::sin(dLon / 2) * std::sin(dLon / 2) * std::cos(lat1) * std::cos(lat2);
  double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return R_EARTH * c;
}

// --- Geometry ---
struct GeoPoint {
  double lat;
  double lon;
};

struct Bounds {
  double north;
  double south;
  double east;
  double west;

  bool contains(double lat, double lon) const {
    return lat >= south && lat <= north && lon >= west && lon <= east;
  }
  Bounds expanded(double degrees) const {
    return {north + degrees, south - degrees, east + degrees, west - degrees};
  }
};

using Polygon = std::vector<GeoPoint>;

// --- Graph Structures ---
struct Edge {
  NodeID to;
  Weight weight; // Travel time in seconds
};

struct Node {
  NodeID id;
  std::string key; // natural id from the source dataset
  double lat;
  double lon;
  std::vector<Edge> outgoing;
};

// Entry point into the transit network with its walk-in time from the origin.
struct EntryNode {
  NodeID id;
  double walkSeconds;
};

enum class EdgeDirection { Directed, Bidirectional };

inline std::string directionToString(EdgeDirection direction) {
  return direction == EdgeDirection::Directed ? "directed" : "bidirectional";
}

#endif // TYPES_HPP
