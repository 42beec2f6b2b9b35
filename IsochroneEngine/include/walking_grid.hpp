#ifndef WALKING_GRID_HPP
#define WALKING_GRID_HPP

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

// size x size walking times (seconds) sampled at cell centers over `bounds`.
// Row 0 is the southern edge. -1 marks cells without data.
struct WalkingGrid {
  std::vector<float> data;
  int size = 0;
  Bounds bounds{0, 0, 0, 0};

  // Time for the cell containing (lat, lon), or INF when the point is
  // outside the bounds or the cell has no data.
  double lookup(double lat, double lon) const {
    if (size <= 0 || data.size() != static_cast<size_t>(size) * size)
      return INF;
    if (!bounds.contains(lat, lon))
      return INF;
    double latRange = bounds.north - bounds.south;
    double lonRange = bounds.east - bounds.west;
    if (latRange <= 0.0 || lonRange <= 0.0)
      return INF;

    int r = static_cast<int>(std::floor((lat - bounds.south) / latRange * size));
    int c = static_cast<int>(std::floor((lon - bounds.west) / lonRange * size));
    r = std::min(std::max(r, 0), size - 1);
    c = std::min(std::max(c, 0), size - 1);

    float time = data[static_cast<size_t>(r) * size + c];
    return time >= 0.0f ? static_cast<double>(time) : INF;
  }
};

#endif // WALKING_GRID_HPP
