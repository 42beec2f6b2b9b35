#ifndef SPATIAL_GRID_HPP
#define SPATIAL_GRID_HPP

#include "errors.hpp"
#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// Uniform-cell index over lat/lon points. Cells are bucketed with an
// equirectangular approximation:
//   y = floor(lat * 111000 / cellSize)
//   x = floor(lon * 111000 * cos(lat) / cellSize)
// Radius queries return candidates (callers re-filter by exact distance when
// they need to); bbox queries are exact.
template <typename Payload> class SpatialGrid {
public:
  struct Entry {
    double lat;
    double lon;
    Payload payload;
  };

  explicit SpatialGrid(double cellSizeMeters) : cellSize_(cellSizeMeters) {
    if (!(cellSizeMeters > 0.0))
      throw ConfigurationError("SpatialGrid cell size must be positive");
  }

  void insert(double lat, double lon, const Payload &payload) {
    int cx = cellX(lat, lon);
    int cy = cellY(lat);
    Cell &cell = cells_[packKey(cx, cy)];
    cell.x = cx;
    cell.y = cy;
    cell.entries.push_back({lat, lon, payload});
    ++size_;
  }

  void clear() {
    cells_.clear();
    size_ = 0;
  }

  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  double cellSize() const { return cellSize_; }

  // Candidate superset of every entry within radiusMeters of (lat, lon).
  std::vector<Payload> queryRadius(double lat, double lon,
                                   double radiusMeters) const {
    std::vector<Payload> results;
    if (radiusMeters < 0.0)
      throw ConfigurationError("queryRadius: negative radius");
    if (cells_.empty())
      return results;

    // Degrees spanned by the radius. The grid constant (111000) is below the
    // haversine meters-per-degree, so this over-covers.
    double dLat = radiusMeters / METERS_PER_DEGREE;
    double south = std::max(lat - dLat, -90.0);
    double north = std::min(lat + dLat, 90.0);
    double maxAbsLat = std::max(std::fabs(south), std::fabs(north));
    double cosMax = std::cos(toRadians(maxAbsLat));
    double west = -180.0, east = 180.0;
    if (cosMax > 1e-9) {
      double dLon = radiusMeters / (METERS_PER_DEGREE * cosMax);
      if (dLon < 180.0) {
        west = lon - dLon;
        east = lon + dLon;
      }
    }

    CellRange range = cellRange(south, west, north, east);
    int ring = static_cast<int>(std::ceil(radiusMeters / cellSize_)) + 1;
    int cx = cellX(lat, lon);
    int cy = cellY(lat);
    range.minX = std::min(range.minX - 1, cx - ring);
    range.maxX = std::max(range.maxX + 1, cx + ring);
    range.minY = std::min(range.minY - 1, cy - ring);
    range.maxY = std::max(range.maxY + 1, cy + ring);

    collect(range, [&](const Entry &e) { results.push_back(e.payload); });
    return results;
  }

  // Entries inside the box (inclusive), exact.
  std::vector<Payload> queryBBox(double south, double west, double north,
                                 double east) const {
    std::vector<Payload> results;
    if (cells_.empty() || south > north || west > east)
      return results;
    CellRange range = cellRange(south, west, north, east);
    collect(range, [&](const Entry &e) {
      if (e.lat >= south && e.lat <= north && e.lon >= west && e.lon <= east)
        results.push_back(e.payload);
    });
    return results;
  }

  int cellY(double lat) const {
    return static_cast<int>(std::floor(lat * METERS_PER_DEGREE / cellSize_));
  }
  int cellX(double lat, double lon) const {
    return static_cast<int>(std::floor(
        lon * METERS_PER_DEGREE * std::cos(toRadians(lat)) / cellSize_));
  }

private:
  struct Cell {
    int x = 0;
    int y = 0;
    std::vector<Entry> entries;
  };

  struct CellRange {
    int minX, maxX, minY, maxY;
  };

  static long long packKey(int cx, int cy) {
    return (static_cast<long long>(cy) << 32) |
           static_cast<long long>(static_cast<uint32_t>(cx));
  }

  // x depends on lon * cos(lat), so its extremes over a box sit on the
  // corners of [west, east] x [cos min, cos max].
  CellRange cellRange(double south, double west, double north,
                      double east) const {
    double cosS = std::cos(toRadians(south));
    double cosN = std::cos(toRadians(north));
    double cosMin = std::min(cosS, cosN);
    double cosMax = (south <= 0.0 && north >= 0.0) ? 1.0 : std::max(cosS, cosN);

    double k = METERS_PER_DEGREE / cellSize_;
    double xs[4] = {west * cosMin * k, west * cosMax * k, east * cosMin * k,
                    east * cosMax * k};
    CellRange range;
    range.minX = static_cast<int>(std::floor(*std::min_element(xs, xs + 4)));
    range.maxX = static_cast<int>(std::floor(*std::max_element(xs, xs + 4)));
    range.minY = cellY(south);
    range.maxY = cellY(north);
    return range;
  }

  template <typename Fn> void collect(const CellRange &range, Fn fn) const {
    long long spanX = static_cast<long long>(range.maxX) - range.minX + 1;
    long long spanY = static_cast<long long>(range.maxY) - range.minY + 1;
    if (spanX <= 0 || spanY <= 0)
      return;

    // Wide ranges (near the poles, huge radii) scan the occupied cells instead.
    if (spanX * spanY > static_cast<long long>(cells_.size())) {
      for (const auto &kv : cells_) {
        const Cell &cell = kv.second;
        if (cell.x < range.minX || cell.x > range.maxX || cell.y < range.minY ||
            cell.y > range.maxY)
          continue;
        for (const auto &e : cell.entries)
          fn(e);
      }
      return;
    }

    for (int y = range.minY; y <= range.maxY; ++y) {
      for (int x = range.minX; x <= range.maxX; ++x) {
        auto it = cells_.find(packKey(x, y));
        if (it == cells_.end())
          continue;
        for (const auto &e : it->second.entries)
          fn(e);
      }
    }
  }

  double cellSize_;
  size_t size_ = 0;
  std::unordered_map<long long, Cell> cells_;
};

#endif // SPATIAL_GRID_HPP
