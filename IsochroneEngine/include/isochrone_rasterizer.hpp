#ifndef ISOCHRONE_RASTERIZER_HPP
#define ISOCHRONE_RASTERIZER_HPP

#include "obstacle_mask.hpp"
#include "walking_grid.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Reached station with its network arrival time.
struct StationTime {
  double lat;
  double lon;
  double seconds;
};

// Everything one render needs. Shared members are immutable snapshots.
struct RenderRequest {
  int width = 0;
  int height = 0;
  int pixelSize = DEFAULT_PIXEL_SIZE;
  double opacity = DEFAULT_OPACITY;
  double maxTimeMinutes = DEFAULT_MAX_TIME_MINUTES;
  GeoPoint origin{0, 0};
  Bounds bounds{0, 0, 0, 0};
  std::vector<StationTime> activeStations;
  std::shared_ptr<const ObstacleRaster> obstacles; // null: no obstacle checks
  std::shared_ptr<const WalkingGrid> walkingGrid;  // null: straight-line walk
  double walkSpeed = WALK_SPEED_MPS;
  bool isPreview = false;
  uint64_t sequence = 0;
};

struct RenderResult {
  std::vector<uint8_t> pixels; // RGBA, row-major
  int width = 0;
  int height = 0;
  bool isPreview = false;
  uint64_t sequence = 0;
  std::string error; // non-empty when the render failed

  bool ok() const { return error.empty(); }
};

using ProgressCallback = std::function<void(int percent)>;

class IsochroneRasterizer {
public:
  // Throws ConfigurationError for an unusable request.
  static void Validate(const RenderRequest &request);

  // Paints min(direct walk, transit + egress walk) for every pixelSize block.
  // Full passes report progress in 10 % steps.
  static RenderResult Render(const RenderRequest &request,
                             const ProgressCallback &progress = nullptr);

  // Travel time in seconds to one point, INF when unreachable.
  static double TimeAt(const RenderRequest &request, double lat, double lon);
};

#endif // ISOCHRONE_RASTERIZER_HPP
