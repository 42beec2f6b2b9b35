#include "isochrone_rasterizer.hpp"
#include "color_scale.hpp"
#include "spatial_grid.hpp"
#include <algorithm>
#include <cmath>

namespace {

// Per-render state shared by every pixel: the station index and the pixel
// mapping.
class PixelEvaluator {
public:
  explicit PixelEvaluator(const RenderRequest &req)
      : req_(req), stationIndex_(RENDER_STATION_CELL_SIZE) {
    viewport_.bounds = req.bounds;
    viewport_.width = req.width;
    viewport_.height = req.height;
    for (size_t i = 0; i < req.activeStations.size(); ++i) {
      const auto &s = req.activeStations[i];
      stationIndex_.insert(s.lat, s.lon, i);
    }
    // Preview passes skip every obstacle check.
    obstacles_ = req.isPreview ? nullptr : req.obstacles.get();
    originX_ = viewport_.toPixelX(req.origin.lon);
    originY_ = viewport_.toPixelY(req.origin.lat);
  }

  const Viewport &viewport() const { return viewport_; }

  double timeAt(double lat, double lon, double targetX, double targetY) const {
    // 1. Direct walk: walking grid first, straight line otherwise.
    double timeWalkDirect = INF;
    if (req_.walkingGrid)
      timeWalkDirect = req_.walkingGrid->lookup(lat, lon);
    if (timeWalkDirect == INF) {
      bool pathIsSafe = true;
      if (!req_.walkingGrid && obstacles_)
        pathIsSafe = obstacles_->hasLineOfSight(originX_, originY_, targetX,
                                                targetY);
      if (pathIsSafe)
        timeWalkDirect =
            haversine(req_.origin.lat, req_.origin.lon, lat, lon) /
            req_.walkSpeed;
    }

    // 2. Transit: best reachable station within walking range.
    double timeTransit = INF;
    for (size_t idx : stationIndex_.queryRadius(lat, lon, EGRESS_SEARCH_RADIUS)) {
      const StationTime &s = req_.activeStations[idx];
      if (std::fabs(s.lat - lat) + std::fabs(s.lon - lon) > EGRESS_COARSE_DEGREES)
        continue;

      double distExit = haversine(lat, lon, s.lat, s.lon);
      if (distExit > EGRESS_SEARCH_RADIUS)
        continue;
      double total = s.seconds + distExit / req_.walkSpeed * EGRESS_PENALTY;
      if (total >= timeTransit)
        continue;
      if (obstacles_ &&
          !obstacles_->hasLineOfSight(viewport_.toPixelX(s.lon),
                                      viewport_.toPixelY(s.lat), targetX,
                                      targetY))
        continue;
      timeTransit = total;
    }

    return std::min(timeWalkDirect, timeTransit);
  }

private:
  const RenderRequest &req_;
  Viewport viewport_;
  SpatialGrid<size_t> stationIndex_;
  const ObstacleRaster *obstacles_;
  double originX_;
  double originY_;
};

} // namespace

void IsochroneRasterizer::Validate(const RenderRequest &request) {
  Viewport viewport{request.bounds, request.width, request.height};
  viewport.validate();
  if (request.pixelSize < 1)
    throw ConfigurationError("render: pixel size must be >= 1");
  if (!(request.opacity >= 0.0 && request.opacity <= 1.0))
    throw ConfigurationError("render: opacity must be within [0, 1]");
  if (!(request.maxTimeMinutes > 0.0) || !std::isfinite(request.maxTimeMinutes))
    throw ConfigurationError("render: maxTimeMinutes must be positive");
  if (!(request.walkSpeed > 0.0) || !std::isfinite(request.walkSpeed))
    throw ConfigurationError("render: walk speed must be positive");
  if (!std::isfinite(request.origin.lat) || !std::isfinite(request.origin.lon))
    throw ConfigurationError("render: origin must be finite");
  if (request.obstacles && (request.obstacles->width() != request.width ||
                            request.obstacles->height() != request.height))
    throw ConfigurationError("render: obstacle raster does not match the "
                             "output size");
}

RenderResult IsochroneRasterizer::Render(const RenderRequest &request,
                                         const ProgressCallback &progress) {
  Validate(request);

  RenderResult result;
  result.width = request.width;
  result.height = request.height;
  result.isPreview = request.isPreview;
  result.sequence = request.sequence;
  result.pixels.assign(static_cast<size_t>(request.width) * request.height * 4,
                       0);

  PixelEvaluator evaluator(request);
  const Viewport &viewport = evaluator.viewport();
  const int width = request.width;
  const int height = request.height;
  const int pixelSize = request.pixelSize;
  const double half = pixelSize / 2.0;

  const long long totalBlocks =
      static_cast<long long>((height + pixelSize - 1) / pixelSize) *
      ((width + pixelSize - 1) / pixelSize);
  long long processed = 0;
  int lastProgress = 0;

  for (int y = 0; y < height; y += pixelSize) {
    const double targetY = y + half;
    const double lat = viewport.latAt(targetY);

    for (int x = 0; x < width; x += pixelSize) {
      const double targetX = x + half;
      const double lon = viewport.lonAt(targetX);

      double totalTimeSec = evaluator.timeAt(lat, lon, targetX, targetY);
      Rgba color = TimeToColor(totalTimeSec / 60.0, request.opacity,
                               request.maxTimeMinutes);

      // Fill pixel block
      const int yEnd = std::min(y + pixelSize, height);
      const int xEnd = std::min(x + pixelSize, width);
      for (int py = y; py < yEnd; ++py) {
        for (int px = x; px < xEnd; ++px) {
          size_t idx = 4 * (static_cast<size_t>(py) * width + px);
          result.pixels[idx] = color.r;
          result.pixels[idx + 1] = color.g;
          result.pixels[idx + 2] = color.b;
          result.pixels[idx + 3] = color.a;
        }
      }
      processed++;
    }

    if (!request.isPreview && progress) {
      int percent = static_cast<int>(processed * 100 / totalBlocks);
      if (percent >= lastProgress + 10) {
        lastProgress = percent;
        progress(percent);
      }
    }
  }
  return result;
}

double IsochroneRasterizer::TimeAt(const RenderRequest &request, double lat,
                                   double lon) {
  Validate(request);
  PixelEvaluator evaluator(request);
  const Viewport &viewport = evaluator.viewport();
  return evaluator.timeAt(lat, lon, viewport.toPixelX(lon),
                          viewport.toPixelY(lat));
}
