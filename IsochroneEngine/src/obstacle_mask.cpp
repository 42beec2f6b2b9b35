#include "obstacle_mask.hpp"
#include <algorithm>
#include <cmath>

// --- ObstacleRaster ---

ObstacleRaster::ObstacleRaster(int width, int height)
    : width_(width), height_(height) {
  if (width <= 0 || height <= 0)
    throw ConfigurationError("ObstacleRaster: size must be positive");
  alpha_.assign(static_cast<size_t>(width) * height, 0);
}

void ObstacleRaster::set(int x, int y, uint8_t alpha) {
  if (x < 0 || x >= width_ || y < 0 || y >= height_)
    return;
  alpha_[static_cast<size_t>(y) * width_ + x] = alpha;
}

bool ObstacleRaster::isBlocked(double x, double y) const {
  if (x < 0 || x >= width_ || y < 0 || y >= height_)
    return false;
  size_t idx = static_cast<size_t>(std::floor(y)) * width_ +
               static_cast<size_t>(std::floor(x));
  return alpha_[idx] > OBSTACLE_ALPHA_THRESHOLD;
}

bool ObstacleRaster::hasLineOfSight(double x1, double y1, double x2,
                                    double y2) const {
  double dx = x2 - x1;
  double dy = y2 - y1;
  double dist = std::sqrt(dx * dx + dy * dy);
  int steps =
      std::max(static_cast<int>(std::floor(dist / LINE_OF_SIGHT_STEP_PX)), 1);

  for (int i = 0; i <= steps; ++i) {
    double t = static_cast<double>(i) / steps;
    if (isBlocked(x1 + dx * t, y1 + dy * t))
      return false;
  }
  return true;
}

size_t ObstacleRaster::blockedCount() const {
  return std::count_if(alpha_.begin(), alpha_.end(), [](uint8_t a) {
    return a > OBSTACLE_ALPHA_THRESHOLD;
  });
}

// --- ObstacleMask ---

ObstacleMask::ObstacleMask(double cullMarginDegrees, bool enabled)
    : cullMargin_(cullMarginDegrees), enabled_(enabled) {}

void ObstacleMask::setPolygons(std::vector<Polygon> polygons) {
  polygons_ = std::move(polygons);
}

void ObstacleMask::addPolygon(Polygon polygon) {
  polygons_.push_back(std::move(polygon));
}

void ObstacleMask::clear() { polygons_.clear(); }

bool ObstacleMask::visible(const Polygon &poly, const Bounds &area) const {
  if (cullMargin_ < 0.0)
    return true;
  for (const auto &pt : poly) {
    if (area.contains(pt.lat, pt.lon))
      return true;
  }
  return false;
}

int ObstacleMask::paint(const Viewport &viewport, ObstacleRaster &raster) const {
  if (!enabled_)
    return 0;
  viewport.validate();

  const Bounds area = viewport.bounds.expanded(std::max(cullMargin_, 0.0));
  const int width = raster.width();
  const int height = raster.height();
  int painted = 0;
  std::vector<double> px, py, nodeX;

  for (const auto &poly : polygons_) {
    if (poly.size() < 3 || !visible(poly, area))
      continue;

    px.clear();
    py.clear();
    double minY = INF, maxY = -INF;
    for (const auto &pt : poly) {
      px.push_back(viewport.toPixelX(pt.lon));
      py.push_back(viewport.toPixelY(pt.lat));
      minY = std::min(minY, py.back());
      maxY = std::max(maxY, py.back());
    }

    // Scanline fill sampled at pixel centers, even-odd rule.
    int rowStart = std::max(0, static_cast<int>(std::floor(minY)));
    int rowEnd = std::min(height - 1, static_cast<int>(std::ceil(maxY)));
    const size_t n = px.size();
    for (int y = rowStart; y <= rowEnd; ++y) {
      const double sy = y + 0.5;
      nodeX.clear();
      for (size_t i = 0; i < n; ++i) {
        size_t j = (i + 1) % n;
        if ((py[i] <= sy && py[j] > sy) || (py[j] <= sy && py[i] > sy))
          nodeX.push_back(px[i] + (sy - py[i]) * (px[j] - px[i]) / (py[j] - py[i]));
      }
      std::sort(nodeX.begin(), nodeX.end());

      for (size_t i = 0; i + 1 < nodeX.size(); i += 2) {
        int startX = static_cast<int>(std::ceil(nodeX[i] - 0.5));
        int endX = static_cast<int>(std::ceil(nodeX[i + 1] - 0.5)) - 1;
        startX = std::max(0, startX);
        endX = std::min(width - 1, endX);
        for (int x = startX; x <= endX; ++x)
          raster.set(x, y, 255);
      }
    }
    painted++;
  }
  return painted;
}

std::shared_ptr<ObstacleRaster>
ObstacleMask::rasterize(const Viewport &viewport) const {
  viewport.validate();
  auto raster = std::make_shared<ObstacleRaster>(viewport.width, viewport.height);
  paint(viewport, *raster);
  return raster;
}
