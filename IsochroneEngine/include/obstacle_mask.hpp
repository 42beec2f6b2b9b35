#ifndef OBSTACLE_MASK_HPP
#define OBSTACLE_MASK_HPP

#include "viewport.hpp"
#include <cstdint>
#include <memory>
#include <vector>

// Per-pixel opacity of blocking features for one viewport.
class ObstacleRaster {
public:
  ObstacleRaster(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }
  const std::vector<uint8_t> &alpha() const { return alpha_; }

  void set(int x, int y, uint8_t alpha);
  // Pixels outside the raster are never blocked.
  bool isBlocked(double x, double y) const;
  // Samples the segment every LINE_OF_SIGHT_STEP_PX pixels, endpoints
  // included.
  bool hasLineOfSight(double x1, double y1, double x2, double y2) const;

  size_t blockedCount() const;

private:
  int width_;
  int height_;
  std::vector<uint8_t> alpha_;
};

// A layer of blocking polygons (water, buildings) painted on demand.
class ObstacleMask {
public:
  // Polygons entirely outside the viewport grown by cullMarginDegrees are
  // skipped when painting. A negative margin disables culling.
  explicit ObstacleMask(double cullMarginDegrees = -1.0, bool enabled = true);

  void setPolygons(std::vector<Polygon> polygons);
  void addPolygon(Polygon polygon);
  void clear();

  const std::vector<Polygon> &polygons() const { return polygons_; }
  bool isLoaded() const { return !polygons_.empty(); }
  bool isEnabled() const { return enabled_; }
  void setEnabled(bool enabled) { enabled_ = enabled; }

  // Fills every polygon into the raster at full opacity. Returns the number
  // of polygons painted.
  int paint(const Viewport &viewport, ObstacleRaster &raster) const;
  std::shared_ptr<ObstacleRaster> rasterize(const Viewport &viewport) const;

private:
  bool visible(const Polygon &poly, const Bounds &area) const;

  double cullMargin_;
  bool enabled_;
  std::vector<Polygon> polygons_;
};

#endif // OBSTACLE_MASK_HPP
