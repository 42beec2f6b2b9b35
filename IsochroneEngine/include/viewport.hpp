#ifndef VIEWPORT_HPP
#define VIEWPORT_HPP

#include "errors.hpp"
#include "types.hpp"
#include <cmath>

// Screen-space window over a lat/lon box. Pixel (0, 0) is the north-west
// corner; the mapping is linear in both axes.
struct Viewport {
  Bounds bounds{0, 0, 0, 0};
  int width = 0;
  int height = 0;

  void validate() const {
    if (width <= 0 || height <= 0)
      throw ConfigurationError("viewport: width and height must be positive");
    if (!std::isfinite(bounds.north) || !std::isfinite(bounds.south) ||
        !std::isfinite(bounds.east) || !std::isfinite(bounds.west) ||
        !(bounds.north > bounds.south) || !(bounds.east > bounds.west))
      throw ConfigurationError("viewport: bounds must have north > south and "
                               "east > west");
  }

  double toPixelX(double lon) const {
    return (lon - bounds.west) / (bounds.east - bounds.west) * width;
  }
  double toPixelY(double lat) const {
    return (lat - bounds.north) / (bounds.south - bounds.north) * height;
  }
  double lonAt(double x) const {
    return bounds.west + x / width * (bounds.east - bounds.west);
  }
  double latAt(double y) const {
    return bounds.north + y / height * (bounds.south - bounds.north);
  }
};

#endif // VIEWPORT_HPP
