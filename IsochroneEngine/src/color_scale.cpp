#include "color_scale.hpp"
#include "types.hpp"
#include <cmath>

namespace {
// Blue, cyan, emerald, lime, yellow, orange.
const uint8_t BANDS[COLOR_BAND_COUNT][3] = {
    {59, 130, 246}, {6, 182, 212},  {16, 185, 129},
    {132, 204, 22}, {250, 204, 21}, {249, 115, 22}};
} // namespace

int TimeToBand(double minutes, double maxTimeMinutes) {
  if (!(minutes < maxTimeMinutes))
    return -1;
  double interval = maxTimeMinutes / COLOR_BAND_COUNT;
  for (int band = 0; band < COLOR_BAND_COUNT - 1; ++band) {
    if (minutes < interval * (band + 1))
      return band;
  }
  return COLOR_BAND_COUNT - 1;
}

Rgba TimeToColor(double minutes, double opacity, double maxTimeMinutes) {
  int band = TimeToBand(minutes, maxTimeMinutes);
  if (band < 0)
    return {0, 0, 0, 0};
  uint8_t alpha = static_cast<uint8_t>(std::floor(opacity * 255));
  return {BANDS[band][0], BANDS[band][1], BANDS[band][2], alpha};
}
