#ifndef COLOR_SCALE_HPP
#define COLOR_SCALE_HPP

#include <cstdint>

struct Rgba {
  uint8_t r;
  uint8_t g;
  uint8_t b;
  uint8_t a;
};

// Maps a travel time to one of COLOR_BAND_COUNT equal bands over
// [0, maxTimeMinutes). At or beyond maxTimeMinutes the color is transparent.
Rgba TimeToColor(double minutes, double opacity, double maxTimeMinutes);

// Index of the band for `minutes`, or -1 when transparent.
int TimeToBand(double minutes, double maxTimeMinutes);

#endif // COLOR_SCALE_HPP
