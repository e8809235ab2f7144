#include "biostream/colormap.hpp"

#include <cmath>

namespace biostream {

static std::array<RGB, kPaletteSize> build_viridis() {
  // Anchor colors sampled from viridis at t = 0, 1/8, ..., 1.
  struct Anchor { double r, g, b; };
  static const Anchor anchors[] = {
    {68, 1, 84},
    {71, 44, 122},
    {59, 81, 139},
    {44, 113, 142},
    {33, 144, 141},
    {39, 173, 129},
    {92, 200, 99},
    {170, 220, 50},
    {253, 231, 37},
  };
  constexpr size_t n_anchors = sizeof(anchors) / sizeof(anchors[0]);

  std::array<RGB, kPaletteSize> lut{};
  for (size_t i = 0; i < kPaletteSize; ++i) {
    const double pos = static_cast<double>(i) / static_cast<double>(kPaletteSize - 1) *
                       static_cast<double>(n_anchors - 1);
    size_t a = static_cast<size_t>(std::floor(pos));
    if (a >= n_anchors - 1) a = n_anchors - 2;
    const double t = pos - static_cast<double>(a);
    const Anchor& lo = anchors[a];
    const Anchor& hi = anchors[a + 1];
    lut[i].r = static_cast<uint8_t>(std::lround(lo.r + (hi.r - lo.r) * t));
    lut[i].g = static_cast<uint8_t>(std::lround(lo.g + (hi.g - lo.g) * t));
    lut[i].b = static_cast<uint8_t>(std::lround(lo.b + (hi.b - lo.b) * t));
  }
  return lut;
}

const std::array<RGB, kPaletteSize>& viridis_palette() {
  static const std::array<RGB, kPaletteSize> lut = build_viridis();
  return lut;
}

size_t palette_index(double t01) {
  if (!(t01 > 0.0)) return 0;
  if (t01 >= 1.0) return kPaletteSize - 1;
  return static_cast<size_t>(std::floor(t01 * static_cast<double>(kPaletteSize - 1) + 0.5));
}

RGB colormap_viridis(double t01) {
  return viridis_palette()[palette_index(t01)];
}

} // namespace biostream
