#pragma once

#include "biostream/types.hpp"

#include <array>
#include <cstddef>

namespace biostream {

constexpr size_t kPaletteSize = 256;

// 256-entry perceptually uniform palette (viridis-like), dark purple at index
// 0 through teal to yellow at index 255.
const std::array<RGB, kPaletteSize>& viridis_palette();

// Palette index for t in [0,1] (clamped; NaN maps to 0).
size_t palette_index(double t01);

RGB colormap_viridis(double t01);

} // namespace biostream
