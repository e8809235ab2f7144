#pragma once

#include "biostream/types.hpp"

#include <string>
#include <vector>

namespace biostream {

// Write a 24-bit BMP.
// Pixels are row-major, top-to-bottom, left-to-right.
// Size must be width*height.
void write_bmp24(const std::string& path, int width, int height, const std::vector<RGB>& pixels);

} // namespace biostream
