#include "biostream/bmp_writer.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace biostream {

static void put_le(std::ofstream& f, uint32_t v, int bytes) {
  for (int i = 0; i < bytes; ++i) {
    f.put(static_cast<char>((v >> (8 * i)) & 0xFF));
  }
}

void write_bmp24(const std::string& path, int width, int height, const std::vector<RGB>& pixels) {
  if (width <= 0 || height <= 0) throw std::runtime_error("write_bmp24: invalid dimensions");
  if (pixels.size() != static_cast<size_t>(width) * static_cast<size_t>(height)) {
    throw std::runtime_error("write_bmp24: pixels size mismatch");
  }

  std::ofstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("write_bmp24: failed to open output: " + path);

  const uint32_t row_stride = static_cast<uint32_t>(width) * 3u;
  const uint32_t padding = (4u - (row_stride % 4u)) % 4u;
  const uint32_t pixel_data_size = (row_stride + padding) * static_cast<uint32_t>(height);
  const uint32_t header_size = 14 + 40;

  // BITMAPFILEHEADER
  f.put('B');
  f.put('M');
  put_le(f, header_size + pixel_data_size, 4);
  put_le(f, 0, 4);                                 // reserved
  put_le(f, header_size, 4);                       // pixel data offset

  // BITMAPINFOHEADER
  put_le(f, 40, 4);
  put_le(f, static_cast<uint32_t>(width), 4);
  put_le(f, static_cast<uint32_t>(height), 4);     // positive => bottom-up
  put_le(f, 1, 2);                                 // planes
  put_le(f, 24, 2);                                // bits per pixel
  put_le(f, 0, 4);                                 // BI_RGB
  put_le(f, pixel_data_size, 4);
  put_le(f, 2835, 4);                              // ~72 DPI
  put_le(f, 2835, 4);
  put_le(f, 0, 4);
  put_le(f, 0, 4);

  // BMP stores BGR rows bottom-up.
  for (int y = height - 1; y >= 0; --y) {
    const RGB* row = &pixels[static_cast<size_t>(y) * static_cast<size_t>(width)];
    for (int x = 0; x < width; ++x) {
      f.put(static_cast<char>(row[x].b));
      f.put(static_cast<char>(row[x].g));
      f.put(static_cast<char>(row[x].r));
    }
    for (uint32_t i = 0; i < padding; ++i) f.put(0);
  }

  if (!f) throw std::runtime_error("write_bmp24: write failed: " + path);
}

} // namespace biostream
