#pragma once

#include "core/image_ops.h"

#include <cstdint>
#include <string>
#include <vector>

namespace image_writer
{
// Encodes an RGBA8 image to PNG bytes in memory (LodePNG).
// `compression` follows the zlib convention 0..9 and is approximated with lodepng settings.
// Returns false on error and sets `err`.
bool EncodePngRgba32(const pnt::image::RgbaImage& img,
                     std::vector<std::uint8_t>& out_png,
                     std::string& err,
                     int compression = 6);
} // namespace image_writer
