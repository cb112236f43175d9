#pragma once

#include "core/image_ops.h"

#include <cstdint>
#include <span>
#include <string>

namespace image_loader
{
// Load an image from disk into an RGBA8 buffer using stb_image.
// Used for frame images and template overlays (PNG/JPG/BMP/...).
bool LoadImageAsRgba32(const std::string& path, pnt::image::RgbaImage& out, std::string& err);

// Decode an image held in memory (the user's source image) into RGBA8.
bool LoadImageFromMemoryAsRgba32(std::span<const std::uint8_t> bytes,
                                 pnt::image::RgbaImage& out,
                                 std::string& err);
} // namespace image_loader
