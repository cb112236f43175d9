#include "io/image_loader.h"

#include <climits>
#include <cstring>

// stb_image implementation must live in exactly one translation unit.
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

namespace image_loader
{
namespace
{
static bool TakeStbPixels(unsigned char* data, int w, int h, pnt::image::RgbaImage& out, std::string& err)
{
    if (!data)
    {
        err = std::string("Failed to decode image: ") + (stbi_failure_reason() ? stbi_failure_reason() : "unknown error");
        return false;
    }

    if (w <= 0 || h <= 0)
    {
        stbi_image_free(data);
        err = "Invalid image dimensions.";
        return false;
    }

    out.width = w;
    out.height = h;
    const size_t pixel_bytes = (size_t)w * (size_t)h * 4u;
    out.pixels.resize(pixel_bytes);
    std::memcpy(out.pixels.data(), data, pixel_bytes);

    stbi_image_free(data);
    return true;
}
} // namespace

bool LoadImageAsRgba32(const std::string& path, pnt::image::RgbaImage& out, std::string& err)
{
    err.clear();
    out = {};

    int w = 0;
    int h = 0;
    int channels_in_file = 0;

    // Force 4 channels so we always get RGBA8.
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels_in_file, 4);
    if (!TakeStbPixels(data, w, h, out, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}

bool LoadImageFromMemoryAsRgba32(std::span<const std::uint8_t> bytes,
                                 pnt::image::RgbaImage& out,
                                 std::string& err)
{
    err.clear();
    out = {};

    if (bytes.empty())
    {
        err = "Image data is empty.";
        return false;
    }
    if (bytes.size() > (size_t)INT_MAX)
    {
        err = "Image data is too large.";
        return false;
    }

    int w = 0;
    int h = 0;
    int channels_in_file = 0;
    unsigned char* data = stbi_load_from_memory(bytes.data(), (int)bytes.size(), &w, &h, &channels_in_file, 4);
    return TakeStbPixels(data, w, h, out, err);
}
} // namespace image_loader
