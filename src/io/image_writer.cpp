#include "io/image_writer.h"

#include <algorithm>
#include <cstdlib>

// LodePNG (compiled via src/io/lodepng_unit.cpp).
#include <lodepng.h>

namespace image_writer
{
namespace
{
static void ConfigurePngCompression(LodePNGState& state, int compression)
{
    // lodepng doesn't expose a single "compression level" knob like zlib, so we approximate.
    const int lvl = std::clamp(compression, 0, 9);
    if (lvl <= 0)
    {
        state.encoder.zlibsettings.btype = 0;    // uncompressed blocks
        state.encoder.zlibsettings.use_lz77 = 0; // no LZ77
        return;
    }
    state.encoder.zlibsettings.btype = 2; // dynamic Huffman
    state.encoder.zlibsettings.use_lz77 = 1;
    state.encoder.zlibsettings.windowsize = (lvl >= 6) ? 32768u : 2048u;
    state.encoder.zlibsettings.minmatch = 3;
    state.encoder.zlibsettings.nicematch = (lvl >= 7) ? 258u : 128u;
    state.encoder.zlibsettings.lazymatching = 1;
}
} // namespace

bool EncodePngRgba32(const pnt::image::RgbaImage& img,
                     std::vector<std::uint8_t>& out_png,
                     std::string& err,
                     int compression)
{
    err.clear();
    out_png.clear();

    if (img.width <= 0 || img.height <= 0)
    {
        err = "Invalid image dimensions.";
        return false;
    }
    const size_t need = (size_t)img.width * (size_t)img.height * 4u;
    if (img.pixels.size() < need)
    {
        err = "Invalid RGBA buffer size.";
        return false;
    }

    LodePNGState state;
    lodepng_state_init(&state);
    state.info_raw.colortype = LCT_RGBA;
    state.info_raw.bitdepth = 8;
    state.info_png.color.colortype = LCT_RGBA;
    state.info_png.color.bitdepth = 8;
    state.encoder.auto_convert = 0;
    ConfigurePngCompression(state, compression);

    unsigned char* out = nullptr;
    size_t out_size = 0;
    const unsigned enc_err =
        lodepng_encode(&out, &out_size, img.pixels.data(), (unsigned)img.width, (unsigned)img.height, &state);
    lodepng_state_cleanup(&state);
    if (enc_err != 0)
    {
        free(out);
        err = std::string("lodepng_encode failed: ") + lodepng_error_text(enc_err);
        return false;
    }

    out_png.assign(out, out + out_size);
    free(out);
    return true;
}
} // namespace image_writer
