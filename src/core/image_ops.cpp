#include "core/image_ops.h"

#include <algorithm>
#include <cmath>

namespace pnt::image
{
namespace
{
static inline std::uint32_t DivRound(std::uint32_t num, std::uint32_t den)
{
    if (den == 0)
        return 0;
    return (num + (den / 2u)) / den;
}
} // namespace

RgbaImage ResizeNearest(const RgbaImage& src, int w, int h)
{
    RgbaImage out;
    if (w <= 0 || h <= 0 || src.Empty())
        return out;

    out.width = w;
    out.height = h;
    out.pixels.resize((size_t)w * (size_t)h * 4u);

    if (w == src.width && h == src.height)
    {
        out.pixels = src.pixels;
        return out;
    }

    // Precompute source columns once; rows are looked up per output row.
    std::vector<int> sx_for(w);
    for (int x = 0; x < w; ++x)
    {
        const double fx = ((double)x + 0.5) * (double)src.width / (double)w;
        sx_for[(size_t)x] = std::clamp((int)std::floor(fx), 0, src.width - 1);
    }

    for (int y = 0; y < h; ++y)
    {
        const double fy = ((double)y + 0.5) * (double)src.height / (double)h;
        const int sy = std::clamp((int)std::floor(fy), 0, src.height - 1);
        const std::uint8_t* srow = src.pixels.data() + (size_t)sy * (size_t)src.width * 4u;
        std::uint8_t* drow = out.pixels.data() + (size_t)y * (size_t)w * 4u;
        for (int x = 0; x < w; ++x)
        {
            const std::uint8_t* s = srow + (size_t)sx_for[(size_t)x] * 4u;
            std::uint8_t* d = drow + (size_t)x * 4u;
            d[0] = s[0];
            d[1] = s[1];
            d[2] = s[2];
            d[3] = s[3];
        }
    }
    return out;
}

void FitWithinNearest(RgbaImage& img, int max_side)
{
    if (max_side <= 0 || img.Empty())
        return;
    if (img.width <= max_side && img.height <= max_side)
        return;

    int w = 0;
    int h = 0;
    if (img.width >= img.height)
    {
        w = max_side;
        h = (int)std::lround((double)img.height * (double)max_side / (double)img.width);
    }
    else
    {
        h = max_side;
        w = (int)std::lround((double)img.width * (double)max_side / (double)img.height);
    }
    w = std::clamp(w, 1, max_side);
    h = std::clamp(h, 1, max_side);

    img = ResizeNearest(img, w, h);
}

bool AlphaCompositeOver(RgbaImage& dst, const RgbaImage& src)
{
    if (dst.width != src.width || dst.height != src.height)
        return false;
    if (dst.pixels.size() != src.pixels.size())
        return false;

    const size_t n = (size_t)dst.width * (size_t)dst.height;
    for (size_t i = 0; i < n; ++i)
    {
        const std::uint8_t* s = src.pixels.data() + i * 4u;
        std::uint8_t* d = dst.pixels.data() + i * 4u;

        const std::uint32_t sa = s[3];
        if (sa == 0u)
            continue;
        if (sa == 255u)
        {
            d[0] = s[0];
            d[1] = s[1];
            d[2] = s[2];
            d[3] = 255u;
            continue;
        }

        const std::uint32_t da = d[3];
        // Weights in 255*255 space: src contributes sa*255, dst contributes da*(255-sa).
        const std::uint32_t ws = sa * 255u;
        const std::uint32_t wd = da * (255u - sa);
        const std::uint32_t wsum = ws + wd;
        if (wsum == 0u)
        {
            d[0] = d[1] = d[2] = d[3] = 0u;
            continue;
        }
        for (int c = 0; c < 3; ++c)
            d[c] = (std::uint8_t)DivRound((std::uint32_t)s[c] * ws + (std::uint32_t)d[c] * wd, wsum);
        d[3] = (std::uint8_t)std::min<std::uint32_t>(255u, DivRound(wsum, 255u));
    }
    return true;
}
} // namespace pnt::image
