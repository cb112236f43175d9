#pragma once

#include <cstdint>
#include <vector>

namespace pnt::image
{
struct RgbaImage
{
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels; // RGBA8, row-major, unassociated alpha

    bool Empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
};

// Nearest-neighbor resample to exactly `w` x `h`.
// Sample position is the destination pixel centre mapped back into the source, so hard colour
// boundaries stay hard. Returns an empty image for non-positive sizes.
RgbaImage ResizeNearest(const RgbaImage& src, int w, int h);

// Shrinks `img` in place so its longer side is at most `max_side`, preserving aspect ratio
// (nearest-neighbor). Never upscales. No-op when max_side <= 0.
void FitWithinNearest(RgbaImage& img, int max_side);

// Porter-Duff "over": composites `src` on top of `dst` (same dimensions required).
// Returns false if the sizes differ.
bool AlphaCompositeOver(RgbaImage& dst, const RgbaImage& src);
} // namespace pnt::image
