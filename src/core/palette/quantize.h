#pragma once

#include "core/image_ops.h"
#include "core/palette/dye_palette.h"

#include <optional>
#include <span>
#include <vector>

namespace pnt::palette
{
// Longer side of the working copy used for best-colour voting.
static constexpr int kBestColorsSampleSide = 128;

// Ranks up to `limit` dye ids by how many pixels of `image` they are the nearest dye for.
//
// - The image is first downsampled (nearest-neighbor) so its longer side is <= 128 px.
// - Distance: squared Euclidean in 8-bit RGB against DyeRgb8(); alpha is ignored.
// - Nearest-dye ties go to the dye seen first in `palette` order.
// - Result is ordered by descending vote count; equal counts keep first-encountered order
//   from the pixel scan (row-major), so the ranking is fully deterministic.
//
// Degenerate cases: limit <= 0 or an empty image -> empty; no dye with a linear colour ->
// the first `limit` ids of `palette` verbatim (no scoring).
std::vector<int> RankBestColors(const pnt::image::RgbaImage& image, std::span<const Dye> palette, int limit);

// Ranking source priority: a non-empty precomputed ranking (from the dye table) truncated to
// `limit` wins; the quantization scan is only the fallback.
std::vector<int> ResolveRankedDyes(const std::optional<std::vector<int>>& precomputed,
                                   const pnt::image::RgbaImage& image,
                                   std::span<const Dye> palette,
                                   int limit);
} // namespace pnt::palette
