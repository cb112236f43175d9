#include "core/palette/quantize.h"

#include <algorithm>
#include <cstdint>
#include <cstddef>

namespace pnt::palette
{
namespace
{
struct Candidate
{
    int id = 0;
    Rgb8 rgb;
};

static pnt::image::RgbaImage DownsampleForVoting(const pnt::image::RgbaImage& src)
{
    const int max_side = std::max(src.width, src.height);
    if (max_side <= kBestColorsSampleSide)
        return src;

    const double scale = (double)kBestColorsSampleSide / (double)max_side;
    const int w = std::max(1, (int)((double)src.width * scale));
    const int h = std::max(1, (int)((double)src.height * scale));
    return pnt::image::ResizeNearest(src, w, h);
}
} // namespace

std::vector<int> RankBestColors(const pnt::image::RgbaImage& image, std::span<const Dye> palette, int limit)
{
    if (limit <= 0 || image.Empty())
        return {};

    std::vector<Candidate> candidates;
    candidates.reserve(palette.size());
    for (const Dye& d : palette)
    {
        if (const std::optional<Rgb8> rgb = DyeRgb8(d))
            candidates.push_back({d.id, *rgb});
    }

    if (candidates.empty())
    {
        std::vector<int> ids;
        const size_t n = std::min(palette.size(), (size_t)limit);
        ids.reserve(n);
        for (size_t i = 0; i < n; ++i)
            ids.push_back(palette[i].id);
        return ids;
    }

    const pnt::image::RgbaImage sample = DownsampleForVoting(image);

    // Votes in first-encountered order; `slot_of` maps candidate index -> votes slot.
    struct Vote
    {
        int id = 0;
        std::uint64_t count = 0;
    };
    std::vector<Vote> votes;
    std::vector<int> slot_of(candidates.size(), -1);

    // Neighbouring pixels are frequently identical; remember the last answer.
    bool have_last = false;
    std::uint8_t last_r = 0, last_g = 0, last_b = 0;
    size_t last_best = 0;

    const size_t n = (size_t)sample.width * (size_t)sample.height;
    for (size_t i = 0; i < n; ++i)
    {
        const std::uint8_t r = sample.pixels[i * 4u + 0];
        const std::uint8_t g = sample.pixels[i * 4u + 1];
        const std::uint8_t b = sample.pixels[i * 4u + 2];

        size_t best = 0;
        if (have_last && r == last_r && g == last_g && b == last_b)
        {
            best = last_best;
        }
        else
        {
            std::uint32_t best_d2 = 0xFFFFFFFFu;
            for (size_t c = 0; c < candidates.size(); ++c)
            {
                const int dr = (int)r - (int)candidates[c].rgb.r;
                const int dg = (int)g - (int)candidates[c].rgb.g;
                const int db = (int)b - (int)candidates[c].rgb.b;
                const std::uint32_t d2 = (std::uint32_t)(dr * dr + dg * dg + db * db);
                if (d2 < best_d2)
                {
                    best_d2 = d2;
                    best = c;
                }
            }
            have_last = true;
            last_r = r;
            last_g = g;
            last_b = b;
            last_best = best;
        }

        if (slot_of[best] < 0)
        {
            slot_of[best] = (int)votes.size();
            votes.push_back({candidates[best].id, 0});
        }
        ++votes[(size_t)slot_of[best]].count;
    }

    std::stable_sort(votes.begin(), votes.end(), [](const Vote& a, const Vote& b) { return a.count > b.count; });

    std::vector<int> ids;
    const size_t take = std::min(votes.size(), (size_t)limit);
    ids.reserve(take);
    for (size_t i = 0; i < take; ++i)
        ids.push_back(votes[i].id);
    return ids;
}

std::vector<int> ResolveRankedDyes(const std::optional<std::vector<int>>& precomputed,
                                   const pnt::image::RgbaImage& image,
                                   std::span<const Dye> palette,
                                   int limit)
{
    if (limit <= 0)
        return {};

    if (precomputed && !precomputed->empty())
    {
        const size_t take = std::min(precomputed->size(), (size_t)limit);
        return std::vector<int>(precomputed->begin(), precomputed->begin() + (std::ptrdiff_t)take);
    }

    return RankBestColors(image, palette, limit);
}
} // namespace pnt::palette
