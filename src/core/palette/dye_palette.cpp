#include "core/palette/dye_palette.h"

#include "core/json_util.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <unordered_set>

namespace pnt::palette
{
namespace ju = pnt::json_util;

namespace
{
static const nlohmann::json* FindEntries(const nlohmann::json& j)
{
    if (j.is_array())
        return &j;
    if (!j.is_object())
        return nullptr;
    for (const char* key : {"dyes", "palette", "colors", "entries"})
    {
        const nlohmann::json& v = ju::Field(j, key);
        if (v.is_array() && !v.empty())
            return &v;
    }
    for (const char* key : {"dyes", "palette", "colors", "entries"})
    {
        const nlohmann::json& v = ju::Field(j, key);
        if (v.is_array())
            return &v;
    }
    return nullptr;
}

static std::optional<int> ProbeId(const nlohmann::json& item)
{
    for (const char* key : {"game_id", "id", "index"})
    {
        const nlohmann::json& v = ju::Field(item, key);
        if (!v.is_null())
            return ju::LooseInt(v);
    }
    return std::nullopt;
}

static std::optional<std::array<float, 3>> ParseLinearRgb(const nlohmann::json& v)
{
    if (!v.is_array() || v.size() < 3)
        return std::nullopt;
    std::array<float, 3> out{};
    for (size_t i = 0; i < 3; ++i)
    {
        const std::optional<double> d = ju::LooseDouble(v[i]);
        if (!d)
            return std::nullopt;
        out[i] = (float)*d;
    }
    return out;
}

static std::optional<std::vector<int>> ProbeRanking(const nlohmann::json& j)
{
    if (!j.is_object())
        return std::nullopt;

    for (const char* key : {"ranking", "dye_ranking", "best_colors_ranking"})
    {
        const nlohmann::json& v = ju::Field(j, key);
        if (!v.is_array() || v.empty())
            continue;

        std::vector<int> ids;
        for (const auto& item : v)
        {
            std::optional<int> id;
            if (item.is_object())
            {
                for (const char* id_key : {"id", "dye_id", "game_id"})
                {
                    const nlohmann::json& raw = ju::Field(item, id_key);
                    if (!raw.is_null())
                    {
                        id = ju::LooseInt(raw);
                        break;
                    }
                }
            }
            else
            {
                id = ju::LooseInt(item);
            }
            if (id)
                ids.push_back(*id);
        }
        if (!ids.empty())
            return ids;
    }
    return std::nullopt;
}
} // namespace

const Dye* DyePalette::Find(int id) const
{
    auto it = std::lower_bound(dyes.begin(), dyes.end(), id, [](const Dye& d, int v) { return d.id < v; });
    if (it == dyes.end() || it->id != id)
        return nullptr;
    return &*it;
}

bool ParseHexRgb(std::string_view s, Rgb8& out)
{
    if (!s.empty() && s[0] == '#')
        s.remove_prefix(1);
    // Accept RRGGBB or RRGGBBAA (ignore alpha).
    if (s.size() != 6 && s.size() != 8)
        return false;

    auto nyb = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };
    auto byte_at = [&](size_t i) -> int {
        const int hi = nyb(s[i + 0]);
        const int lo = nyb(s[i + 1]);
        if (hi < 0 || lo < 0)
            return -1;
        return (hi << 4) | lo;
    };

    const int r = byte_at(0);
    const int g = byte_at(2);
    const int b = byte_at(4);
    if (r < 0 || g < 0 || b < 0)
        return false;
    out.r = (std::uint8_t)r;
    out.g = (std::uint8_t)g;
    out.b = (std::uint8_t)b;
    return true;
}

std::optional<Rgb8> DyeRgb8(const Dye& dye)
{
    if (!dye.linear_rgb)
        return std::nullopt;
    auto to8 = [](float v) -> std::uint8_t {
        const double scaled = std::nearbyint((double)v * 255.0);
        return (std::uint8_t)std::clamp(scaled, 0.0, 255.0);
    };
    const auto& c = *dye.linear_rgb;
    return Rgb8{to8(c[0]), to8(c[1]), to8(c[2])};
}

bool ParseDyePalette(const nlohmann::json& j, DyePalette& out, std::string& err)
{
    err.clear();
    out = {};

    const nlohmann::json* entries = FindEntries(j);
    if (!entries)
    {
        err = "Expected a dye array (top-level or under \"dyes\")";
        return false;
    }

    std::unordered_set<int> seen;
    for (const auto& item : *entries)
    {
        if (!item.is_object())
            continue;
        const std::optional<int> id = ProbeId(item);
        if (!id || !seen.insert(*id).second)
            continue;

        Dye d;
        d.id = *id;

        const nlohmann::json& name = ju::Field(item, "name");
        if (name.is_string() && !name.get_ref<const std::string&>().empty())
            d.name = name.get<std::string>();
        else
            d.name = "Dye " + std::to_string(d.id);

        const nlohmann::json& hex = ju::FieldEither(item, "hex_srgb", "hex");
        if (hex.is_string())
        {
            std::string h = ju::Trim(hex.get_ref<const std::string&>());
            if (!h.empty())
                d.hex = std::move(h);
        }

        d.linear_rgb = ParseLinearRgb(ju::Field(item, "linear_rgb"));
        out.dyes.push_back(std::move(d));
    }

    std::sort(out.dyes.begin(), out.dyes.end(), [](const Dye& a, const Dye& b) { return a.id < b.id; });
    out.ranking = ProbeRanking(j);
    return true;
}

bool LoadDyePaletteFromJsonFile(const std::string& path, DyePalette& out, std::string& err)
{
    err.clear();
    out = {};

    std::ifstream f(path);
    if (!f)
    {
        err = std::string("Failed to open ") + path;
        return false;
    }

    nlohmann::json j;
    try
    {
        f >> j;
    }
    catch (const std::exception& e)
    {
        err = path + ": " + e.what();
        return false;
    }

    if (!ParseDyePalette(j, out, err))
    {
        err = path + ": " + err;
        return false;
    }
    return true;
}
} // namespace pnt::palette
