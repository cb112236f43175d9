#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pnt::palette
{
struct Rgb8
{
    std::uint8_t r = 0, g = 0, b = 0;

    bool operator==(const Rgb8& o) const { return r == o.r && g == o.g && b == o.b; }
};

// One paintable dye. Ids are assigned by the dye table (unique, not necessarily contiguous).
struct Dye
{
    int id = 0;
    std::string name;
    std::optional<std::string> hex;                 // "#RRGGBB" as published by the table
    std::optional<std::array<float, 3>> linear_rgb; // 0..1 per channel
};

// Dye table loaded once from JSON (TablaDyes).
//
// The table format has drifted across dataset versions; this adapter is the only place that
// probes the alternative field names:
// - dye id:    "game_id" | "id" | "index"
// - hex:       "hex_srgb" | "hex"
// - entries:   top-level array, or "dyes" | "palette" | "colors" | "entries"
// - ranking:   "ranking" | "dye_ranking" | "best_colors_ranking"
//              (ints, or objects with "id" | "dye_id" | "game_id")
// Everything downstream only sees the canonical fields below.
struct DyePalette
{
    std::vector<Dye> dyes; // ascending by id
    std::optional<std::vector<int>> ranking;

    const Dye* Find(int id) const;
};

// Returns false (and sets err) when the file is missing or not parseable. Malformed entries are
// skipped silently; a parseable table with zero valid dyes is still a success.
bool LoadDyePaletteFromJsonFile(const std::string& path, DyePalette& out, std::string& err);
bool ParseDyePalette(const nlohmann::json& j, DyePalette& out, std::string& err);

// linear_rgb (0..1) -> 8-bit RGB: v * 255 rounded to nearest and clamped.
// nullopt when the dye has no linear colour.
std::optional<Rgb8> DyeRgb8(const Dye& dye);

bool ParseHexRgb(std::string_view s, Rgb8& out);
} // namespace pnt::palette
