#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>
#include <string_view>

// Typed render/generation settings built from the loosely-typed option bundle a caller sends.
// NormalizeSettings() has no failure path: every field has a safe default, so downstream code
// only ever sees canonical values.
namespace pnt::settings
{
enum class DitherMode : int
{
    None = 0,
    ErrorDiffusion,
    Ordered,
};

struct DitheringConfig
{
    DitherMode mode = DitherMode::None;
    float strength = 0.5f; // always within [0, 1]
};

enum class BorderStyle : int
{
    None = 0,
    Image,
};

struct BorderConfig
{
    BorderStyle style = BorderStyle::None;
    int size = 0;            // >= 0
    std::string frame_image; // unresolved frame reference; empty = none
};

enum class PreviewMode : int
{
    Visual = 0,
    Simulation,
};

enum class PreviewQuality : int
{
    Fast = 0,
    Final,
};

enum class WriterMode : int
{
    LegacyCopy = 0,
    Raster20,
    PreserveSource,
};

struct DyeSelection
{
    // True: no palette restriction (enabled set is ignored and cleared).
    bool use_all = true;
    std::set<int> enabled;
    // Requested "best colors" count; 0 clears any resolved ranking.
    int best_colors = 0;
};

// Raw canvas request as sent by the caller. Values are clamped later by the layout resolver
// against the selected template's descriptor. `mode` is the optional request tag
// ("multi_canvas" / "dynamic"), empty when the caller did not send one.
struct CanvasRequest
{
    std::string mode;
    std::optional<int> rows;
    std::optional<int> cols;
    std::optional<int> rows_y;
    std::optional<int> blocks_x;

    bool operator==(const CanvasRequest& o) const = default;
};

struct NormalizedSettings
{
    DyeSelection dyes;
    DitheringConfig dithering;
    BorderConfig border;

    // Absent when the bundle does not carry a recognized value (caller keeps current state).
    std::optional<PreviewMode> preview_mode;
    std::optional<bool> show_overlay;
    std::optional<CanvasRequest> canvas_request;

    // Carried unvalidated: render/generate reject unknown values with invalid-argument.
    std::string preview_quality; // lowercased; empty = default ("final")
    std::optional<int> preview_max_dim;
    std::string writer_mode;     // lowercased; empty = default ("raster20")
    std::string image_name;
};

NormalizedSettings NormalizeSettings(const nlohmann::json& bundle);

DitheringConfig NormalizeDithering(const nlohmann::json& raw);
BorderConfig NormalizeBorder(const nlohmann::json& raw);
CanvasRequest ParseCanvasRequest(const nlohmann::json& raw);
nlohmann::json CanvasRequestToJson(const CanvasRequest& req);

// Enumerations coming from the boundary. Return false for unrecognized tokens.
bool ParsePreviewMode(std::string_view token, PreviewMode& out);
bool ParsePreviewQuality(std::string_view token, PreviewQuality& out); // "" -> Final
bool ParseWriterMode(std::string_view token, WriterMode& out);         // "" / "auto" -> Raster20

const char* DitherModeName(DitherMode m);
const char* BorderStyleName(BorderStyle s);
const char* PreviewModeName(PreviewMode m);
const char* WriterModeName(WriterMode m);
} // namespace pnt::settings
