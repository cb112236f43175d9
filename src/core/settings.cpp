#include "core/settings.h"

#include "core/json_util.h"

#include <algorithm>
#include <cmath>

namespace pnt::settings
{
namespace ju = pnt::json_util;

namespace
{
// Loose string read for enum-like fields: non-string truthy values are kept as their JSON text
// so they still fail validation downstream instead of silently becoming the default.
static std::string LooseToken(const nlohmann::json& v)
{
    if (v.is_string())
        return ju::LowerToken(v);
    if (!ju::Truthy(v))
        return {};
    return ju::ToLowerAscii(v.dump());
}

static bool ParseDitherMode(std::string_view token, DitherMode& out)
{
    if (token == "none")
        out = DitherMode::None;
    else if (token == "error_diffusion" || token == "error-diffusion" || token == "palette_fs")
        out = DitherMode::ErrorDiffusion;
    else if (token == "ordered" || token == "palette_ordered")
        out = DitherMode::Ordered;
    else
        return false;
    return true;
}
} // namespace

DitheringConfig NormalizeDithering(const nlohmann::json& raw)
{
    DitheringConfig cfg;
    if (!raw.is_object())
        return cfg;

    DitherMode mode = DitherMode::None;
    if (ParseDitherMode(ju::LowerToken(ju::Field(raw, "mode")), mode))
        cfg.mode = mode;

    const std::optional<double> strength = ju::LooseDouble(ju::Field(raw, "strength"));
    cfg.strength = (float)std::clamp(strength.value_or(0.5), 0.0, 1.0);
    return cfg;
}

BorderConfig NormalizeBorder(const nlohmann::json& raw)
{
    BorderConfig cfg;
    if (!raw.is_object())
        return cfg;

    const std::string style = ju::LowerToken(ju::Field(raw, "style"));
    if (style == "image")
        cfg.style = BorderStyle::Image;

    cfg.size = std::max(0, ju::LooseInt(ju::Field(raw, "size")).value_or(0));

    const nlohmann::json& frame = ju::FieldEither(raw, "frame_image", "frameImage");
    if (frame.is_string())
        cfg.frame_image = ju::Trim(frame.get_ref<const std::string&>());
    return cfg;
}

CanvasRequest ParseCanvasRequest(const nlohmann::json& raw)
{
    CanvasRequest req;
    if (!raw.is_object())
        return req;

    req.mode = ju::LowerToken(ju::Field(raw, "mode"));
    req.rows = ju::LooseInt(ju::Field(raw, "rows"));
    req.cols = ju::LooseInt(ju::Field(raw, "cols"));
    req.rows_y = ju::LooseInt(ju::FieldEither(raw, "rows_y", "rowsY"));
    req.blocks_x = ju::LooseInt(ju::FieldEither(raw, "blocks_x", "blocksX"));
    return req;
}

nlohmann::json CanvasRequestToJson(const CanvasRequest& req)
{
    nlohmann::json j = nlohmann::json::object();
    if (!req.mode.empty())
        j["mode"] = req.mode;
    if (req.rows)
        j["rows"] = *req.rows;
    if (req.cols)
        j["cols"] = *req.cols;
    if (req.rows_y)
        j["rows_y"] = *req.rows_y;
    if (req.blocks_x)
        j["blocks_x"] = *req.blocks_x;
    return j;
}

NormalizedSettings NormalizeSettings(const nlohmann::json& bundle)
{
    NormalizedSettings out;
    if (!bundle.is_object())
        return out;

    // Dye selection.
    if (bundle.contains("useAllDyes"))
        out.dyes.use_all = ju::Truthy(bundle["useAllDyes"]);
    else if (bundle.contains("use_all_dyes"))
        out.dyes.use_all = ju::Truthy(bundle["use_all_dyes"]);

    if (!out.dyes.use_all)
    {
        const nlohmann::json& enabled = ju::FieldEither(bundle, "enabledDyes", "enabled_dyes");
        if (enabled.is_array())
        {
            for (const auto& item : enabled)
            {
                if (const std::optional<int> id = ju::LooseInt(item))
                    out.dyes.enabled.insert(*id);
            }
        }
    }

    out.dyes.best_colors = std::max(0, ju::LooseInt(ju::FieldEither(bundle, "bestColors", "best_colors")).value_or(0));

    out.dithering = NormalizeDithering(ju::FieldEither(bundle, "ditheringConfig", "dithering_config"));
    out.border = NormalizeBorder(ju::FieldEither(bundle, "borderConfig", "border_config"));

    PreviewMode mode = PreviewMode::Visual;
    if (ParsePreviewMode(ju::LowerToken(ju::FieldEither(bundle, "preview_mode", "previewMode")), mode))
        out.preview_mode = mode;

    const nlohmann::json& overlay = ju::FieldEither(bundle, "show_game_object", "showOverlay");
    if (bundle.contains("show_game_object") || bundle.contains("showOverlay"))
        out.show_overlay = ju::Truthy(overlay);

    if (bundle.contains("canvasRequest") || bundle.contains("canvas_request"))
        out.canvas_request = ParseCanvasRequest(ju::FieldEither(bundle, "canvasRequest", "canvas_request"));

    out.preview_quality = LooseToken(ju::FieldEither(bundle, "preview_quality", "previewQuality"));
    out.preview_max_dim = ju::LooseInt(ju::FieldEither(bundle, "previewMaxDim", "preview_max_dim"));
    out.writer_mode = LooseToken(ju::FieldEither(bundle, "writerMode", "writer_mode"));

    const nlohmann::json& image_name = ju::FieldEither(bundle, "imageName", "image_name");
    if (image_name.is_string())
        out.image_name = ju::Trim(image_name.get_ref<const std::string&>());

    return out;
}

bool ParsePreviewMode(std::string_view token, PreviewMode& out)
{
    if (token == "visual")
        out = PreviewMode::Visual;
    else if (token == "simulation" || token == "ark_simulation")
        out = PreviewMode::Simulation;
    else
        return false;
    return true;
}

bool ParsePreviewQuality(std::string_view token, PreviewQuality& out)
{
    if (token.empty() || token == "final")
        out = PreviewQuality::Final;
    else if (token == "fast")
        out = PreviewQuality::Fast;
    else
        return false;
    return true;
}

bool ParseWriterMode(std::string_view token, WriterMode& out)
{
    if (token.empty() || token == "auto" || token == "raster20")
        out = WriterMode::Raster20;
    else if (token == "legacy_copy")
        out = WriterMode::LegacyCopy;
    else if (token == "preserve_source")
        out = WriterMode::PreserveSource;
    else
        return false;
    return true;
}

const char* DitherModeName(DitherMode m)
{
    switch (m)
    {
        case DitherMode::None: return "none";
        case DitherMode::ErrorDiffusion: return "error_diffusion";
        case DitherMode::Ordered: return "ordered";
    }
    return "none";
}

const char* BorderStyleName(BorderStyle s)
{
    return s == BorderStyle::Image ? "image" : "none";
}

const char* PreviewModeName(PreviewMode m)
{
    return m == PreviewMode::Simulation ? "simulation" : "visual";
}

const char* WriterModeName(WriterMode m)
{
    switch (m)
    {
        case WriterMode::LegacyCopy: return "legacy_copy";
        case WriterMode::Raster20: return "raster20";
        case WriterMode::PreserveSource: return "preserve_source";
    }
    return "raster20";
}
} // namespace pnt::settings
