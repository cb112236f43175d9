#pragma once

#include "core/error.h"
#include "core/settings.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace pnt
{
class ITemplateStore;
}

namespace pnt::layout
{
enum class LayoutKind : int
{
    Fixed = 0,   // canvas comes entirely from the controller's template resolution
    MultiCanvas, // rectangular grid of independently generated tiles
    Dynamic,     // pixel size derived from two user-chosen axis counts
};

const char* LayoutKindName(LayoutKind kind);

// Inclusive [min, max] with a default. Normalized so that min <= def <= max.
struct AxisRange
{
    int min = 1;
    int max = 1;
    int def = 1;

    // Missing/unparseable -> def; then clamped into [min, max].
    int Clamp(const std::optional<int>& requested) const;

    bool operator==(const AxisRange& o) const = default;
};

// Derived from a descriptor; never stored.
// For Dynamic, `rows` is the vertical extent ("rows_y") and `cols` the horizontal block count
// ("blocks_x"); both share the descriptor's single range.
struct CanvasLayout
{
    LayoutKind kind = LayoutKind::Fixed;
    AxisRange rows;
    AxisRange cols;

    nlohmann::json ToJson() const;
};

struct ResolvedCanvas
{
    int width = 0;
    int height = 0;
    std::string paint_area_profile = "project";
    // Null means "use full raster": defer to the controller's fixed paint area for the template.
    nlohmann::json paint_area;
    // Per-tile plank metadata, passed through opaquely.
    nlohmann::json planks;

    bool IsFullRaster() const { return paint_area.is_null(); }
    nlohmann::json ToJson() const;
};

struct CanvasResolution
{
    LayoutKind kind = LayoutKind::Fixed;
    // Clamped request, tagged with its layout ("multi_canvas" / "dynamic"); untouched for Fixed.
    settings::CanvasRequest request;
    bool is_dynamic = false;
    // Only set for MultiCanvas; Fixed and Dynamic canvases are computed by the controller.
    std::optional<ResolvedCanvas> canvas;
};

// Pure classification: "multi_canvas" identity type, else a "dynamic" block, else fixed.
LayoutKind ResolveLayoutKind(const nlohmann::json& descriptor);

// Classification plus the descriptor-declared axis ranges.
CanvasLayout ResolveLayout(const nlohmann::json& descriptor);

// Clamps `request` against `layout` and, for multi_canvas templates, computes the tiled pixel
// canvas from the base template's raster (looked up through `store`).
// Fails with NotFound when a multi_canvas descriptor names no loadable base template.
// Resolving the same request twice yields the same result.
bool ResolveCanvas(const nlohmann::json& descriptor,
                   const CanvasLayout& layout,
                   const settings::CanvasRequest& request,
                   const ITemplateStore& store,
                   CanvasResolution& out,
                   Error& err);

// layout.raster.{width,height} of a descriptor (0 when absent).
void RasterSize(const nlohmann::json& descriptor, int& out_w, int& out_h);
} // namespace pnt::layout
