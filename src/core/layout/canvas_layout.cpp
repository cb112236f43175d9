#include "core/layout/canvas_layout.h"

#include "core/collaborators.h"
#include "core/json_util.h"

#include <algorithm>
#include <climits>
#include <cstdint>
#include <vector>

namespace pnt::layout
{
namespace ju = pnt::json_util;

namespace
{
static AxisRange MakeRange(int lo, int hi, int def)
{
    AxisRange r;
    r.min = lo;
    // Inverted bounds collapse onto the lower one.
    r.max = std::max(lo, hi);
    r.def = std::clamp(def, r.min, r.max);
    return r;
}

// multi_canvas.{rows,cols}: {min, max, default}; missing or zero values read as 1.
static AxisRange GridAxisFromJson(const nlohmann::json& axis)
{
    auto read = [&](const char* key) -> int {
        const int v = ju::LooseInt(ju::Field(axis, key)).value_or(1);
        return v >= 1 ? v : 1;
    };
    return MakeRange(read("min"), read("max"), read("default"));
}

// dynamic.values: the sorted integer list defines the shared range; default is the minimum.
static AxisRange DynamicAxisFromJson(const nlohmann::json& dynamic)
{
    std::vector<int> values;
    const nlohmann::json& raw = ju::Field(dynamic, "values");
    if (raw.is_array())
    {
        for (const auto& item : raw)
        {
            if (item.is_number_integer())
                values.push_back(*ju::LooseInt(item));
        }
    }
    if (!values.empty())
    {
        std::sort(values.begin(), values.end());
        return MakeRange(values.front(), values.back(), values.front());
    }

    // Older descriptors spell the range out instead of listing values.
    const int lo = ju::LooseInt(ju::Field(dynamic, "min")).value_or(1);
    const int hi = ju::LooseInt(ju::Field(dynamic, "max")).value_or(lo);
    const int def = ju::LooseInt(ju::Field(dynamic, "default")).value_or(lo);
    return MakeRange(lo, hi, def);
}

static nlohmann::json RangeJson(const AxisRange& r)
{
    return nlohmann::json{{"min", r.min}, {"max", r.max}, {"default", r.def}};
}
} // namespace

const char* LayoutKindName(LayoutKind kind)
{
    switch (kind)
    {
        case LayoutKind::Fixed: return "fixed";
        case LayoutKind::MultiCanvas: return "multi_canvas";
        case LayoutKind::Dynamic: return "dynamic";
    }
    return "fixed";
}

int AxisRange::Clamp(const std::optional<int>& requested) const
{
    return std::clamp(requested.value_or(def), min, max);
}

nlohmann::json CanvasLayout::ToJson() const
{
    nlohmann::json j;
    j["kind"] = LayoutKindName(kind);
    if (kind == LayoutKind::MultiCanvas)
    {
        j["rows"] = RangeJson(rows);
        j["cols"] = RangeJson(cols);
    }
    else if (kind == LayoutKind::Dynamic)
    {
        j["rows_y"] = RangeJson(rows);
        j["blocks_x"] = RangeJson(cols);
    }
    return j;
}

nlohmann::json ResolvedCanvas::ToJson() const
{
    nlohmann::json j;
    j["width"] = width;
    j["height"] = height;
    j["paint_area_profile"] = paint_area_profile;
    j["paint_area"] = paint_area;
    j["planks"] = planks;
    return j;
}

LayoutKind ResolveLayoutKind(const nlohmann::json& descriptor)
{
    if (!descriptor.is_object())
        return LayoutKind::Fixed;

    const nlohmann::json& type = ju::Field(ju::ObjectField(descriptor, "identity"), "type");
    if (type.is_string() && type.get_ref<const std::string&>() == "multi_canvas")
        return LayoutKind::MultiCanvas;

    if (ju::Field(descriptor, "dynamic").is_object())
        return LayoutKind::Dynamic;

    return LayoutKind::Fixed;
}

CanvasLayout ResolveLayout(const nlohmann::json& descriptor)
{
    CanvasLayout layout;
    layout.kind = ResolveLayoutKind(descriptor);

    if (layout.kind == LayoutKind::MultiCanvas)
    {
        const nlohmann::json& multi = ju::ObjectField(descriptor, "multi_canvas");
        layout.rows = GridAxisFromJson(ju::ObjectField(multi, "rows"));
        layout.cols = GridAxisFromJson(ju::ObjectField(multi, "cols"));
    }
    else if (layout.kind == LayoutKind::Dynamic)
    {
        const AxisRange shared = DynamicAxisFromJson(ju::ObjectField(descriptor, "dynamic"));
        layout.rows = shared;
        layout.cols = shared;
    }
    return layout;
}

void RasterSize(const nlohmann::json& descriptor, int& out_w, int& out_h)
{
    const nlohmann::json& raster = ju::ObjectField(ju::ObjectField(descriptor, "layout"), "raster");
    out_w = std::max(0, ju::LooseInt(ju::Field(raster, "width")).value_or(0));
    out_h = std::max(0, ju::LooseInt(ju::Field(raster, "height")).value_or(0));
}

bool ResolveCanvas(const nlohmann::json& descriptor,
                   const CanvasLayout& layout,
                   const settings::CanvasRequest& request,
                   const ITemplateStore& store,
                   CanvasResolution& out,
                   Error& err)
{
    err.Clear();
    out = {};
    out.kind = layout.kind;

    switch (layout.kind)
    {
        case LayoutKind::Fixed:
        {
            out.request = request;
            return true;
        }
        case LayoutKind::MultiCanvas:
        {
            const int rows = layout.rows.Clamp(request.rows);
            const int cols = layout.cols.Clamp(request.cols);
            out.request.mode = "multi_canvas";
            out.request.rows = rows;
            out.request.cols = cols;

            const nlohmann::json& base = ju::Field(ju::ObjectField(descriptor, "identity"), "base_template");
            if (!base.is_string() || base.get_ref<const std::string&>().empty())
                return err.Set(ErrorKind::NotFound, "multi_canvas template declares no base_template");

            nlohmann::json base_descriptor;
            std::string load_err;
            if (!store.Load(base.get<std::string>(), base_descriptor, load_err))
                return err.Set(ErrorKind::NotFound, "base template: " + load_err);

            int tile_w = 0;
            int tile_h = 0;
            RasterSize(base_descriptor, tile_w, tile_h);

            const std::int64_t width = (std::int64_t)tile_w * cols;
            const std::int64_t height = (std::int64_t)tile_h * rows;
            if (width > INT_MAX || height > INT_MAX)
            {
                return err.Set(ErrorKind::InvalidArgument,
                               "multi_canvas grid exceeds the maximum canvas size: " + std::to_string(width) +
                                   "x" + std::to_string(height));
            }

            ResolvedCanvas canvas;
            canvas.width = (int)width;
            canvas.height = (int)height;
            // Tiled canvases always paint the full raster of every tile.
            canvas.paint_area = nullptr;
            out.canvas = std::move(canvas);
            return true;
        }
        case LayoutKind::Dynamic:
        {
            out.request.mode = "dynamic";
            out.request.rows_y = layout.rows.Clamp(request.rows_y);
            out.request.blocks_x = layout.cols.Clamp(request.blocks_x);
            out.is_dynamic = true;
            return true;
        }
    }
    return true;
}
} // namespace pnt::layout
