#pragma once

#include "core/image_ops.h"
#include "core/layout/canvas_layout.h"
#include "core/settings.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Narrow seams to the engines this project drives but does not implement.
// Production hosts plug in the real renderer/encoder; tests plug in fakes.
namespace pnt
{
// Template descriptor store (identity / layout / multi_canvas / dynamic / preview sections).
class ITemplateStore
{
public:
    virtual ~ITemplateStore() = default;

    // Stable, sorted ids.
    virtual std::vector<std::string> ListTemplateIds() const = 0;
    virtual bool Load(const std::string& id, nlohmann::json& out, std::string& err) const = 0;
    // Load() with `overrides` merge-patched on top.
    virtual bool Resolve(const std::string& id,
                         const nlohmann::json& overrides,
                         nlohmann::json& out,
                         std::string& err) const = 0;
    // Path of the descriptor relative to the store root ("" when unknown).
    virtual std::string SourceRelPath(const std::string& id) const = 0;
};

// Border as handed to the renderer: the frame reference is already resolved and decoded.
// An unresolvable or undecodable frame leaves `frame_image` empty (no frame, not an error).
struct RenderBorder
{
    settings::BorderStyle style = settings::BorderStyle::None;
    int size = 0;
    std::optional<std::string> frame_path;
    std::optional<image::RgbaImage> frame_image;
};

// The rendering/encoding engine. It owns the actual pixel pipeline and the target binary format.
class IRenderController
{
public:
    virtual ~IRenderController() = default;

    // --- inputs ---
    virtual void SetImage(const image::RgbaImage& img) = 0;
    virtual bool SetTemplate(const std::string& template_id, std::string& err) = 0;
    // Uses an existing artifact as the source instead of a decoded image.
    virtual bool SetExternalArtifact(const std::string& path, std::string& err) = 0;

    // nullopt: every dye is allowed.
    virtual void SetEnabledDyes(const std::optional<std::set<int>>& dye_ids) = 0;
    // Restricts rendering to the top `count` dyes of `ranked_ids`; count 0 lifts the restriction.
    virtual void SetBestColors(int count, const std::vector<int>& ranked_ids) = 0;
    virtual void SetDitheringConfig(const settings::DitheringConfig& cfg) = 0;
    virtual void SetBorder(const RenderBorder& border) = 0;
    virtual void SetPreviewMode(settings::PreviewMode mode) = 0;
    virtual void SetWriterMode(settings::WriterMode mode) = 0;
    virtual void SetMultiCanvasRequest(int rows, int cols) = 0;
    virtual void SetDynamicCanvasRequest(int rows_y, int blocks_x) = 0;

    // --- state ---
    // Descriptor of the active template (null when none is set).
    virtual nlohmann::json TemplateDescriptor() const = 0;
    // Canvas the controller computed for the active template; false when not resolved yet.
    virtual bool CanvasResolved(layout::ResolvedCanvas& out) const = 0;
    // The template's fixed paint area, replacing the "full raster" marker.
    virtual nlohmann::json FixedPaintArea() const = 0;

    // --- actions ---
    // False when image/template are not both set (or nothing could be rendered).
    virtual bool RenderPreviewIfPossible(image::RgbaImage& out) = 0;
    virtual bool RequestGeneration(const std::string& output_path,
                                   const std::string& palette_path,
                                   std::string& err) = 0;
    // One artifact per grid cell, written into `output_dir`.
    virtual bool RequestBatchGeneration(const std::string& output_dir,
                                        const std::string& palette_path,
                                        std::string& err) = 0;
    // Alternate best-colors ranking source; empty when the controller has none.
    virtual std::vector<int> CalculateBestDyes(int n, int sample_side, int max_pixels) = 0;
};

struct ValidationResult
{
    bool ok = false;
    std::string kind;
    std::string message;
};

// Full structural validation of a produced artifact.
class IArtifactValidator
{
public:
    virtual ~IArtifactValidator() = default;
    virtual ValidationResult Validate(const std::string& artifact_path) const = 0;
};

struct ArtifactInfo
{
    bool ok = false;
    bool is_compatible_header = false; // declares the raster-20 format family
    int width = 0;
    int height = 0;
    std::string error;
};

// Cheap header peek.
class IArtifactInspector
{
public:
    virtual ~IArtifactInspector() = default;
    virtual ArtifactInfo Peek(const std::string& artifact_path) const = 0;
};

struct ScanItem
{
    std::string path;
    std::string name;
    std::int64_t size = 0;
    std::optional<std::string> id;
};

struct ScanResult
{
    std::vector<ScanItem> items;
    bool truncated = false; // hit max_files or the time limit
};

// Scans a user library folder for existing artifacts.
class ILibraryScanner
{
public:
    virtual ~ILibraryScanner() = default;
    virtual ScanResult Scan(const std::string& root,
                            bool recursive,
                            bool detect_id,
                            int max_files,
                            double time_limit_s) const = 0;
};
} // namespace pnt
