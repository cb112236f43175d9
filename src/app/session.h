#pragma once

#include "core/collaborators.h"
#include "core/error.h"
#include "core/image_ops.h"
#include "core/layout/canvas_layout.h"
#include "core/palette/dye_palette.h"
#include "core/paths.h"
#include "core/settings.h"
#include "core/template_catalog.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pnt
{
struct InitReport
{
    std::string templates_root;
    std::string dye_table_path;
    bool dye_table_exists = false;
    bool dye_table_loaded = false;

    nlohmann::json ToJson() const;
};

struct ImageInfo
{
    int width = 0;
    int height = 0;
};

// Answer to template / external-artifact selection and canvas requests.
// `canvas.paint_area` is always concrete here (the "full raster" marker is already replaced by the
// controller's fixed paint area).
struct CanvasSelection
{
    std::string template_id;
    std::string external_artifact_path;
    std::optional<settings::CanvasRequest> canvas_request;
    layout::ResolvedCanvas canvas;
    layout::CanvasLayout layout;
    bool canvas_is_dynamic = false;

    nlohmann::json ToJson() const;
};

struct GeneratedArtifact
{
    std::vector<std::uint8_t> bytes;
    std::string file_name; // "<image>_<blueprint>.pnt" or ".zip"
    bool is_archive = false;
};

// Orchestrates one user's editing session against an external render controller.
//
// The caller owns the Session and every collaborator; the collaborators must outlive it.
// Every public entry point locks the session, so a concurrent host is serialized; the *Locked
// helpers assume the lock is held.
class Session
{
public:
    Session(SessionPaths paths,
            IRenderController& controller,
            ITemplateStore& templates,
            IArtifactValidator& validator,
            IArtifactInspector& inspector,
            ILibraryScanner* scanner = nullptr);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Preloads the dye table (best-effort) and reports where resources live.
    InitReport Initialize();

    std::vector<TemplateSummary> ListTemplates() const;
    // Empty when the dye table is missing or unreadable.
    std::vector<palette::Dye> ListDyes();
    std::vector<std::string> ListFrameImages() const;
    // `root` empty: the configured external library root.
    bool ListExternalLibrary(const std::string& root, std::vector<ScanItem>& out, Error& err, int max_files = 5000);

    bool SelectImage(std::span<const std::uint8_t> encoded, const std::string& image_name, ImageInfo& out, Error& err);
    bool SelectTemplate(const std::string& template_id, CanvasSelection& out, Error& err);
    bool SelectExternalArtifact(const std::string& path, CanvasSelection& out, Error& err);

    bool ApplySettings(const nlohmann::json& settings, Error& err);
    bool SetCanvasRequest(const nlohmann::json& request, CanvasSelection& out, Error& err);

    // PNG-encoded preview. `mode`: "visual" or "simulation".
    bool RenderPreview(std::string_view mode,
                       const nlohmann::json& settings,
                       std::vector<std::uint8_t>& out_png,
                       Error& err);
    bool Generate(const nlohmann::json& settings, GeneratedArtifact& out, Error& err);
    // Top `n` dye ids for the current image; turns off "use all dyes".
    bool CalculateBestColors(int n, const nlohmann::json& settings, std::vector<int>& out, Error& err);

    // Copy of the state fields hosts and tests commonly inspect.
    struct Snapshot
    {
        std::string template_id;
        std::string image_name;
        std::string external_artifact_path;
        std::optional<settings::CanvasRequest> canvas_request;
        bool canvas_is_dynamic = false;
        settings::DyeSelection dyes;
        std::vector<int> best_color_ids;
        settings::DitheringConfig dithering;
        settings::BorderConfig border;
        settings::PreviewMode preview_mode = settings::PreviewMode::Visual;
        bool show_overlay = false;
    };
    Snapshot GetSnapshot() const;


private:
    struct State
    {
        image::RgbaImage image;
        std::string image_name;
        std::string template_id;
        nlohmann::json descriptor; // resolved descriptor of the selected template (null = none)
        std::optional<layout::ResolvedCanvas> canvas; // only set for multi_canvas layouts
        std::optional<settings::CanvasRequest> canvas_request;
        bool canvas_is_dynamic = false;
        std::string external_artifact_path;

        settings::DyeSelection dyes;
        std::vector<int> best_color_ids;
        settings::DitheringConfig dithering;
        settings::BorderConfig border;
        settings::PreviewMode preview_mode = settings::PreviewMode::Visual;
        bool show_overlay = false;
    };

    // Dye table is best-effort enrichment: nullopt when missing/unreadable.
    const palette::DyePalette* EnsurePaletteLocked();
    std::vector<int> ResolveRankedDyesLocked(int limit);

    bool ApplySettingsLocked(const settings::NormalizedSettings& s, Error& err);
    void PushBorderLocked();
    bool ResolveCanvasLocked(const settings::CanvasRequest& request, Error& err);
    void CommitCanvasLocked(const layout::CanvasResolution& res);
    void RestoreControllerTemplateLocked();
    bool DescribeCanvasLocked(CanvasSelection& out, Error& err) const;

    bool ComposeOverlayLocked(image::RgbaImage& preview) const;
    bool ValidateArtifactLocked(const std::string& path, Error& err) const;
    bool GenerateSingleLocked(const std::string& image_part,
                              const std::string& blueprint,
                              GeneratedArtifact& out,
                              Error& err);
    bool GenerateMultiLocked(const std::string& image_part,
                             const std::string& blueprint,
                             GeneratedArtifact& out,
                             Error& err);
    std::string BlueprintNameLocked() const;

    SessionPaths m_paths;
    IRenderController& m_controller;
    ITemplateStore& m_templates;
    IArtifactValidator& m_validator;
    IArtifactInspector& m_inspector;
    ILibraryScanner* m_scanner = nullptr;

    mutable std::mutex m_mutex;
    State m_state;
    std::optional<palette::DyePalette> m_palette;
};

// File-name part from an arbitrary label: the last extension is stripped, every run of characters
// outside [A-Za-z0-9_-] becomes a single '_', repeated '_' collapse and leading/trailing '_' are
// trimmed. Returns `fallback` when nothing is left.
std::string SanitizeFilePart(std::string_view value, std::string_view fallback);
} // namespace pnt
