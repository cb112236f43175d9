#include "app/session.h"

#include "core/json_util.h"
#include "core/palette/quantize.h"
#include "io/image_loader.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace pnt
{
namespace ju = pnt::json_util;

namespace
{
// Sampling constraints handed to the controller's own best-dye ranking.
static constexpr int kControllerBestDyesSampleSide = 256;
static constexpr int kControllerBestDyesMaxPixels = 65536;

static bool IsFullRasterMarker(const nlohmann::json& paint_area)
{
    return paint_area.is_null() || (paint_area.is_string() && paint_area.get_ref<const std::string&>() == "full_raster");
}

static bool FileExists(const std::string& path)
{
    std::error_code ec;
    return !path.empty() && fs::is_regular_file(path, ec);
}
} // namespace

nlohmann::json InitReport::ToJson() const
{
    nlohmann::json j;
    j["ok"] = true;
    j["templatesRoot"] = templates_root;
    j["tablaDyesPath"] = dye_table_path;
    j["tablaDyesExists"] = dye_table_exists;
    j["tablaDyesLoaded"] = dye_table_loaded;
    return j;
}

nlohmann::json CanvasSelection::ToJson() const
{
    nlohmann::json j;
    j["ok"] = true;
    j["selected_template_id"] = template_id;
    if (!external_artifact_path.empty())
        j["selected_external_path"] = external_artifact_path;
    j["canvas_request"] = canvas_request ? settings::CanvasRequestToJson(*canvas_request) : nlohmann::json(nullptr);
    j["canvas_resolved"] = canvas.ToJson();
    j["canvas_layout"] = layout.ToJson();
    j["canvas_is_dynamic"] = canvas_is_dynamic;
    return j;
}

Session::Session(SessionPaths paths,
                 IRenderController& controller,
                 ITemplateStore& templates,
                 IArtifactValidator& validator,
                 IArtifactInspector& inspector,
                 ILibraryScanner* scanner)
    : m_paths(std::move(paths)),
      m_controller(controller),
      m_templates(templates),
      m_validator(validator),
      m_inspector(inspector),
      m_scanner(scanner)
{
}

// ---------------------------------------------------------------------------------------------
// Resources
// ---------------------------------------------------------------------------------------------

const palette::DyePalette* Session::EnsurePaletteLocked()
{
    if (m_palette)
        return &*m_palette;
    if (!FileExists(m_paths.dye_palette_path))
        return nullptr;

    palette::DyePalette loaded;
    std::string err;
    if (!palette::LoadDyePaletteFromJsonFile(m_paths.dye_palette_path, loaded, err))
    {
        std::fprintf(stderr, "[palette] dye table unavailable: %s\n", err.c_str());
        return nullptr;
    }
    std::fprintf(stderr,
                 "[palette] loaded %zu dyes from %s%s\n",
                 loaded.dyes.size(),
                 m_paths.dye_palette_path.c_str(),
                 loaded.ranking ? " (with ranking)" : "");
    m_palette = std::move(loaded);
    return &*m_palette;
}

InitReport Session::Initialize()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    InitReport r;
    r.templates_root = m_paths.templates_dir;
    r.dye_table_path = m_paths.dye_palette_path;
    r.dye_table_exists = FileExists(m_paths.dye_palette_path);
    r.dye_table_loaded = EnsurePaletteLocked() != nullptr;
    return r;
}

std::vector<TemplateSummary> Session::ListTemplates() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return BuildTemplateCatalog(m_templates);
}

std::vector<palette::Dye> Session::ListDyes()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const palette::DyePalette* p = EnsurePaletteLocked();
    return p ? p->dyes : std::vector<palette::Dye>{};
}

std::vector<std::string> Session::ListFrameImages() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return pnt::ListFrameImages(m_paths);
}

bool Session::ListExternalLibrary(const std::string& root, std::vector<ScanItem>& out, Error& err, int max_files)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    err.Clear();
    out.clear();

    if (!m_scanner)
        return err.Set(ErrorKind::NotReady, "no external library scanner configured");

    const std::string trimmed = ju::Trim(root);
    const std::string target = trimmed.empty() ? m_paths.external_library_root : trimmed;
    const ScanResult scan = m_scanner->Scan(target, true, true, std::max(1, max_files), 10.0);

    for (const ScanItem& item : scan.items)
    {
        if (item.path.empty())
            continue;
        ScanItem e = item;
        if (e.name.empty())
            e.name = fs::path(e.path).filename().string();
        e.size = std::max<std::int64_t>(0, e.size);
        if (e.id && ju::Trim(*e.id).empty())
            e.id.reset();
        out.push_back(std::move(e));
    }
    std::stable_sort(out.begin(), out.end(), [](const ScanItem& a, const ScanItem& b) {
        return ju::ToLowerAscii(a.name) < ju::ToLowerAscii(b.name);
    });
    if (scan.truncated)
        std::fprintf(stderr, "[session] external library scan of %s was truncated\n", target.c_str());
    return true;
}

// ---------------------------------------------------------------------------------------------
// Selection
// ---------------------------------------------------------------------------------------------

bool Session::SelectImage(std::span<const std::uint8_t> encoded, const std::string& image_name, ImageInfo& out, Error& err)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    err.Clear();

    image::RgbaImage img;
    std::string decode_err;
    if (!image_loader::LoadImageFromMemoryAsRgba32(encoded, img, decode_err))
        return err.Set(ErrorKind::InvalidArgument, "image decode failed: " + decode_err);

    m_controller.SetImage(img);
    m_state.image = std::move(img);
    m_state.image_name = ju::Trim(image_name);

    out.width = m_state.image.width;
    out.height = m_state.image.height;
    return true;
}

bool Session::SelectTemplate(const std::string& template_id, CanvasSelection& out, Error& err)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    err.Clear();

    std::string ctl_err;
    if (!m_controller.SetTemplate(template_id, ctl_err))
        return err.Set(ErrorKind::NotFound, "template '" + template_id + "': " + ctl_err);

    nlohmann::json descriptor = m_controller.TemplateDescriptor();
    if (descriptor.is_null())
    {
        std::string load_err;
        if (!m_templates.Load(template_id, descriptor, load_err))
        {
            RestoreControllerTemplateLocked();
            return err.Set(ErrorKind::NotFound, "template descriptor was not resolved: " + load_err);
        }
    }

    // Re-clamp whatever grid the user last asked for against the new template. Nothing is
    // committed until that succeeds.
    layout::CanvasResolution res;
    if (!layout::ResolveCanvas(descriptor,
                               layout::ResolveLayout(descriptor),
                               m_state.canvas_request.value_or(settings::CanvasRequest{}),
                               m_templates,
                               res,
                               err))
    {
        RestoreControllerTemplateLocked();
        return false;
    }

    m_state.template_id = template_id;
    m_state.descriptor = std::move(descriptor);
    CommitCanvasLocked(res);
    return DescribeCanvasLocked(out, err);
}

void Session::RestoreControllerTemplateLocked()
{
    if (m_state.template_id.empty())
        return;

    std::string ctl_err;
    if (!m_controller.SetTemplate(m_state.template_id, ctl_err))
    {
        std::fprintf(stderr,
                     "[session] could not restore template '%s': %s\n",
                     m_state.template_id.c_str(),
                     ctl_err.c_str());
        return;
    }
    Error canvas_err;
    if (!ResolveCanvasLocked(m_state.canvas_request.value_or(settings::CanvasRequest{}), canvas_err))
        std::fprintf(stderr, "[session] could not restore canvas: %s\n", canvas_err.message.c_str());
}

bool Session::SelectExternalArtifact(const std::string& path, CanvasSelection& out, Error& err)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    err.Clear();

    if (!FileExists(path))
        return err.Set(ErrorKind::NotFound, "external artifact not found: " + path);

    std::string ctl_err;
    if (!m_controller.SetExternalArtifact(path, ctl_err))
        return err.Set(ErrorKind::InvalidArgument, "external artifact rejected: " + ctl_err);

    layout::ResolvedCanvas canvas;
    if (!m_controller.CanvasResolved(canvas))
        return err.Set(ErrorKind::NotReady, "canvas is not available for external artifact");

    m_state.external_artifact_path = path;
    const nlohmann::json descriptor = m_controller.TemplateDescriptor();
    if (!descriptor.is_null())
        m_state.descriptor = descriptor;
    return DescribeCanvasLocked(out, err);
}

// ---------------------------------------------------------------------------------------------
// Settings / canvas
// ---------------------------------------------------------------------------------------------

std::vector<int> Session::ResolveRankedDyesLocked(int limit)
{
    if (limit <= 0)
        return {};
    const palette::DyePalette* p = EnsurePaletteLocked();
    if (!p)
        return palette::ResolveRankedDyes(std::nullopt, m_state.image, {}, limit);
    return palette::ResolveRankedDyes(p->ranking, m_state.image, p->dyes, limit);
}

void Session::PushBorderLocked()
{
    RenderBorder b;
    b.style = m_state.border.style;
    b.size = m_state.border.size;

    const std::string path = ResolveFrameImagePath(m_paths, m_state.border.frame_image);
    if (!path.empty())
    {
        b.frame_path = path;
        image::RgbaImage frame;
        std::string load_err;
        if (image_loader::LoadImageAsRgba32(path, frame, load_err))
            b.frame_image = std::move(frame);
        else
            std::fprintf(stderr, "[session] frame image ignored: %s\n", load_err.c_str());
    }
    else if (!m_state.border.frame_image.empty())
    {
        std::fprintf(stderr, "[session] frame image not found: %s\n", m_state.border.frame_image.c_str());
    }
    m_controller.SetBorder(b);
}

bool Session::ApplySettingsLocked(const settings::NormalizedSettings& s, Error& err)
{
    m_state.dyes = s.dyes;
    if (s.dyes.use_all)
        m_controller.SetEnabledDyes(std::nullopt);
    else
        m_controller.SetEnabledDyes(s.dyes.enabled);

    m_state.best_color_ids = ResolveRankedDyesLocked(s.dyes.best_colors);
    m_controller.SetBestColors(s.dyes.best_colors, m_state.best_color_ids);

    m_state.dithering = s.dithering;
    m_controller.SetDitheringConfig(s.dithering);

    m_state.border = s.border;
    PushBorderLocked();

    if (s.preview_mode)
    {
        m_state.preview_mode = *s.preview_mode;
        m_controller.SetPreviewMode(*s.preview_mode);
    }
    if (s.show_overlay)
        m_state.show_overlay = *s.show_overlay;

    if (m_state.template_id.empty())
    {
        if (s.canvas_request)
            m_state.canvas_request = s.canvas_request;
        return true;
    }
    const settings::CanvasRequest request =
        s.canvas_request ? *s.canvas_request : m_state.canvas_request.value_or(settings::CanvasRequest{});
    return ResolveCanvasLocked(request, err);
}

bool Session::ApplySettings(const nlohmann::json& settings, Error& err)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    err.Clear();
    return ApplySettingsLocked(settings::NormalizeSettings(settings), err);
}

bool Session::ResolveCanvasLocked(const settings::CanvasRequest& request, Error& err)
{
    const layout::CanvasLayout lay = layout::ResolveLayout(m_state.descriptor);

    layout::CanvasResolution res;
    if (!layout::ResolveCanvas(m_state.descriptor, lay, request, m_templates, res, err))
        return false;
    CommitCanvasLocked(res);
    return true;
}

void Session::CommitCanvasLocked(const layout::CanvasResolution& res)
{
    m_state.canvas_request = res.request;
    m_state.canvas_is_dynamic = res.is_dynamic;
    m_state.canvas = res.canvas;

    switch (res.kind)
    {
        case layout::LayoutKind::MultiCanvas:
            m_controller.SetMultiCanvasRequest(*res.request.rows, *res.request.cols);
            break;
        case layout::LayoutKind::Dynamic:
            m_controller.SetDynamicCanvasRequest(*res.request.rows_y, *res.request.blocks_x);
            break;
        case layout::LayoutKind::Fixed:
            break;
    }
}

bool Session::DescribeCanvasLocked(CanvasSelection& out, Error& err) const
{
    out = {};
    out.template_id = m_state.template_id;
    out.external_artifact_path = m_state.external_artifact_path;
    out.canvas_request = m_state.canvas_request;
    out.canvas_is_dynamic = m_state.canvas_is_dynamic;
    out.layout = layout::ResolveLayout(m_state.descriptor);

    if (m_state.canvas)
    {
        out.canvas = *m_state.canvas;
    }
    else if (!m_controller.CanvasResolved(out.canvas))
    {
        if (out.layout.kind == layout::LayoutKind::Fixed)
            return err.Set(ErrorKind::NotReady, "canvas is not available for the selected template");
        // Tiled/dynamic canvases are sized once the controller has seen a request.
        out.canvas = layout::ResolvedCanvas{};
    }

    if (IsFullRasterMarker(out.canvas.paint_area))
        out.canvas.paint_area = m_controller.FixedPaintArea();
    return true;
}

bool Session::SetCanvasRequest(const nlohmann::json& request, CanvasSelection& out, Error& err)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    err.Clear();

    const settings::CanvasRequest req = settings::ParseCanvasRequest(request);
    if (m_state.template_id.empty())
    {
        m_state.canvas_request = req;
        return err.Set(ErrorKind::NotReady, "no template selected");
    }
    if (!ResolveCanvasLocked(req, err))
        return false;
    return DescribeCanvasLocked(out, err);
}

// ---------------------------------------------------------------------------------------------
// Best colors
// ---------------------------------------------------------------------------------------------

bool Session::CalculateBestColors(int n, const nlohmann::json& settings, std::vector<int>& out, Error& err)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    err.Clear();
    out.clear();

    if (!ApplySettingsLocked(settings::NormalizeSettings(settings), err))
        return false;
    if (n <= 0)
        return true;

    out = m_controller.CalculateBestDyes(n, kControllerBestDyesSampleSide, kControllerBestDyesMaxPixels);
    if (out.empty())
        out = ResolveRankedDyesLocked(n);
    if (out.size() > (size_t)n)
        out.resize((size_t)n);

    m_state.dyes.use_all = false;
    m_controller.SetEnabledDyes(m_state.dyes.enabled);
    return true;
}

Session::Snapshot Session::GetSnapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Snapshot s;
    s.template_id = m_state.template_id;
    s.image_name = m_state.image_name;
    s.external_artifact_path = m_state.external_artifact_path;
    s.canvas_request = m_state.canvas_request;
    s.canvas_is_dynamic = m_state.canvas_is_dynamic;
    s.dyes = m_state.dyes;
    s.best_color_ids = m_state.best_color_ids;
    s.dithering = m_state.dithering;
    s.border = m_state.border;
    s.preview_mode = m_state.preview_mode;
    s.show_overlay = m_state.show_overlay;
    return s;
}

// ---------------------------------------------------------------------------------------------
// Naming
// ---------------------------------------------------------------------------------------------

std::string SanitizeFilePart(std::string_view value, std::string_view fallback)
{
    std::string raw = ju::Trim(value);
    const size_t dot = raw.rfind('.');
    if (dot != std::string::npos)
        raw.erase(dot);

    std::string safe;
    safe.reserve(raw.size());
    for (const char c : raw)
    {
        const unsigned char uc = (unsigned char)c;
        const bool keep = std::isalnum(uc) || c == '-' || c == '_';
        const char ch = keep ? c : '_';
        if (ch == '_' && !safe.empty() && safe.back() == '_')
            continue;
        safe.push_back(ch);
    }

    size_t b = 0;
    size_t e = safe.size();
    while (b < e && safe[b] == '_')
        ++b;
    while (e > b && safe[e - 1] == '_')
        --e;
    safe = safe.substr(b, e - b);
    return safe.empty() ? std::string(fallback) : safe;
}

std::string Session::BlueprintNameLocked() const
{
    std::string name = m_state.template_id;
    if (name.empty())
    {
        const nlohmann::json& identity = ju::ObjectField(m_state.descriptor, "identity");
        for (const char* key : {"id", "label"})
        {
            const nlohmann::json& v = ju::Field(identity, key);
            if (v.is_string() && !v.get_ref<const std::string&>().empty())
            {
                name = v.get<std::string>();
                break;
            }
        }
    }
    return SanitizeFilePart(name, "Canvas");
}
} // namespace pnt
