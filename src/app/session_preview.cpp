#include "app/session.h"

#include "core/json_util.h"
#include "io/image_loader.h"
#include "io/image_writer.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace pnt
{
namespace ju = pnt::json_util;

namespace
{
// Fast previews never shrink below this on their longer side.
static constexpr int kFastPreviewMinSide = 64;

static int FastPreviewSide(int requested_max_dim)
{
    const int d = std::max(1, requested_max_dim);
    return std::max(kFastPreviewMinSide, std::min(d, (int)(d * 0.5)));
}
} // namespace

// Overlay composition is enrichment: any problem with the asset leaves the preview as rendered.
bool Session::ComposeOverlayLocked(image::RgbaImage& preview) const
{
    if (m_state.preview_mode != settings::PreviewMode::Simulation || !m_state.show_overlay)
        return false;

    const nlohmann::json& pv = ju::ObjectField(m_state.descriptor, "preview");
    if (ju::LowerToken(ju::Field(pv, "mode")) != "overlay")
        return false;

    const nlohmann::json& dir_v = ju::Field(pv, "overlay_dir");
    const nlohmann::json& base_v = ju::Field(pv, "base_name");
    const std::string overlay_dir = dir_v.is_string() ? ju::Trim(dir_v.get_ref<const std::string&>()) : std::string();
    const std::string base_name = base_v.is_string() ? ju::Trim(base_v.get_ref<const std::string&>()) : std::string();
    if (overlay_dir.empty() || base_name.empty())
        return false;

    const fs::path overlay_path = fs::path(m_paths.templates_dir) / overlay_dir / (base_name + ".png");
    std::error_code ec;
    if (!fs::is_regular_file(overlay_path, ec))
    {
        std::fprintf(stderr, "[preview] overlay not found: %s\n", overlay_path.string().c_str());
        return false;
    }

    image::RgbaImage overlay;
    std::string load_err;
    if (!image_loader::LoadImageAsRgba32(overlay_path.string(), overlay, load_err))
    {
        std::fprintf(stderr, "[preview] overlay skipped: %s\n", load_err.c_str());
        return false;
    }

    if (overlay.width != preview.width || overlay.height != preview.height)
        overlay = image::ResizeNearest(overlay, preview.width, preview.height);
    return image::AlphaCompositeOver(preview, overlay);
}

bool Session::RenderPreview(std::string_view mode,
                            const nlohmann::json& settings,
                            std::vector<std::uint8_t>& out_png,
                            Error& err)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    err.Clear();
    out_png.clear();

    settings::PreviewMode preview_mode = settings::PreviewMode::Visual;
    const std::string mode_token = mode.empty() ? std::string("visual") : ju::ToLowerAscii(ju::Trim(mode));
    if (!settings::ParsePreviewMode(mode_token, preview_mode))
        return err.Set(ErrorKind::InvalidArgument, "mode must be \"visual\" or \"simulation\"");

    const settings::NormalizedSettings s = settings::NormalizeSettings(settings);
    settings::PreviewQuality quality = settings::PreviewQuality::Final;
    if (!settings::ParsePreviewQuality(s.preview_quality, quality))
        return err.Set(ErrorKind::InvalidArgument, "preview_quality must be \"fast\" or \"final\"");

    if (!ApplySettingsLocked(s, err))
        return false;

    m_state.preview_mode = preview_mode;
    m_controller.SetPreviewMode(preview_mode);

    const bool has_source = !m_state.image.Empty() || !m_state.external_artifact_path.empty();
    const bool has_target = !m_state.template_id.empty() || !m_state.external_artifact_path.empty();
    if (!has_source || !has_target)
        return err.Set(ErrorKind::NotReady, "preview-not-ready");

    image::RgbaImage preview;
    if (!m_controller.RenderPreviewIfPossible(preview) || preview.Empty())
        return err.Set(ErrorKind::NotReady, "preview-not-ready");

    ComposeOverlayLocked(preview);

    if (quality == settings::PreviewQuality::Fast && s.preview_max_dim)
        image::FitWithinNearest(preview, FastPreviewSide(*s.preview_max_dim));

    std::string enc_err;
    if (!image_writer::EncodePngRgba32(preview, out_png, enc_err))
        return err.Set(ErrorKind::GenerationFailed, "preview encode failed: " + enc_err);
    return true;
}
} // namespace pnt
