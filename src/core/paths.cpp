#include "core/paths.h"

#include "core/json_util.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace pnt
{
namespace
{
static std::string EnvOrEmpty(const char* key)
{
    const char* v = std::getenv(key);
    return v ? std::string(v) : std::string();
}

static std::string TempRoot()
{
    std::error_code ec;
    const fs::path tmp = fs::temp_directory_path(ec);
    if (ec)
        return "/tmp";
    return tmp.string();
}

static bool IsRegularFile(const fs::path& p)
{
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

// Assets-relative spelling of `p` ("" when `p` is not under the assets dir).
static std::string AssetsRelative(const SessionPaths& paths, const fs::path& p)
{
    if (paths.assets_dir.empty())
        return {};
    std::error_code ec;
    const fs::path rel = fs::relative(p, fs::path(paths.assets_dir), ec);
    if (ec || rel.empty())
        return {};
    const std::string s = rel.generic_string();
    if (s.rfind("..", 0) == 0)
        return {};
    return s;
}

static std::vector<fs::path> FrameCandidates(const SessionPaths& paths)
{
    std::vector<fs::path> out;
    for (const std::string& dir : paths.frame_dirs)
    {
        std::error_code ec;
        if (!fs::is_directory(dir, ec))
            continue;

        std::vector<fs::path> files;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        {
            if (it->is_regular_file(ec) && IsFrameImageExtension(it->path().string()))
                files.push_back(it->path());
        }
        std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
            return json_util::ToLowerAscii(a.filename().string()) < json_util::ToLowerAscii(b.filename().string());
        });
        out.insert(out.end(), files.begin(), files.end());
    }
    return out;
}
} // namespace

std::string GetConfigDir()
{
    const std::string xdg = EnvOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty())
        return xdg + "/pntstudio";

    const std::string home = EnvOrEmpty("HOME");
    if (!home.empty())
        return home + "/.config/pntstudio";

    return ".";
}

SessionPaths SessionPaths::Defaults()
{
    const std::string config_dir = GetConfigDir();

    std::string assets = EnvOrEmpty("PNTSTUDIO_ASSETS_DIR");
    if (assets.empty())
        assets = (fs::path(config_dir) / "assets").string();

    std::string output = EnvOrEmpty("PNTSTUDIO_OUTPUT_DIR");
    if (output.empty())
        output = (fs::path(TempRoot()) / "pntstudio").string();

    SessionPaths p = FromAssetsDir(assets, output);

    p.external_library_root = EnvOrEmpty("PNTSTUDIO_USERLIB_DIR");
    if (p.external_library_root.empty())
        p.external_library_root = (fs::path(config_dir) / "userlib").string();
    return p;
}

SessionPaths SessionPaths::FromAssetsDir(const std::string& assets_dir, const std::string& output_dir)
{
    SessionPaths p;
    const fs::path assets(assets_dir);
    const fs::path templates = assets / "Templates";

    p.assets_dir = assets.string();
    p.templates_dir = templates.string();
    p.dye_palette_path = (assets / "TablaDyes_v1.json").string();
    p.frame_dirs = {
        (templates / "TiableBorder").string(),
        (templates / "TileableBorder").string(),
        (assets / "frames").string(),
        (assets / "Frames").string(),
    };
    p.output_dir = output_dir;
    return p;
}

bool IsFrameImageExtension(const std::string& path)
{
    const std::string ext = json_util::ToLowerAscii(fs::path(path).extension().string());
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".webp";
}

std::vector<std::string> ListFrameImages(const SessionPaths& paths)
{
    std::vector<std::string> out;
    for (const fs::path& item : FrameCandidates(paths))
    {
        std::string rel = AssetsRelative(paths, item);
        out.push_back(rel.empty() ? item.filename().string() : std::move(rel));
    }
    return out;
}

std::string ResolveFrameImagePath(const SessionPaths& paths, const std::string& reference)
{
    const std::string raw = json_util::Trim(reference);
    if (raw.empty())
        return {};

    const fs::path candidate(raw);
    std::vector<fs::path> direct = {candidate};
    if (!candidate.is_absolute())
    {
        direct.push_back(fs::path(paths.assets_dir) / candidate);
        direct.push_back(fs::path(paths.templates_dir) / candidate);
    }
    for (const fs::path& p : direct)
    {
        if (IsRegularFile(p) && IsFrameImageExtension(p.string()))
            return p.string();
    }

    for (const fs::path& item : FrameCandidates(paths))
    {
        if (item.filename().string() == raw || AssetsRelative(paths, item) == raw)
            return item.string();
    }
    return {};
}
} // namespace pnt
