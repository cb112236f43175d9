#pragma once

#include <string>
#include <vector>

namespace pnt
{
// Per-user configuration directory:
// $XDG_CONFIG_HOME/pntstudio, else $HOME/.config/pntstudio, else ".".
std::string GetConfigDir();

// Every filesystem location the session touches.
//
// Defaults() reads the environment once; tests and tools fill the struct explicitly.
struct SessionPaths
{
    std::string assets_dir;
    std::string templates_dir;
    std::string dye_palette_path; // TablaDyes_v1.json
    std::vector<std::string> frame_dirs;
    std::string output_dir;       // scratch space for generated artifacts
    std::string external_library_root;

    // - assets:    $PNTSTUDIO_ASSETS_DIR or "<config_dir>/assets"
    // - output:    $PNTSTUDIO_OUTPUT_DIR or "<tmp>/pntstudio"
    // - userlib:   $PNTSTUDIO_USERLIB_DIR or "<config_dir>/userlib"
    static SessionPaths Defaults();

    // Derives templates/palette/frame locations from an assets root.
    static SessionPaths FromAssetsDir(const std::string& assets_dir, const std::string& output_dir);
};

// Frame images found in the frame directories, in directory order then case-insensitive name
// order. Entries are assets-relative where possible, otherwise the bare file name.
std::vector<std::string> ListFrameImages(const SessionPaths& paths);

// Resolves a border frame reference to an existing image file. Tries, in order:
// the reference as a path, "<assets>/<ref>", "<templates>/<ref>", then a frame-directory entry
// whose file name or assets-relative path equals the reference.
// Returns "" when nothing matches (an unresolvable frame is not an error).
std::string ResolveFrameImagePath(const SessionPaths& paths, const std::string& reference);

bool IsFrameImageExtension(const std::string& path);
} // namespace pnt
