#include "app/session.h"

#include "core/json_util.h"
#include "io/zip_writer.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace pnt
{
namespace ju = pnt::json_util;

namespace
{
static bool ReadFileBytes(const fs::path& path, std::vector<std::uint8_t>& out, std::string& err)
{
    err.clear();
    out.clear();
    std::ifstream f(path, std::ios::binary);
    if (!f)
    {
        err = "failed to open: " + path.string();
        return false;
    }
    f.seekg(0, std::ios::end);
    const std::streamoff sz = f.tellg();
    if (sz < 0)
    {
        err = "failed to stat: " + path.string();
        return false;
    }
    f.seekg(0, std::ios::beg);
    out.resize((size_t)sz);
    if (!out.empty())
        f.read(reinterpret_cast<char*>(out.data()), (std::streamsize)out.size());
    if (!f && !out.empty())
    {
        err = "failed to read: " + path.string();
        out.clear();
        return false;
    }
    return true;
}

static bool HasPntExtension(const fs::path& p)
{
    return ju::ToLowerAscii(p.extension().string()) == ".pnt";
}

// Empties `dir` of previous artifacts, creating it when missing.
static bool PrepareBatchDir(const fs::path& dir, std::string& err)
{
    std::error_code ec;
    if (!fs::exists(dir, ec))
    {
        fs::create_directories(dir, ec);
        if (ec)
        {
            err = "failed to create " + dir.string() + ": " + ec.message();
            return false;
        }
        return true;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        if (!it->is_regular_file(ec) || !HasPntExtension(it->path()))
            continue;
        std::error_code rm_ec;
        fs::remove(it->path(), rm_ec);
        if (rm_ec)
        {
            err = "failed to remove " + it->path().string() + ": " + rm_ec.message();
            return false;
        }
    }
    if (ec)
    {
        err = "failed to scan " + dir.string() + ": " + ec.message();
        return false;
    }
    return true;
}

static std::vector<fs::path> ListArtifacts(const fs::path& dir)
{
    std::vector<fs::path> out;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        if (it->is_regular_file(ec) && HasPntExtension(it->path()))
            out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}
} // namespace

bool Session::ValidateArtifactLocked(const std::string& path, Error& err) const
{
    const ValidationResult v = m_validator.Validate(path);
    if (!v.ok)
        return err.Set(ErrorKind::ValidationFailed, "generated .pnt failed validation: " + v.kind + " | " + v.message);

    const ArtifactInfo info = m_inspector.Peek(path);
    if (!info.is_compatible_header)
    {
        return err.Set(ErrorKind::ValidationFailed,
                       "generated .pnt is not raster20-compatible: " + fs::path(path).filename().string());
    }
    return true;
}

bool Session::GenerateSingleLocked(const std::string& image_part,
                                   const std::string& blueprint,
                                   GeneratedArtifact& out,
                                   Error& err)
{
    const fs::path target = fs::path(m_paths.output_dir) / "output.pnt";

    std::error_code ec;
    fs::create_directories(m_paths.output_dir, ec);
    if (ec)
        return err.Set(ErrorKind::GenerationFailed, "failed to create " + m_paths.output_dir + ": " + ec.message());
    fs::remove(target, ec);
    if (ec)
        return err.Set(ErrorKind::GenerationFailed, "failed to clear " + target.string() + ": " + ec.message());

    std::string gen_err;
    if (!m_controller.RequestGeneration(target.string(), m_paths.dye_palette_path, gen_err))
        return err.Set(ErrorKind::GenerationFailed, "generation failed: " + gen_err);
    if (!fs::is_regular_file(target, ec))
        return err.Set(ErrorKind::GenerationFailed, "generation did not produce output file");

    if (!ValidateArtifactLocked(target.string(), err))
        return false;

    std::string read_err;
    if (!ReadFileBytes(target, out.bytes, read_err))
        return err.Set(ErrorKind::GenerationFailed, read_err);
    if (out.bytes.empty())
        return err.Set(ErrorKind::EmptyOutput, "generated .pnt is empty");

    out.file_name = image_part + "_" + blueprint + ".pnt";
    out.is_archive = false;
    std::fprintf(stderr, "[generate] %s (%zu bytes)\n", out.file_name.c_str(), out.bytes.size());
    return true;
}

bool Session::GenerateMultiLocked(const std::string& image_part,
                                  const std::string& blueprint,
                                  GeneratedArtifact& out,
                                  Error& err)
{
    const fs::path out_dir = fs::path(m_paths.output_dir) / "output_multi";

    std::string prep_err;
    if (!PrepareBatchDir(out_dir, prep_err))
        return err.Set(ErrorKind::GenerationFailed, prep_err);

    std::string gen_err;
    if (!m_controller.RequestBatchGeneration(out_dir.string(), m_paths.dye_palette_path, gen_err))
        return err.Set(ErrorKind::GenerationFailed, "generation failed: " + gen_err);

    // Grid size: descriptor defaults, overridden by a request recorded for a multi_canvas layout.
    const nlohmann::json& grid = ju::ObjectField(m_state.descriptor, "multi_canvas");
    int rows = std::max(1, ju::LooseInt(ju::Field(ju::ObjectField(grid, "rows"), "default")).value_or(1));
    int cols = std::max(1, ju::LooseInt(ju::Field(ju::ObjectField(grid, "cols"), "default")).value_or(1));
    if (m_state.canvas_request && m_state.canvas_request->mode == "multi_canvas")
    {
        if (m_state.canvas_request->rows.value_or(0) > 0)
            rows = *m_state.canvas_request->rows;
        if (m_state.canvas_request->cols.value_or(0) > 0)
            cols = *m_state.canvas_request->cols;
    }

    const std::vector<fs::path> produced = ListArtifacts(out_dir);
    const size_t expected = (size_t)rows * (size_t)cols;
    if (produced.size() != expected)
    {
        return err.Set(ErrorKind::CountMismatch,
                       "multi-canvas generation mismatch: expected " + std::to_string(expected) + ", got " +
                           std::to_string(produced.size()));
    }

    io::ZipWriter zip;
    for (size_t i = 0; i < produced.size(); ++i)
    {
        const size_t row = i / (size_t)cols;
        const size_t col = i % (size_t)cols;
        const std::string entry_name =
            image_part + "(" + std::to_string(col) + ")(" + std::to_string(row) + ")_" + blueprint + ".pnt";

        if (!ValidateArtifactLocked(produced[i].string(), err))
            return false;

        std::vector<std::uint8_t> bytes;
        std::string io_err;
        if (!ReadFileBytes(produced[i], bytes, io_err))
            return err.Set(ErrorKind::GenerationFailed, io_err);
        if (!zip.AddFile(entry_name, bytes, io_err))
            return err.Set(ErrorKind::GenerationFailed, "archive: " + io_err);
    }

    std::string zip_err;
    if (!zip.Finalize(out.bytes, zip_err))
        return err.Set(ErrorKind::GenerationFailed, "archive: " + zip_err);
    if (out.bytes.empty())
        return err.Set(ErrorKind::EmptyOutput, "generated .zip is empty");

    out.file_name = image_part + "_" + blueprint + ".zip";
    out.is_archive = true;
    std::fprintf(stderr,
                 "[generate] %s (%zu entries, %zu bytes)\n",
                 out.file_name.c_str(),
                 produced.size(),
                 out.bytes.size());
    return true;
}

bool Session::Generate(const nlohmann::json& settings, GeneratedArtifact& out, Error& err)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    err.Clear();
    out = {};

    const settings::NormalizedSettings s = settings::NormalizeSettings(settings);
    if (!ApplySettingsLocked(s, err))
        return false;

    settings::WriterMode writer_mode = settings::WriterMode::Raster20;
    if (!settings::ParseWriterMode(s.writer_mode, writer_mode))
        return err.Set(ErrorKind::InvalidArgument, "writerMode must be one of: legacy_copy, raster20, preserve_source");
    m_controller.SetWriterMode(writer_mode);

    if (m_state.template_id.empty())
        return err.Set(ErrorKind::NotReady, "no template selected");
    if (m_state.image.Empty() && m_state.external_artifact_path.empty())
        return err.Set(ErrorKind::NotReady, "no source image or external artifact");

    // Checked before any output location is touched.
    std::error_code ec;
    if (!fs::is_regular_file(m_paths.dye_palette_path, ec))
        return err.Set(ErrorKind::NotFound, "dye table not found at: " + m_paths.dye_palette_path);

    const std::string image_part =
        SanitizeFilePart(!s.image_name.empty() ? s.image_name : m_state.image_name, "image");
    const std::string blueprint = BlueprintNameLocked();

    if (layout::ResolveLayoutKind(m_state.descriptor) == layout::LayoutKind::MultiCanvas)
        return GenerateMultiLocked(image_part, blueprint, out, err);
    return GenerateSingleLocked(image_part, blueprint, out, err);
}
} // namespace pnt
