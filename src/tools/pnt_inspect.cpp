#include "core/layout/canvas_layout.h"
#include "core/palette/dye_palette.h"
#include "core/palette/quantize.h"
#include "core/paths.h"
#include "core/template_catalog.h"
#include "io/image_loader.h"
#include "io/template_store.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [--assets <dir>] [--templates] [--image <path> [--best <n>]]\n"
              << "\n"
              << "  --assets <dir>   assets root (default: $PNTSTUDIO_ASSETS_DIR or the config dir)\n"
              << "  --templates      list templates with their layout and resolved default canvas\n"
              << "  --image <path>   rank the dye table's best colours for an image\n"
              << "  --best <n>       number of colours to rank (default 8)\n";
}

static int ListTemplates(const pnt::SessionPaths& paths)
{
    pnt::io::JsonTemplateStore store(paths.templates_dir);
    std::string err;
    if (!store.Reindex(err))
    {
        std::cerr << "pnt_inspect: FAIL: " << err << "\n";
        return 3;
    }

    int failures = 0;
    const std::vector<pnt::TemplateSummary> rows = pnt::BuildTemplateCatalog(store);
    for (const pnt::TemplateSummary& t : rows)
    {
        nlohmann::json descriptor;
        if (!store.Load(t.id, descriptor, err))
        {
            std::cerr << "pnt_inspect: FAIL: " << err << "\n";
            ++failures;
            continue;
        }

        const pnt::layout::CanvasLayout lay = pnt::layout::ResolveLayout(descriptor);
        std::cout << t.category << "\t" << t.family.value_or("-") << "\t" << t.id << "\t" << t.width << "x" << t.height
                  << "\t" << pnt::layout::LayoutKindName(lay.kind);

        if (lay.kind == pnt::layout::LayoutKind::MultiCanvas)
        {
            pnt::layout::CanvasResolution res;
            pnt::Error rerr;
            if (!pnt::layout::ResolveCanvas(descriptor, lay, {}, store, res, rerr))
            {
                std::cout << "\tERROR(" << pnt::ErrorKindName(rerr.kind) << "): " << rerr.message;
                ++failures;
            }
            else
            {
                std::cout << "\t" << *res.request.rows << "x" << *res.request.cols << " tiles -> " << res.canvas->width
                          << "x" << res.canvas->height;
            }
        }
        else if (lay.kind == pnt::layout::LayoutKind::Dynamic)
        {
            std::cout << "\t[" << lay.rows.min << ".." << lay.rows.max << "]";
        }
        std::cout << "\n";
    }

    std::cout << "pnt_inspect: " << rows.size() << " templates";
    if (failures > 0)
        std::cout << ", " << failures << " failed";
    std::cout << "\n";
    return failures == 0 ? 0 : 1;
}

static int RankImage(const pnt::SessionPaths& paths, const std::string& image_path, int best)
{
    pnt::palette::DyePalette pal;
    std::string err;
    if (!pnt::palette::LoadDyePaletteFromJsonFile(paths.dye_palette_path, pal, err))
    {
        std::cerr << "pnt_inspect: FAIL: " << err << "\n";
        return 3;
    }

    pnt::image::RgbaImage img;
    if (!image_loader::LoadImageAsRgba32(image_path, img, err))
    {
        std::cerr << "pnt_inspect: FAIL: " << err << "\n";
        return 3;
    }

    // The scan, not the table's precomputed ranking: this tool exists to inspect the image.
    const std::vector<int> ids = pnt::palette::RankBestColors(img, pal.dyes, best);
    for (size_t i = 0; i < ids.size(); ++i)
    {
        const pnt::palette::Dye* d = pal.Find(ids[i]);
        std::cout << (i + 1) << "\t" << ids[i] << "\t" << (d ? d->name : std::string("?")) << "\t"
                  << (d && d->hex ? *d->hex : std::string("-")) << "\n";
    }
    return 0;
}
} // namespace

int main(int argc, char** argv)
{
    pnt::SessionPaths paths = pnt::SessionPaths::Defaults();
    bool list_templates = false;
    std::string image_path;
    int best = 8;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--assets")
        {
            paths = pnt::SessionPaths::FromAssetsDir(std::string(need("--assets")), paths.output_dir);
        }
        else if (a == "--templates")
        {
            list_templates = true;
        }
        else if (a == "--image")
        {
            image_path = std::string(need("--image"));
        }
        else if (a == "--best")
        {
            best = std::atoi(std::string(need("--best")).c_str());
        }
        else
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    if (!list_templates && image_path.empty())
    {
        PrintUsage(argv[0]);
        return 2;
    }

    int rc = 0;
    if (list_templates)
        rc = ListTemplates(paths);
    if (rc == 0 && !image_path.empty())
        rc = RankImage(paths, image_path, best);
    return rc;
}
