#include "session_harness.h"

#include <gtest/gtest.h>

using nlohmann::json;
using pnt::CanvasSelection;
using pnt::Error;
using pnt::ErrorKind;
using pnt::test::SolidImage;

namespace
{
class SessionTest : public ::testing::Test
{
protected:
    pnt::test::SessionHarness h;
};
} // namespace

// --- resources -------------------------------------------------------------------------------

TEST_F(SessionTest, InitializeReportsDyeTableState)
{
    pnt::InitReport r = h.session->Initialize();
    EXPECT_EQ(r.templates_root, h.paths.templates_dir);
    EXPECT_EQ(r.dye_table_path, h.paths.dye_palette_path);
    EXPECT_FALSE(r.dye_table_exists);
    EXPECT_FALSE(r.dye_table_loaded);

    h.WriteDyeTable();
    r = h.session->Initialize();
    EXPECT_TRUE(r.dye_table_exists);
    EXPECT_TRUE(r.dye_table_loaded);

    const json j = r.ToJson();
    EXPECT_EQ(j["ok"], true);
    EXPECT_EQ(j["tablaDyesLoaded"], true);
    EXPECT_EQ(j["templatesRoot"], h.paths.templates_dir);
}

TEST_F(SessionTest, UnreadableDyeTableIsNotLoaded)
{
    pnt::test::WriteTextFile(h.paths.dye_palette_path, "{ broken");
    const pnt::InitReport r = h.session->Initialize();
    EXPECT_TRUE(r.dye_table_exists);
    EXPECT_FALSE(r.dye_table_loaded);
    EXPECT_TRUE(h.session->ListDyes().empty());
}

TEST_F(SessionTest, ListDyes)
{
    EXPECT_TRUE(h.session->ListDyes().empty());

    h.WriteDyeTable();
    const std::vector<pnt::palette::Dye> dyes = h.session->ListDyes();
    ASSERT_EQ(dyes.size(), 3u);
    EXPECT_EQ(dyes[0].id, 1);
    EXPECT_EQ(dyes[2].name, "Blue");
}

TEST_F(SessionTest, ListTemplatesUsesStore)
{
    h.store.rel_paths["tile"] = "Structures/Signs/tile.json";
    const std::vector<pnt::TemplateSummary> rows = h.session->ListTemplates();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].id, "tile");
    EXPECT_EQ(rows[0].category, "structures");
    EXPECT_EQ(rows[0].family, "Signs");
    EXPECT_EQ(rows[0].width, 128);
}

TEST_F(SessionTest, ListFrameImages)
{
    EXPECT_TRUE(h.session->ListFrameImages().empty());
    pnt::test::WriteTextFile(std::filesystem::path(h.paths.assets_dir) / "frames" / "Gold.png", "x");
    EXPECT_EQ(h.session->ListFrameImages(), (std::vector<std::string>{"frames/Gold.png"}));
}

// --- external library ------------------------------------------------------------------------

TEST_F(SessionTest, ExternalLibraryIsFilteredAndSorted)
{
    pnt::ScanItem a;
    a.path = "/lib/zebra.pnt";
    a.size = -5;
    a.id = "  ";
    pnt::ScanItem b;
    b.path = "/lib/x/Apple.pnt";
    b.name = "Apple";
    b.size = 10;
    b.id = "apple_1";
    pnt::ScanItem empty;
    empty.name = "no path";
    h.scanner.result.items = {a, empty, b};
    h.scanner.result.truncated = true;

    std::vector<pnt::ScanItem> items;
    Error err;
    ASSERT_TRUE(h.session->ListExternalLibrary("", items, err)) << err.message;
    EXPECT_EQ(h.scanner.last_root, h.paths.external_library_root);
    EXPECT_EQ(h.scanner.last_max_files, 5000);
    EXPECT_DOUBLE_EQ(h.scanner.last_time_limit, 10.0);

    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].name, "Apple");
    EXPECT_EQ(items[0].id, "apple_1");
    EXPECT_EQ(items[1].name, "zebra.pnt");
    EXPECT_EQ(items[1].size, 0);
    EXPECT_FALSE(items[1].id.has_value());

    ASSERT_TRUE(h.session->ListExternalLibrary(" /elsewhere ", items, err, 0));
    EXPECT_EQ(h.scanner.last_root, "/elsewhere");
    EXPECT_EQ(h.scanner.last_max_files, 1);
}

TEST_F(SessionTest, ExternalLibraryNeedsScanner)
{
    h.Rebuild(nullptr);
    std::vector<pnt::ScanItem> items;
    Error err;
    EXPECT_FALSE(h.session->ListExternalLibrary("", items, err));
    EXPECT_EQ(err.kind, ErrorKind::NotReady);
}

// --- selection -------------------------------------------------------------------------------

TEST_F(SessionTest, SelectImage)
{
    const std::vector<std::uint8_t> png = pnt::test::SessionHarness::Png(SolidImage(7, 5, 1, 2, 3));
    pnt::ImageInfo info;
    Error err;
    ASSERT_TRUE(h.session->SelectImage(png, "  cat.png ", info, err)) << err.message;
    EXPECT_EQ(info.width, 7);
    EXPECT_EQ(info.height, 5);
    ASSERT_TRUE(h.controller.image.has_value());
    EXPECT_EQ(h.controller.image->width, 7);
    EXPECT_EQ(h.session->GetSnapshot().image_name, "cat.png");

    const std::vector<std::uint8_t> junk = {1, 2, 3, 4};
    EXPECT_FALSE(h.session->SelectImage(junk, "junk", info, err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidArgument);
}

TEST_F(SessionTest, SelectFixedTemplateUsesControllerPaintArea)
{
    CanvasSelection sel;
    Error err;
    ASSERT_TRUE(h.session->SelectTemplate("tile", sel, err)) << err.message;
    EXPECT_EQ(sel.template_id, "tile");
    EXPECT_EQ(sel.layout.kind, pnt::layout::LayoutKind::Fixed);
    EXPECT_EQ(sel.canvas.width, 128);
    EXPECT_EQ(sel.canvas.height, 64);
    EXPECT_EQ(sel.canvas.paint_area, h.controller.fixed_paint_area);
    EXPECT_FALSE(sel.canvas_is_dynamic);

    const json j = sel.ToJson();
    EXPECT_EQ(j["selected_template_id"], "tile");
    EXPECT_EQ(j["canvas_layout"]["kind"], "fixed");
    EXPECT_EQ(j["canvas_resolved"]["width"], 128);
}

TEST_F(SessionTest, SelectUnknownTemplateIsNotFound)
{
    CanvasSelection sel;
    Error err;
    EXPECT_FALSE(h.session->SelectTemplate("nope", sel, err));
    EXPECT_EQ(err.kind, ErrorKind::NotFound);
    EXPECT_TRUE(h.session->GetSnapshot().template_id.empty());
}

TEST_F(SessionTest, FailedSelectionKeepsPreviousTemplate)
{
    h.store.templates["broken"] = pnt::test::MultiDescriptor("broken", "missing", 2, 2);
    h.SelectTemplate("grid");

    CanvasSelection sel;
    Error err;
    ASSERT_TRUE(h.session->SetCanvasRequest({{"rows", 2}, {"cols", 3}}, sel, err)) << err.message;
    h.controller.multi_rows = 0;
    h.controller.multi_cols = 0;

    EXPECT_FALSE(h.session->SelectTemplate("broken", sel, err));
    EXPECT_EQ(err.kind, ErrorKind::NotFound);
    EXPECT_EQ(err.message, "base template: template not found: missing");

    EXPECT_EQ(h.session->GetSnapshot().template_id, "grid");
    EXPECT_EQ(h.controller.template_id, "grid");
    EXPECT_EQ(h.controller.multi_rows, 2);
    EXPECT_EQ(h.controller.multi_cols, 3);

    Error apply_err;
    EXPECT_TRUE(h.session->ApplySettings(json::object(), apply_err)) << apply_err.message;
    ASSERT_TRUE(h.session->SetCanvasRequest({{"rows", 1}, {"cols", 1}}, sel, err)) << err.message;
    EXPECT_EQ(sel.template_id, "grid");
    EXPECT_EQ(sel.canvas.width, 128);
}

TEST_F(SessionTest, FailedFirstSelectionLeavesSessionEmpty)
{
    h.store.templates["broken"] = pnt::test::MultiDescriptor("broken", "missing", 2, 2);

    CanvasSelection sel;
    Error err;
    EXPECT_FALSE(h.session->SelectTemplate("broken", sel, err));
    EXPECT_EQ(err.kind, ErrorKind::NotFound);
    EXPECT_TRUE(h.session->GetSnapshot().template_id.empty());
    EXPECT_FALSE(h.session->GetSnapshot().canvas_request.has_value());
}

TEST_F(SessionTest, EarlyCanvasRequestIsClampedOnSelection)
{
    CanvasSelection sel;
    Error err;
    EXPECT_FALSE(h.session->SetCanvasRequest({{"rows", 0}, {"cols", 999}}, sel, err));
    EXPECT_EQ(err.kind, ErrorKind::NotReady);

    ASSERT_TRUE(h.session->SelectTemplate("grid", sel, err)) << err.message;
    EXPECT_EQ(sel.layout.kind, pnt::layout::LayoutKind::MultiCanvas);
    ASSERT_TRUE(sel.canvas_request.has_value());
    EXPECT_EQ(sel.canvas_request->mode, "multi_canvas");
    EXPECT_EQ(sel.canvas_request->rows, 1);
    EXPECT_EQ(sel.canvas_request->cols, 4);
    EXPECT_EQ(sel.canvas.width, 512);
    EXPECT_EQ(sel.canvas.height, 64);
    // Tiles paint the full raster, reported as the controller's fixed paint area.
    EXPECT_EQ(sel.canvas.paint_area, h.controller.fixed_paint_area);
    EXPECT_EQ(h.controller.multi_rows, 1);
    EXPECT_EQ(h.controller.multi_cols, 4);
}

TEST_F(SessionTest, MultiCanvasRequestResizes)
{
    h.SelectTemplate("grid");

    CanvasSelection sel;
    Error err;
    ASSERT_TRUE(h.session->SetCanvasRequest({{"rows", "3"}, {"cols", 2}}, sel, err)) << err.message;
    EXPECT_EQ(sel.canvas.width, 256);
    EXPECT_EQ(sel.canvas.height, 192);
    EXPECT_EQ(h.controller.multi_rows, 3);
    EXPECT_EQ(h.controller.multi_cols, 2);

    // Same request again: same answer.
    CanvasSelection again;
    ASSERT_TRUE(h.session->SetCanvasRequest({{"rows", 3}, {"cols", 2}}, again, err));
    EXPECT_EQ(again.ToJson(), sel.ToJson());
}

TEST_F(SessionTest, DynamicTemplate)
{
    CanvasSelection sel;
    Error err;
    ASSERT_TRUE(h.session->SelectTemplate("dyn", sel, err)) << err.message;
    EXPECT_TRUE(sel.canvas_is_dynamic);
    EXPECT_EQ(sel.layout.kind, pnt::layout::LayoutKind::Dynamic);
    EXPECT_EQ(h.controller.dyn_rows_y, 2);
    EXPECT_EQ(h.controller.dyn_blocks_x, 2);

    pnt::layout::ResolvedCanvas sized;
    sized.width = 300;
    sized.height = 40;
    sized.paint_area = {{"shape", "rect"}, {"w", 300}};
    h.controller.canvas_override = sized;

    ASSERT_TRUE(h.session->SetCanvasRequest({{"rowsY", 100}, {"blocks_x", 3}}, sel, err)) << err.message;
    EXPECT_EQ(h.controller.dyn_rows_y, 8);
    EXPECT_EQ(h.controller.dyn_blocks_x, 3);
    EXPECT_EQ(sel.canvas.width, 300);
    EXPECT_EQ(sel.canvas.paint_area, sized.paint_area);
    EXPECT_TRUE(h.session->GetSnapshot().canvas_is_dynamic);
}

TEST_F(SessionTest, SwitchingToFixedClearsTiledCanvas)
{
    h.SelectTemplate("grid");
    CanvasSelection sel;
    Error err;
    ASSERT_TRUE(h.session->SelectTemplate("tile", sel, err)) << err.message;
    EXPECT_EQ(sel.canvas.width, 128);
    EXPECT_EQ(sel.layout.kind, pnt::layout::LayoutKind::Fixed);
}

TEST_F(SessionTest, SelectExternalArtifact)
{
    CanvasSelection sel;
    Error err;
    const std::string path = (h.dir.Path() / "userlib" / "sign.pnt").string();

    EXPECT_FALSE(h.session->SelectExternalArtifact(path, sel, err));
    EXPECT_EQ(err.kind, ErrorKind::NotFound);

    pnt::test::WriteBytes(path, {'P', 'N', 'T'});
    h.controller.accept_external = false;
    EXPECT_FALSE(h.session->SelectExternalArtifact(path, sel, err));
    EXPECT_EQ(err.kind, ErrorKind::InvalidArgument);

    h.controller.accept_external = true;
    EXPECT_FALSE(h.session->SelectExternalArtifact(path, sel, err));
    EXPECT_EQ(err.kind, ErrorKind::NotReady);
    EXPECT_TRUE(h.session->GetSnapshot().external_artifact_path.empty());

    pnt::layout::ResolvedCanvas canvas;
    canvas.width = 64;
    canvas.height = 32;
    canvas.paint_area = "full_raster";
    h.controller.canvas_override = canvas;
    ASSERT_TRUE(h.session->SelectExternalArtifact(path, sel, err)) << err.message;
    EXPECT_EQ(sel.external_artifact_path, path);
    EXPECT_EQ(sel.canvas.width, 64);
    EXPECT_EQ(sel.canvas.paint_area, h.controller.fixed_paint_area);
    EXPECT_EQ(h.controller.external_path, path);
    EXPECT_EQ(sel.ToJson()["selected_external_path"], path);
}

// --- settings --------------------------------------------------------------------------------

TEST_F(SessionTest, ApplySettingsPushesToController)
{
    const pnt::image::RgbaImage frame = SolidImage(4, 4, 200, 150, 0);
    pnt::test::WriteBytes(std::filesystem::path(h.paths.assets_dir) / "frames" / "wood.png",
                          pnt::test::SessionHarness::Png(frame));

    Error err;
    ASSERT_TRUE(h.session->ApplySettings({{"useAllDyes", false},
                                          {"enabledDyes", {3, 1}},
                                          {"ditheringConfig", {{"mode", "ordered"}, {"strength", 0.25}}},
                                          {"borderConfig", {{"style", "image"}, {"size", 6}, {"frame_image", "wood.png"}}},
                                          {"preview_mode", "ark_simulation"},
                                          {"showOverlay", true}},
                                         err))
        << err.message;

    ASSERT_TRUE(h.controller.enabled_dyes.has_value());
    EXPECT_EQ(*h.controller.enabled_dyes, (std::set<int>{1, 3}));
    EXPECT_EQ(h.controller.dithering.mode, pnt::settings::DitherMode::Ordered);
    EXPECT_FLOAT_EQ(h.controller.dithering.strength, 0.25f);
    EXPECT_EQ(h.controller.border.style, pnt::settings::BorderStyle::Image);
    EXPECT_EQ(h.controller.border.size, 6);
    ASSERT_TRUE(h.controller.border.frame_path.has_value());
    ASSERT_TRUE(h.controller.border.frame_image.has_value());
    EXPECT_EQ(h.controller.border.frame_image->width, 4);
    EXPECT_EQ(h.controller.preview_mode, pnt::settings::PreviewMode::Simulation);

    const pnt::Session::Snapshot snap = h.session->GetSnapshot();
    EXPECT_FALSE(snap.dyes.use_all);
    EXPECT_TRUE(snap.show_overlay);
    EXPECT_EQ(snap.preview_mode, pnt::settings::PreviewMode::Simulation);

    ASSERT_TRUE(h.session->ApplySettings({{"useAllDyes", true}, {"enabledDyes", {3}}}, err));
    EXPECT_FALSE(h.controller.enabled_dyes.has_value());
    // Unresolvable frames are dropped, not errors.
    EXPECT_FALSE(h.controller.border.frame_path.has_value());
    // Omitted preview mode keeps the current one.
    EXPECT_EQ(h.session->GetSnapshot().preview_mode, pnt::settings::PreviewMode::Simulation);
}

TEST_F(SessionTest, ApplySettingsCanvasRequest)
{
    h.SelectTemplate("grid");
    Error err;
    ASSERT_TRUE(h.session->ApplySettings({{"canvasRequest", {{"rows", 2}, {"cols", 9}}}}, err)) << err.message;
    EXPECT_EQ(h.controller.multi_rows, 2);
    EXPECT_EQ(h.controller.multi_cols, 4);

    // Without a request the recorded one is kept.
    ASSERT_TRUE(h.session->ApplySettings(json::object(), err));
    const pnt::Session::Snapshot snap = h.session->GetSnapshot();
    ASSERT_TRUE(snap.canvas_request.has_value());
    EXPECT_EQ(snap.canvas_request->rows, 2);
    EXPECT_EQ(snap.canvas_request->cols, 4);
}

TEST_F(SessionTest, BestColorsSettingUsesTableRanking)
{
    h.WriteDyeTable(true);
    Error err;
    ASSERT_TRUE(h.session->ApplySettings({{"bestColors", 2}}, err));
    EXPECT_EQ(h.session->GetSnapshot().best_color_ids, (std::vector<int>{3, 1}));
    EXPECT_EQ(h.controller.best_colors, 2);
    EXPECT_EQ(h.controller.best_color_ids, (std::vector<int>{3, 1}));

    ASSERT_TRUE(h.session->ApplySettings({{"bestColors", 0}}, err));
    EXPECT_TRUE(h.session->GetSnapshot().best_color_ids.empty());
    EXPECT_EQ(h.controller.best_colors, 0);
    EXPECT_TRUE(h.controller.best_color_ids.empty());
}

TEST_F(SessionTest, CalculateBestColorsPrefersController)
{
    h.controller.best_dyes = {7, 3, 9, 1};
    std::vector<int> ids;
    Error err;
    ASSERT_TRUE(h.session->CalculateBestColors(2, json::object(), ids, err)) << err.message;
    EXPECT_EQ(ids, (std::vector<int>{7, 3}));
    EXPECT_EQ(h.controller.best_dyes_sample_side, 256);
    EXPECT_EQ(h.controller.best_dyes_max_pixels, 65536);
    EXPECT_FALSE(h.session->GetSnapshot().dyes.use_all);
    // The palette restriction reaches the renderer too.
    ASSERT_TRUE(h.controller.enabled_dyes.has_value());
    EXPECT_TRUE(h.controller.enabled_dyes->empty());
}

TEST_F(SessionTest, CalculateBestColorsFallsBackToImageRanking)
{
    h.WriteDyeTable();
    h.SelectImage(SolidImage(8, 8, 0, 0, 250));

    std::vector<int> ids;
    Error err;
    ASSERT_TRUE(h.session->CalculateBestColors(2, json::object(), ids, err)) << err.message;
    EXPECT_EQ(ids, (std::vector<int>{3}));
}

TEST_F(SessionTest, CalculateBestColorsWithNonPositiveCount)
{
    h.controller.best_dyes = {1};
    std::vector<int> ids = {42};
    Error err;
    ASSERT_TRUE(h.session->CalculateBestColors(0, json::object(), ids, err));
    EXPECT_TRUE(ids.empty());
    EXPECT_TRUE(h.session->GetSnapshot().dyes.use_all);
}

// --- naming ----------------------------------------------------------------------------------

TEST(SanitizeFilePart, Rules)
{
    EXPECT_EQ(pnt::SanitizeFilePart("My Template!! v2.pnt", "x"), "My_Template_v2");
    EXPECT_EQ(pnt::SanitizeFilePart("  __a--b__  ", "x"), "a--b");
    EXPECT_EQ(pnt::SanitizeFilePart("archive.tar.gz", "x"), "archive_tar");
    EXPECT_EQ(pnt::SanitizeFilePart("!!!", "image"), "image");
    EXPECT_EQ(pnt::SanitizeFilePart("", "Canvas"), "Canvas");
    EXPECT_EQ(pnt::SanitizeFilePart(".hidden", "image"), "image");
}
