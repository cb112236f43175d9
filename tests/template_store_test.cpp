#include "io/template_store.h"

#include "core/template_catalog.h"
#include "fakes.h"

#include <gtest/gtest.h>

using nlohmann::json;

namespace
{
class TemplateStoreTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto& root = m_dir.Path();
        pnt::test::WriteTextFile(root / "Structures" / "Walls" / "wall_a.json",
                                 R"({"identity":{"id":"wall_a","label":"Wall A"},"extends":"base_wall",
                                     "layout":{"raster":{"width":256}}})");
        pnt::test::WriteTextFile(root / "Structures" / "base_wall.json",
                                 R"({"identity":{"abstract":true,"category":"structure"},
                                     "layout":{"raster":{"width":128,"height":64}},"tint":"grey"})");
        pnt::test::WriteTextFile(root / "Dinos" / "rex.json", R"({"layout":{"raster":{"width":32,"height":32}}})");
        pnt::test::WriteTextFile(root / "Dinos" / "rex_copy.json", R"({"identity":{"id":"rex"},"copy":true})");
        pnt::test::WriteTextFile(root / "broken.json", "{ nope");
        pnt::test::WriteTextFile(root / "array.json", "[1, 2]");
        pnt::test::WriteTextFile(root / "readme.txt", "not a template");
        pnt::test::WriteTextFile(root / "loop_a.json", R"({"extends":"loop_b"})");
        pnt::test::WriteTextFile(root / "loop_b.json", R"({"extends":"loop_a"})");

        std::string err;
        ASSERT_TRUE(m_store.Reindex(err)) << err;
    }

    pnt::test::TempDir m_dir;
    pnt::io::JsonTemplateStore m_store{m_dir.Str()};
};
} // namespace

TEST_F(TemplateStoreTest, ListsConcreteTemplatesOnly)
{
    const std::vector<std::string> ids = m_store.ListTemplateIds();
    EXPECT_EQ(ids, (std::vector<std::string>{"loop_a", "loop_b", "rex", "wall_a"}));
}

TEST_F(TemplateStoreTest, FirstFileWinsOnDuplicateIds)
{
    json d;
    std::string err;
    ASSERT_TRUE(m_store.Load("rex", d, err)) << err;
    EXPECT_FALSE(d.contains("copy"));
    EXPECT_EQ(m_store.SourceRelPath("rex"), "Dinos/rex.json");
}

TEST_F(TemplateStoreTest, ExtendsMergesParentAndDropsAbstract)
{
    json d;
    std::string err;
    ASSERT_TRUE(m_store.Load("wall_a", d, err)) << err;
    EXPECT_EQ(d["layout"]["raster"]["width"], 256);
    EXPECT_EQ(d["layout"]["raster"]["height"], 64);
    EXPECT_EQ(d["tint"], "grey");
    EXPECT_EQ(d["identity"]["label"], "Wall A");
    EXPECT_FALSE(d.contains("extends"));
    EXPECT_FALSE(d["identity"].contains("abstract"));

    // Abstract parents stay loadable.
    ASSERT_TRUE(m_store.Load("base_wall", d, err)) << err;
    EXPECT_TRUE(d["identity"]["abstract"].get<bool>());
}

TEST_F(TemplateStoreTest, ExtendsCycleFails)
{
    json d;
    std::string err;
    EXPECT_FALSE(m_store.Load("loop_a", d, err));
    EXPECT_NE(err.find("too deep"), std::string::npos);
}

TEST_F(TemplateStoreTest, ResolveAppliesOverrides)
{
    json d;
    std::string err;
    ASSERT_TRUE(m_store.Resolve("rex", {{"layout", {{"raster", {{"height", 48}}}}}}, d, err)) << err;
    EXPECT_EQ(d["layout"]["raster"]["width"], 32);
    EXPECT_EQ(d["layout"]["raster"]["height"], 48);

    EXPECT_FALSE(m_store.Resolve("nope", json::object(), d, err));
    EXPECT_NE(err.find("nope"), std::string::npos);
}

TEST_F(TemplateStoreTest, CatalogIsCategorizedAndSorted)
{
    const std::vector<pnt::TemplateSummary> rows = pnt::BuildTemplateCatalog(m_store);
    // loop_* fail to load and are skipped.
    ASSERT_EQ(rows.size(), 2u);

    EXPECT_EQ(rows[0].id, "wall_a");
    EXPECT_EQ(rows[0].category, "structures");
    EXPECT_EQ(rows[0].family, "Walls");
    EXPECT_EQ(rows[0].width, 256);
    EXPECT_EQ(rows[0].height, 64);
    EXPECT_EQ(rows[0].kind, "structure");

    EXPECT_EQ(rows[1].id, "rex");
    EXPECT_EQ(rows[1].label, "rex");
    EXPECT_EQ(rows[1].category, "dinos");
    EXPECT_FALSE(rows[1].family.has_value());
    EXPECT_EQ(rows[1].kind, "unknown");
}

TEST(JsonTemplateStore, MissingRootFailsReindex)
{
    pnt::io::JsonTemplateStore store("/definitely/not/here");
    std::string err;
    EXPECT_FALSE(store.Reindex(err));
    EXPECT_TRUE(store.ListTemplateIds().empty());
}

TEST(TemplateCatalog, CategoryNormalization)
{
    EXPECT_EQ(pnt::NormalizeTemplateCategory(" Dinosaur "), "dinos");
    EXPECT_EQ(pnt::NormalizeTemplateCategory("PLAYERS"), "humans");
    EXPECT_EQ(pnt::NormalizeTemplateCategory("structure"), "structures");
    EXPECT_EQ(pnt::NormalizeTemplateCategory("boats"), "other");
}

TEST(TemplateCatalog, CategoryFallsBackToIdHints)
{
    EXPECT_EQ(pnt::DeriveTemplateCategory("human_male", json::object(), ""), "humans");
    EXPECT_EQ(pnt::DeriveTemplateCategory("creature_sign", json::object(), ""), "dinos");
    EXPECT_EQ(pnt::DeriveTemplateCategory("x", json::object(), "pack/TemplateDescriptors_Structures/x.json"),
              "structures");
    EXPECT_EQ(pnt::DeriveTemplateCategory("flag", json::object(), "misc/flag.json"), "other");
    // Declared category wins over the path.
    EXPECT_EQ(pnt::DeriveTemplateCategory("x", {{"identity", {{"category", "human"}}}}, "Dinos/x.json"), "humans");
}

TEST(TemplateCatalog, FamilyOnlyForNestedStructures)
{
    EXPECT_EQ(pnt::FamilyFromSourcePath("Structures/Signs/a.json", "structures"), "Signs");
    EXPECT_EQ(pnt::FamilyFromSourcePath("Structures\\Signs\\a.json", "structures"), "Signs");
    EXPECT_FALSE(pnt::FamilyFromSourcePath("Structures/a.json", "structures").has_value());
    EXPECT_FALSE(pnt::FamilyFromSourcePath("Dinos/Big/a.json", "dinos").has_value());
}

TEST(TemplateCatalog, SortOrder)
{
    auto row = [](std::string id, std::string category, std::optional<std::string> family) {
        pnt::TemplateSummary s;
        s.id = id;
        s.label = id;
        s.category = std::move(category);
        s.family = std::move(family);
        return s;
    };
    std::vector<pnt::TemplateSummary> rows = {
        row("zz", "other", std::nullopt),
        row("b", "humans", std::nullopt),
        row("Beta", "structures", "Walls"),
        row("alpha", "structures", "Walls"),
        row("c", "structures", "Floors"),
        row("d", "dinos", std::nullopt),
    };
    pnt::SortTemplateCatalog(rows);

    std::vector<std::string> ids;
    for (const auto& r : rows)
        ids.push_back(r.id);
    EXPECT_EQ(ids, (std::vector<std::string>{"c", "alpha", "Beta", "d", "b", "zz"}));
}
