#include "core/template_catalog.h"

#include "core/collaborators.h"
#include "core/json_util.h"
#include "core/layout/canvas_layout.h"

#include <algorithm>
#include <cstdio>
#include <initializer_list>

namespace pnt
{
namespace ju = pnt::json_util;

namespace
{
static bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles)
{
    for (const char* n : needles)
    {
        if (haystack.find(n) != std::string::npos)
            return true;
    }
    return false;
}

static bool StartsWithAny(const std::string& s, std::initializer_list<const char*> prefixes)
{
    for (const char* p : prefixes)
    {
        if (s.rfind(p, 0) == 0)
            return true;
    }
    return false;
}

static std::string NormalizeSlashes(std::string s)
{
    std::replace(s.begin(), s.end(), '\\', '/');
    return s;
}

static std::string CategoryFromSourcePath(const std::string& source_relpath)
{
    if (source_relpath.empty())
        return "other";
    const std::string p = ju::ToLowerAscii(NormalizeSlashes(source_relpath));
    if (ContainsAny(p, {"templatedescriptors_dinos", "/dinos/", "dinos/"}))
        return "dinos";
    if (ContainsAny(p, {"templatedescriptors_humans", "/humans/", "humans/"}))
        return "humans";
    if (ContainsAny(p, {"templatedescriptors_structures", "/structures/", "structures/"}))
        return "structures";
    return "other";
}

static std::string StringOrEmpty(const nlohmann::json& v)
{
    return v.is_string() ? v.get<std::string>() : std::string();
}

static int CategoryRank(const std::string& category)
{
    if (category == "structures") return 0;
    if (category == "dinos") return 1;
    if (category == "humans") return 2;
    if (category == "other") return 3;
    return 99;
}
} // namespace

nlohmann::json TemplateSummary::ToJson() const
{
    nlohmann::json j;
    j["id"] = id;
    j["label"] = label;
    j["width"] = width;
    j["height"] = height;
    j["category"] = category;
    j["family"] = family ? nlohmann::json(*family) : nlohmann::json(nullptr);
    j["source_relpath"] = source_relpath.empty() ? nlohmann::json(nullptr) : nlohmann::json(source_relpath);
    j["kind"] = kind;
    return j;
}

std::string NormalizeTemplateCategory(std::string_view raw)
{
    const std::string v = ju::ToLowerAscii(ju::Trim(raw));
    if (v == "structure" || v == "structures")
        return "structures";
    if (v == "dino" || v == "dinos" || v == "dinosaur" || v == "dinosaurs" || v == "creature" || v == "creatures")
        return "dinos";
    if (v == "human" || v == "humans" || v == "player" || v == "players")
        return "humans";
    return "other";
}

std::string DeriveTemplateCategory(const std::string& template_id,
                                   const nlohmann::json& descriptor,
                                   const std::string& source_relpath)
{
    const nlohmann::json& identity = ju::ObjectField(descriptor, "identity");
    const std::string declared = NormalizeTemplateCategory(StringOrEmpty(ju::Field(identity, "category")));
    if (declared != "other")
        return declared;

    const std::string from_path = CategoryFromSourcePath(source_relpath);
    if (from_path != "other")
        return from_path;

    std::string hint;
    for (const std::string& part : {source_relpath,
                                    StringOrEmpty(ju::Field(descriptor, "__source_relpath")),
                                    StringOrEmpty(ju::Field(descriptor, "__source_path")),
                                    StringOrEmpty(ju::Field(descriptor, "__kind")),
                                    template_id})
    {
        if (!hint.empty())
            hint += '/';
        hint += ju::ToLowerAscii(part);
    }

    if (ContainsAny(hint, {"templatedescriptors_structures", "structures/", "/structures", "structure_"}))
        return "structures";
    if (ContainsAny(hint, {"templatedescriptors_dinos", "template_descriptors_dinos", "dinos/", "/dinos", "dino_"}))
        return "dinos";
    if (ContainsAny(hint,
                    {"templatedescriptors_humans", "template_descriptors_humans", "humans/", "/humans", "human_",
                     "playerpawn"}))
        return "humans";

    const std::string id = ju::ToLowerAscii(template_id);
    if (StartsWithAny(id, {"structure"}))
        return "structures";
    if (StartsWithAny(id, {"dino", "creature"}))
        return "dinos";
    if (StartsWithAny(id, {"human", "player"}))
        return "humans";
    return "other";
}

std::optional<std::string> FamilyFromSourcePath(const std::string& source_relpath, const std::string& category)
{
    if (source_relpath.empty() || category != "structures")
        return std::nullopt;

    const std::string p = NormalizeSlashes(source_relpath);
    std::vector<std::string> parts;
    size_t start = 0;
    while (true)
    {
        const size_t slash = p.find('/', start);
        parts.push_back(p.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos)
            break;
        start = slash + 1;
    }
    if (parts.size() >= 3 && !parts[1].empty())
        return parts[1];
    return std::nullopt;
}

void SortTemplateCatalog(std::vector<TemplateSummary>& items)
{
    std::stable_sort(items.begin(), items.end(), [](const TemplateSummary& a, const TemplateSummary& b) {
        const int ra = CategoryRank(a.category);
        const int rb = CategoryRank(b.category);
        if (ra != rb)
            return ra < rb;
        const std::string fa = ju::ToLowerAscii(a.family.value_or(""));
        const std::string fb = ju::ToLowerAscii(b.family.value_or(""));
        if (fa != fb)
            return fa < fb;
        return ju::ToLowerAscii(a.label.empty() ? a.id : a.label) < ju::ToLowerAscii(b.label.empty() ? b.id : b.label);
    });
}

std::vector<TemplateSummary> BuildTemplateCatalog(const ITemplateStore& store)
{
    std::vector<TemplateSummary> out;
    for (const std::string& id : store.ListTemplateIds())
    {
        nlohmann::json descriptor;
        std::string err;
        if (!store.Load(id, descriptor, err))
        {
            std::fprintf(stderr, "[templates] %s\n", err.c_str());
            continue;
        }

        const nlohmann::json& identity = ju::ObjectField(descriptor, "identity");

        TemplateSummary s;
        s.id = id;
        s.label = StringOrEmpty(ju::Field(identity, "label"));
        if (s.label.empty())
            s.label = id;
        layout::RasterSize(descriptor, s.width, s.height);
        s.source_relpath = store.SourceRelPath(id);
        s.category = DeriveTemplateCategory(id, descriptor, s.source_relpath);
        s.family = FamilyFromSourcePath(s.source_relpath, s.category);

        s.kind = StringOrEmpty(ju::Field(identity, "type"));
        if (s.kind.empty())
            s.kind = StringOrEmpty(ju::Field(identity, "category"));
        if (s.kind.empty())
            s.kind = "unknown";

        out.push_back(std::move(s));
    }
    SortTemplateCatalog(out);
    return out;
}
} // namespace pnt
