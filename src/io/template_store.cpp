#include "io/template_store.h"

#include "core/json_util.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace pnt::io
{
namespace ju = pnt::json_util;

namespace
{
// Deepest "extends" chain accepted; anything longer is treated as a cycle.
static constexpr int kMaxExtendsDepth = 16;

static bool ReadJsonFile(const fs::path& path, nlohmann::json& out, std::string& err)
{
    std::ifstream f(path);
    if (!f)
    {
        err = "failed to open " + path.string();
        return false;
    }
    try
    {
        f >> out;
    }
    catch (const std::exception& e)
    {
        err = path.string() + ": " + e.what();
        return false;
    }
    return true;
}

static bool IsAbstract(const nlohmann::json& descriptor)
{
    return ju::Truthy(ju::Field(descriptor, "abstract")) ||
           ju::Truthy(ju::Field(ju::ObjectField(descriptor, "identity"), "abstract"));
}
} // namespace

bool JsonTemplateStore::Reindex(std::string& err)
{
    err.clear();
    m_entries.clear();

    std::error_code ec;
    if (m_root.empty() || !fs::is_directory(m_root, ec))
    {
        err = "templates root is not a directory: " + m_root;
        return false;
    }

    std::vector<fs::path> files;
    for (fs::recursive_directory_iterator it(m_root, ec), end; !ec && it != end; it.increment(ec))
    {
        if (!it->is_regular_file(ec))
            continue;
        if (ju::ToLowerAscii(it->path().extension().string()) == ".json")
            files.push_back(it->path());
    }
    if (ec)
    {
        err = "failed to scan " + m_root + ": " + ec.message();
        return false;
    }
    std::sort(files.begin(), files.end());

    for (const fs::path& p : files)
    {
        Entry e;
        std::string read_err;
        if (!ReadJsonFile(p, e.raw, read_err))
        {
            std::fprintf(stderr, "[templates] skipping %s\n", read_err.c_str());
            continue;
        }
        if (!e.raw.is_object())
        {
            std::fprintf(stderr, "[templates] skipping %s: not a JSON object\n", p.string().c_str());
            continue;
        }

        const nlohmann::json& raw_id = ju::Field(ju::ObjectField(e.raw, "identity"), "id");
        std::string id = raw_id.is_string() ? ju::Trim(raw_id.get_ref<const std::string&>()) : std::string();
        if (id.empty())
            id = p.stem().string();

        std::error_code rel_ec;
        const fs::path rel = fs::relative(p, m_root, rel_ec);
        e.rel_path = rel_ec ? p.generic_string() : rel.generic_string();
        e.path = p.string();
        e.is_abstract = IsAbstract(e.raw);

        if (m_entries.count(id))
        {
            std::fprintf(stderr,
                         "[templates] duplicate id '%s' in %s (keeping %s)\n",
                         id.c_str(),
                         e.rel_path.c_str(),
                         m_entries[id].rel_path.c_str());
            continue;
        }
        m_entries.emplace(std::move(id), std::move(e));
    }
    return true;
}

std::vector<std::string> JsonTemplateStore::ListTemplateIds() const
{
    std::vector<std::string> ids;
    ids.reserve(m_entries.size());
    for (const auto& [id, e] : m_entries)
    {
        if (!e.is_abstract)
            ids.push_back(id);
    }
    return ids;
}

bool JsonTemplateStore::LoadRecursive(const std::string& id, nlohmann::json& out, std::string& err, int depth) const
{
    if (depth > kMaxExtendsDepth)
    {
        err = "template inheritance too deep (cycle?) at: " + id;
        return false;
    }

    auto it = m_entries.find(id);
    if (it == m_entries.end())
    {
        err = "template not found: " + id;
        return false;
    }

    const nlohmann::json& raw = it->second.raw;
    const nlohmann::json& parent = ju::Field(raw, "extends");
    if (!parent.is_string() || parent.get_ref<const std::string&>().empty())
    {
        out = raw;
        return true;
    }

    if (!LoadRecursive(parent.get<std::string>(), out, err, depth + 1))
        return false;

    nlohmann::json child = raw;
    child.erase("extends");
    out.merge_patch(child);
    // Abstractness is not inherited.
    if (!IsAbstract(raw))
    {
        out.erase("abstract");
        if (out.contains("identity") && out["identity"].is_object())
            out["identity"].erase("abstract");
    }
    return true;
}

bool JsonTemplateStore::Load(const std::string& id, nlohmann::json& out, std::string& err) const
{
    err.clear();
    out = nullptr;
    return LoadRecursive(id, out, err, 0);
}

bool JsonTemplateStore::Resolve(const std::string& id,
                                const nlohmann::json& overrides,
                                nlohmann::json& out,
                                std::string& err) const
{
    if (!Load(id, out, err))
        return false;
    if (overrides.is_object())
        out.merge_patch(overrides);
    return true;
}

std::string JsonTemplateStore::SourceRelPath(const std::string& id) const
{
    auto it = m_entries.find(id);
    return it == m_entries.end() ? std::string() : it->second.rel_path;
}
} // namespace pnt::io
