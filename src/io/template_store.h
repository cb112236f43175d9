#pragma once

#include "core/collaborators.h"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace pnt::io
{
// ITemplateStore backed by a directory tree of *.json descriptors.
//
// - Every *.json under the root (recursively) is a descriptor. Its id is `identity.id`, or the
//   file stem when absent. When two files claim the same id, the first in path order wins.
// - A descriptor may name a parent with `"extends": "<id>"`; the child is merge-patched
//   (RFC 7386) on top of the parent. Parents may themselves extend other descriptors.
// - Descriptors marked abstract (`identity.abstract` or top-level `abstract`) can be extended
//   and loaded but are not listed.
class JsonTemplateStore : public ITemplateStore
{
public:
    JsonTemplateStore() = default;
    explicit JsonTemplateStore(std::string root) : m_root(std::move(root)) {}

    // (Re)scans the root directory. Unparseable files are skipped and logged.
    // Returns false only when the root itself cannot be read.
    bool Reindex(std::string& err);

    const std::string& Root() const { return m_root; }

    std::vector<std::string> ListTemplateIds() const override;
    bool Load(const std::string& id, nlohmann::json& out, std::string& err) const override;
    bool Resolve(const std::string& id,
                 const nlohmann::json& overrides,
                 nlohmann::json& out,
                 std::string& err) const override;
    std::string SourceRelPath(const std::string& id) const override;

private:
    struct Entry
    {
        std::string path;
        std::string rel_path; // generic (forward-slash) path relative to the root
        nlohmann::json raw;   // as read from disk, before "extends" is applied
        bool is_abstract = false;
    };

    bool LoadRecursive(const std::string& id, nlohmann::json& out, std::string& err, int depth) const;

    std::string m_root;
    std::map<std::string, Entry> m_entries;
};
} // namespace pnt::io
