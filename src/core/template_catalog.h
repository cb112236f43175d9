#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pnt
{
class ITemplateStore;

// One row of the template picker.
struct TemplateSummary
{
    std::string id;
    std::string label;
    int width = 0;
    int height = 0;
    std::string category; // structures | dinos | humans | other
    std::optional<std::string> family;
    std::string source_relpath;
    std::string kind; // identity.type, else identity.category, else "unknown"

    nlohmann::json ToJson() const;
};

// Maps free-form category spellings onto the four buckets.
std::string NormalizeTemplateCategory(std::string_view raw);

// identity.category first, then hints in the source path and template id.
std::string DeriveTemplateCategory(const std::string& template_id,
                                   const nlohmann::json& descriptor,
                                   const std::string& source_relpath);

// Structures are grouped by their second path component ("Structures/<family>/x.json").
std::optional<std::string> FamilyFromSourcePath(const std::string& source_relpath, const std::string& category);

// Sorts by category (structures, dinos, humans, other), then family, then lowercase label.
void SortTemplateCatalog(std::vector<TemplateSummary>& items);

// Loads every listed template from `store` and builds the sorted picker rows.
// Templates that fail to load are skipped and logged.
std::vector<TemplateSummary> BuildTemplateCatalog(const ITemplateStore& store);
} // namespace pnt
