#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

// Lenient readers for loosely-typed JSON coming from callers and descriptor files.
// None of these throw; a value that cannot be interpreted yields nullopt / the fallback.
namespace pnt::json_util
{
// Numbers are truncated toward zero; strings are accepted when they hold a complete integer.
std::optional<int> LooseInt(const nlohmann::json& v);

// Numbers, or strings holding a complete finite number.
std::optional<double> LooseDouble(const nlohmann::json& v);

// Truthiness: false/null/0/""/[]/{} are false, everything else true.
bool Truthy(const nlohmann::json& v);

// String value trimmed and lowercased; non-strings (and null) become "".
std::string LowerToken(const nlohmann::json& v);

// `obj[key]` when obj is an object holding key, otherwise a shared null.
const nlohmann::json& Field(const nlohmann::json& obj, std::string_view key);

// First non-null field among two alternative key spellings (camelCase / snake_case).
const nlohmann::json& FieldEither(const nlohmann::json& obj, std::string_view a, std::string_view b);

// `obj[key]` when it is an object, otherwise a shared empty object.
const nlohmann::json& ObjectField(const nlohmann::json& obj, std::string_view key);

std::string Trim(std::string_view s);
std::string ToLowerAscii(std::string s);
} // namespace pnt::json_util
