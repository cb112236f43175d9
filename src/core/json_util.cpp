#include "core/json_util.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace pnt::json_util
{
namespace
{
static const nlohmann::json& NullJson()
{
    static const nlohmann::json k_null;
    return k_null;
}

static const nlohmann::json& EmptyObject()
{
    static const nlohmann::json k_obj = nlohmann::json::object();
    return k_obj;
}

static int ClampToInt(double d)
{
    if (d >= (double)INT_MAX)
        return INT_MAX;
    if (d <= (double)INT_MIN)
        return INT_MIN;
    return (int)d;
}
} // namespace

std::string Trim(std::string_view s)
{
    size_t b = 0;
    while (b < s.size() && std::isspace((unsigned char)s[b]))
        ++b;
    size_t e = s.size();
    while (e > b && std::isspace((unsigned char)s[e - 1]))
        --e;
    return std::string(s.substr(b, e - b));
}

std::string ToLowerAscii(std::string s)
{
    for (char& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

std::optional<int> LooseInt(const nlohmann::json& v)
{
    if (v.is_boolean())
        return v.get<bool>() ? 1 : 0;
    if (v.is_number_unsigned())
    {
        const unsigned long long u = v.get<unsigned long long>();
        return u > (unsigned long long)INT_MAX ? INT_MAX : (int)u;
    }
    if (v.is_number_integer())
    {
        const long long i = v.get<long long>();
        if (i > INT_MAX)
            return INT_MAX;
        if (i < INT_MIN)
            return INT_MIN;
        return (int)i;
    }
    if (v.is_number_float())
    {
        const double d = v.get<double>();
        if (!std::isfinite(d))
            return std::nullopt;
        return ClampToInt(std::trunc(d));
    }
    if (v.is_string())
    {
        const std::string s = Trim(v.get<std::string>());
        if (s.empty())
            return std::nullopt;
        errno = 0;
        char* end = nullptr;
        const long long i = std::strtoll(s.c_str(), &end, 10);
        if (end == s.c_str() || *end != '\0' || errno == ERANGE)
            return std::nullopt;
        if (i > INT_MAX)
            return INT_MAX;
        if (i < INT_MIN)
            return INT_MIN;
        return (int)i;
    }
    return std::nullopt;
}

std::optional<double> LooseDouble(const nlohmann::json& v)
{
    if (v.is_boolean())
        return v.get<bool>() ? 1.0 : 0.0;
    if (v.is_number())
    {
        const double d = v.get<double>();
        if (!std::isfinite(d))
            return std::nullopt;
        return d;
    }
    if (v.is_string())
    {
        const std::string s = Trim(v.get<std::string>());
        if (s.empty())
            return std::nullopt;
        char* end = nullptr;
        const double d = std::strtod(s.c_str(), &end);
        if (end == s.c_str() || *end != '\0' || !std::isfinite(d))
            return std::nullopt;
        return d;
    }
    return std::nullopt;
}

bool Truthy(const nlohmann::json& v)
{
    if (v.is_null())
        return false;
    if (v.is_boolean())
        return v.get<bool>();
    if (v.is_number_integer())
        return v.get<long long>() != 0;
    if (v.is_number_float())
        return v.get<double>() != 0.0;
    if (v.is_string())
        return !v.get_ref<const std::string&>().empty();
    if (v.is_array() || v.is_object())
        return !v.empty();
    return true;
}

std::string LowerToken(const nlohmann::json& v)
{
    if (!v.is_string())
        return {};
    return ToLowerAscii(Trim(v.get_ref<const std::string&>()));
}

const nlohmann::json& Field(const nlohmann::json& obj, std::string_view key)
{
    if (!obj.is_object())
        return NullJson();
    auto it = obj.find(std::string(key));
    if (it == obj.end())
        return NullJson();
    return *it;
}

const nlohmann::json& FieldEither(const nlohmann::json& obj, std::string_view a, std::string_view b)
{
    const nlohmann::json& first = Field(obj, a);
    if (!first.is_null())
        return first;
    return Field(obj, b);
}

const nlohmann::json& ObjectField(const nlohmann::json& obj, std::string_view key)
{
    const nlohmann::json& v = Field(obj, key);
    return v.is_object() ? v : EmptyObject();
}
} // namespace pnt::json_util
