#include "mcplink/tools/arguments.hpp"

#include "mcplink/exceptions.hpp"
#include "mcplink/util/json.hpp"

#include <limits>
#include <optional>

namespace mcplink::tools
{

namespace
{

const Json& null_json()
{
    static const Json null_value;
    return null_value;
}

ValidationError missing(const std::string& key)
{
    return ValidationError("missing required field '" + key + "'");
}

ValidationError wrong_type(const std::string& key, const char* expected)
{
    return ValidationError("field '" + key + "' must be " + expected);
}

// Truncates fractions; nullopt when the value has no int64 representation
std::optional<int64_t> to_int(const Json& v)
{
    if (v.is_number_unsigned())
    {
        auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            return std::nullopt;
        return static_cast<int64_t>(u);
    }
    if (v.is_number_integer())
        return v.get<int64_t>();

    double d = v.get<double>();
    // [-2^63, 2^63) is exactly representable; NaN fails both comparisons
    if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0))
        return std::nullopt;
    return static_cast<int64_t>(d);
}

} // namespace

Arguments Arguments::from_json(const Json& raw)
{
    if (raw.is_null())
        return Arguments();
    if (!raw.is_object())
        throw ValidationError(std::string("arguments must be a JSON object, got ") +
                              raw.type_name());
    return Arguments(raw);
}

Arguments Arguments::parse(const std::string& text)
{
    if (text.empty())
        return Arguments();
    return from_json(util::json::parse(text));
}

bool Arguments::has(const std::string& key) const
{
    return raw_.contains(key);
}

const Json& Arguments::get(const std::string& key) const
{
    auto it = raw_.find(key);
    if (it == raw_.end())
        return null_json();
    return *it;
}

std::string Arguments::require_string(const std::string& key) const
{
    const Json& v = get(key);
    if (v.is_null())
        throw missing(key);
    if (!v.is_string())
        throw wrong_type(key, "a string");
    auto s = v.get<std::string>();
    if (s.empty())
        throw missing(key);
    return s;
}

int64_t Arguments::require_int(const std::string& key) const
{
    const Json& v = get(key);
    if (v.is_null())
        throw missing(key);
    if (!v.is_number())
        throw wrong_type(key, "a number");
    auto n = to_int(v);
    if (!n)
        throw wrong_type(key, "an integer within the 64-bit range");
    return *n;
}

double Arguments::require_number(const std::string& key) const
{
    const Json& v = get(key);
    if (v.is_null())
        throw missing(key);
    if (!v.is_number())
        throw wrong_type(key, "a number");
    return v.get<double>();
}

bool Arguments::require_bool(const std::string& key) const
{
    const Json& v = get(key);
    if (v.is_null())
        throw missing(key);
    if (!v.is_boolean())
        throw wrong_type(key, "a boolean");
    return v.get<bool>();
}

std::string Arguments::string_default(const std::string& key, const std::string& fallback) const
{
    const Json& v = get(key);
    return v.is_string() ? v.get<std::string>() : fallback;
}

int64_t Arguments::int_default(const std::string& key, int64_t fallback) const
{
    const Json& v = get(key);
    if (!v.is_number())
        return fallback;
    return to_int(v).value_or(fallback);
}

double Arguments::number_default(const std::string& key, double fallback) const
{
    const Json& v = get(key);
    return v.is_number() ? v.get<double>() : fallback;
}

bool Arguments::bool_default(const std::string& key, bool fallback) const
{
    const Json& v = get(key);
    return v.is_boolean() ? v.get<bool>() : fallback;
}

} // namespace mcplink::tools
