#pragma once
#include "mcplink/types.hpp"

#include <cstdint>
#include <string>

namespace mcplink::tools
{

/// Typed view over the `arguments` object of one tools/call.
///
/// require_*() throw ValidationError when the key is absent or holds the wrong
/// JSON type. *_default() never throw: absent and wrong-typed values both give
/// back the fallback, so older callers that send e.g. "limit":"20" keep working.
/// has() tells an explicitly supplied value apart from a defaulted one.
class Arguments
{
  public:
    Arguments() : raw_(Json::object()) {}

    /// Accepts an object, or null (treated as no arguments). Anything else is
    /// rejected with ValidationError.
    static Arguments from_json(const Json& raw);

    /// Parse a JSON text; empty text means no arguments
    static Arguments parse(const std::string& text);

    bool has(const std::string& key) const;

    /// Raw value for `key`; null when absent
    const Json& get(const std::string& key) const;

    const Json& raw() const
    {
        return raw_;
    }

    /// Empty strings count as missing
    std::string require_string(const std::string& key) const;
    /// Any JSON number; fractional values are truncated toward zero. A number
    /// outside the int64 range is the wrong type.
    int64_t require_int(const std::string& key) const;
    double require_number(const std::string& key) const;
    bool require_bool(const std::string& key) const;

    std::string string_default(const std::string& key, const std::string& fallback) const;
    /// Fallback also for numbers outside the int64 range
    int64_t int_default(const std::string& key, int64_t fallback) const;
    double number_default(const std::string& key, double fallback) const;
    bool bool_default(const std::string& key, bool fallback) const;

  private:
    explicit Arguments(Json raw) : raw_(std::move(raw)) {}

    Json raw_;
};

} // namespace mcplink::tools
