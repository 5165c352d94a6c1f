#pragma once
#include "mcplink/types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace mcplink::resources
{

/// A named, read-only data source addressable by URI
struct ResourceDescriptor
{
    std::string uri; // unique within a registry
    std::string name;
    std::string description;
    std::string mime_type;
};

/// Parameterized resource URI, e.g. "memo://{name}" or "files://{path*}"
struct ResourceTemplate
{
    std::string uri_template;
    std::string name;
    std::string description;
    std::string mime_type;
};

/// Content returned by resources/read. Exactly one of text/blob is meaningful.
struct ResourceContent
{
    std::string uri;
    std::string mime_type;
    std::string text;
    std::optional<std::string> blob; // base64
};

/// What a reader is asked for: the concrete URI, plus the values bound to
/// template placeholders when the URI matched a template.
struct ResourceRequest
{
    std::string uri;
    std::map<std::string, std::string> params;
};

using ResourceReader = std::function<ResourceContent(const ResourceRequest&)>;

/// Reader producing text content with a fixed MIME type
ResourceReader text_reader(std::string mime_type,
                           std::function<std::string(const ResourceRequest&)> fn);

/// Compiled form of a ResourceTemplate URI.
/// {var} matches one path segment, {var*} matches the rest of the URI.
class UriTemplate
{
  public:
    /// Throws ValidationError on an unterminated or empty placeholder
    explicit UriTemplate(const std::string& pattern);

    std::optional<std::map<std::string, std::string>> match(const std::string& uri) const;

    const std::vector<std::string>& variables() const
    {
        return variables_;
    }

  private:
    std::vector<std::string> variables_;
    std::regex regex_;
};

// nlohmann::json adapters (MCP wire names)
void to_json(Json& j, const ResourceDescriptor& r);
void from_json(const Json& j, ResourceDescriptor& r);
void to_json(Json& j, const ResourceTemplate& t);
void from_json(const Json& j, ResourceTemplate& t);
void to_json(Json& j, const ResourceContent& c);
void from_json(const Json& j, ResourceContent& c);

} // namespace mcplink::resources
