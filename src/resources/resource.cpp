#include "mcplink/resources/resource.hpp"

#include "mcplink/exceptions.hpp"

namespace mcplink::resources
{

ResourceReader text_reader(std::string mime_type,
                           std::function<std::string(const ResourceRequest&)> fn)
{
    return [mime_type = std::move(mime_type), fn = std::move(fn)](const ResourceRequest& req)
    {
        ResourceContent content;
        content.uri = req.uri;
        content.mime_type = mime_type;
        content.text = fn(req);
        return content;
    };
}

// =============================================================================
// UriTemplate
// =============================================================================

static std::string escape_regex(const std::string& s)
{
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s)
    {
        if (special.find(c) != std::string::npos)
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

UriTemplate::UriTemplate(const std::string& pattern)
{
    std::string regex_text = "^";
    size_t pos = 0;
    while (pos < pattern.size())
    {
        size_t open = pattern.find('{', pos);
        if (open == std::string::npos)
        {
            regex_text += escape_regex(pattern.substr(pos));
            break;
        }
        regex_text += escape_regex(pattern.substr(pos, open - pos));

        size_t close = pattern.find('}', open);
        if (close == std::string::npos)
            throw ValidationError("unterminated placeholder in URI template '" + pattern + "'");

        std::string var = pattern.substr(open + 1, close - open - 1);
        bool wildcard = !var.empty() && var.back() == '*';
        if (wildcard)
            var.pop_back();
        if (var.empty())
            throw ValidationError("empty placeholder in URI template '" + pattern + "'");

        variables_.push_back(var);
        regex_text += wildcard ? "(.+)" : "([^/?#]+)";
        pos = close + 1;
    }
    regex_text += "$";

    try
    {
        regex_ = std::regex(regex_text, std::regex::ECMAScript);
    }
    catch (const std::regex_error& e)
    {
        throw ValidationError("cannot compile URI template '" + pattern + "': " + e.what());
    }
}

std::optional<std::map<std::string, std::string>> UriTemplate::match(const std::string& uri) const
{
    std::smatch m;
    if (!std::regex_match(uri, m, regex_))
        return std::nullopt;

    std::map<std::string, std::string> params;
    for (size_t i = 0; i < variables_.size(); ++i)
        params[variables_[i]] = m[i + 1].str();
    return params;
}

// =============================================================================
// JSON adapters
// =============================================================================

void to_json(Json& j, const ResourceDescriptor& r)
{
    j = Json{{"uri", r.uri}, {"name", r.name}};
    if (!r.description.empty())
        j["description"] = r.description;
    if (!r.mime_type.empty())
        j["mimeType"] = r.mime_type;
}

void from_json(const Json& j, ResourceDescriptor& r)
{
    r.uri = j.at("uri").get<std::string>();
    r.name = string_field(j, "name");
    r.description = string_field(j, "description");
    r.mime_type = string_field(j, "mimeType");
}

void to_json(Json& j, const ResourceTemplate& t)
{
    j = Json{{"uriTemplate", t.uri_template}, {"name", t.name}};
    if (!t.description.empty())
        j["description"] = t.description;
    if (!t.mime_type.empty())
        j["mimeType"] = t.mime_type;
}

void from_json(const Json& j, ResourceTemplate& t)
{
    t.uri_template = j.at("uriTemplate").get<std::string>();
    t.name = string_field(j, "name");
    t.description = string_field(j, "description");
    t.mime_type = string_field(j, "mimeType");
}

void to_json(Json& j, const ResourceContent& c)
{
    j = Json{{"uri", c.uri}};
    if (!c.mime_type.empty())
        j["mimeType"] = c.mime_type;
    if (c.blob)
        j["blob"] = *c.blob;
    else
        j["text"] = c.text;
}

void from_json(const Json& j, ResourceContent& c)
{
    c.uri = string_field(j, "uri");
    c.mime_type = string_field(j, "mimeType");
    c.text = string_field(j, "text");
    auto blob = j.find("blob");
    if (blob != j.end() && blob->is_string())
        c.blob = blob->get<std::string>();
}

} // namespace mcplink::resources
