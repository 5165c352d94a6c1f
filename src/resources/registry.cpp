#include "mcplink/resources/registry.hpp"

#include "mcplink/exceptions.hpp"

namespace mcplink::resources
{

void ResourceRegistry::register_resource(ResourceDescriptor descriptor, ResourceReader reader)
{
    if (descriptor.uri.empty())
        throw ValidationError("resource URI is required");
    if (!reader)
        throw ValidationError("resource '" + descriptor.uri + "' has no reader");

    std::lock_guard<std::mutex> lock(mutex_);
    if (by_uri_.count(descriptor.uri))
        throw ValidationError("resource '" + descriptor.uri + "' already registered");
    by_uri_.emplace(descriptor.uri, resources_.size());
    resources_.push_back(StaticEntry{std::move(descriptor), std::move(reader)});
}

void ResourceRegistry::register_template(ResourceTemplate templ, ResourceReader reader)
{
    if (templ.uri_template.empty())
        throw ValidationError("resource URI template is required");
    if (!reader)
        throw ValidationError("template '" + templ.uri_template + "' has no reader");

    auto compiled = std::make_shared<UriTemplate>(templ.uri_template);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& t : templates_)
        if (t.templ.uri_template == templ.uri_template)
            throw ValidationError("template '" + templ.uri_template + "' already registered");
    templates_.push_back(TemplateEntry{std::move(templ), std::move(compiled), std::move(reader)});
}

std::vector<ResourceDescriptor> ResourceRegistry::list() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResourceDescriptor> out;
    out.reserve(resources_.size());
    for (const auto& r : resources_)
        out.push_back(r.descriptor);
    return out;
}

std::vector<ResourceTemplate> ResourceRegistry::list_templates() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResourceTemplate> out;
    out.reserve(templates_.size());
    for (const auto& t : templates_)
        out.push_back(t.templ);
    return out;
}

bool ResourceRegistry::has(const std::string& uri) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return by_uri_.count(uri) > 0;
}

size_t ResourceRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_.size() + templates_.size();
}

ResourceContent ResourceRegistry::read(const std::string& uri) const
{
    ResourceReader reader;
    ResourceRequest request;
    request.uri = uri;
    std::string mime_type;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_uri_.find(uri);
        if (it != by_uri_.end())
        {
            reader = resources_[it->second].reader;
            mime_type = resources_[it->second].descriptor.mime_type;
        }
        else
        {
            for (const auto& t : templates_)
            {
                if (auto params = t.compiled->match(uri))
                {
                    reader = t.reader;
                    mime_type = t.templ.mime_type;
                    request.params = std::move(*params);
                    break;
                }
            }
        }
    }

    if (!reader)
        throw NotFoundError("Unknown resource: " + uri);

    ResourceContent content = reader(request);
    if (content.uri.empty())
        content.uri = uri;
    if (content.mime_type.empty())
        content.mime_type = mime_type;
    return content;
}

} // namespace mcplink::resources
