#pragma once
#include "mcplink/resources/resource.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcplink::resources
{

/// URI -> (descriptor, reader) table owned by one server, plus URI templates.
/// Listing order is registration order.
class ResourceRegistry
{
  public:
    /// Throws ValidationError for an empty URI, an empty reader, or a duplicate URI
    void register_resource(ResourceDescriptor descriptor, ResourceReader reader);

    /// Throws ValidationError for a malformed or duplicate template
    void register_template(ResourceTemplate templ, ResourceReader reader);

    std::vector<ResourceDescriptor> list() const;
    std::vector<ResourceTemplate> list_templates() const;
    bool has(const std::string& uri) const;

    /// Static resources plus templates
    size_t size() const;

    /// Exact URI first, then templates in registration order.
    /// Throws NotFoundError when nothing matches; reader exceptions propagate.
    ResourceContent read(const std::string& uri) const;

  private:
    struct StaticEntry
    {
        ResourceDescriptor descriptor;
        ResourceReader reader;
    };
    struct TemplateEntry
    {
        ResourceTemplate templ;
        std::shared_ptr<UriTemplate> compiled;
        ResourceReader reader;
    };

    mutable std::mutex mutex_;
    std::vector<StaticEntry> resources_;
    std::unordered_map<std::string, size_t> by_uri_;
    std::vector<TemplateEntry> templates_;
};

} // namespace mcplink::resources
