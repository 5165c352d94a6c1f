#pragma once
#include "mcplink/content.hpp"
#include "mcplink/tools/arguments.hpp"
#include "mcplink/tools/tool.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcplink::tools
{

/// Name -> (descriptor, handler) table owned by one server.
///
/// Registration order is preserved by list(). dispatch() never throws:
/// unknown tools, malformed arguments and handler exceptions all come back as
/// a ToolResult with is_error set, so one bad call cannot end the session.
class ToolRegistry
{
  public:
    /// Throws ValidationError for an empty name, an empty handler, or a name
    /// (case-sensitive) that is already registered.
    void register_tool(ToolDescriptor descriptor, ToolHandler handler);

    std::vector<ToolDescriptor> list() const;
    bool has(const std::string& name) const;
    std::optional<ToolDescriptor> find(const std::string& name) const;
    size_t size() const;

    ToolResult dispatch(const std::string& name, const Json& raw_args) const;

  private:
    struct Entry
    {
        ToolDescriptor descriptor;
        ToolHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

/// Adapt a handler that returns plain text into a ToolHandler
ToolHandler text_handler(std::function<std::string(const Arguments&)> fn);

/// Adapt a handler that returns JSON data; the data is sent pretty-printed as text
ToolHandler json_handler(std::function<Json(const Arguments&)> fn);

} // namespace mcplink::tools
