#include "mcplink/tools/registry.hpp"

#include "mcplink/exceptions.hpp"
#include "mcplink/util/log.hpp"

namespace mcplink::tools
{

void ToolRegistry::register_tool(ToolDescriptor descriptor, ToolHandler handler)
{
    if (descriptor.name.empty())
        throw ValidationError("tool name is required");
    if (!handler)
        throw ValidationError("tool '" + descriptor.name + "' has no handler");

    std::lock_guard<std::mutex> lock(mutex_);
    if (index_.count(descriptor.name))
        throw ValidationError("tool '" + descriptor.name + "' already registered");
    index_.emplace(descriptor.name, entries_.size());
    entries_.push_back(Entry{std::move(descriptor), std::move(handler)});
}

std::vector<ToolDescriptor> ToolRegistry::list() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolDescriptor> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_)
        out.push_back(e.descriptor);
    return out;
}

bool ToolRegistry::has(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(name) > 0;
}

std::optional<ToolDescriptor> ToolRegistry::find(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(name);
    if (it == index_.end())
        return std::nullopt;
    return entries_[it->second].descriptor;
}

size_t ToolRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

ToolResult ToolRegistry::dispatch(const std::string& name, const Json& raw_args) const
{
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(name);
        if (it == index_.end())
            return error_result("Unknown tool: " + name);
        handler = entries_[it->second].handler;
    }

    Arguments args;
    try
    {
        args = Arguments::from_json(raw_args);
    }
    catch (const ValidationError& e)
    {
        return error_result(std::string("Invalid arguments: ") + e.what());
    }

    try
    {
        return handler(args);
    }
    catch (const ValidationError& e)
    {
        return error_result(e.what());
    }
    catch (const std::exception& e)
    {
        log::warn("tools", "tool '" + name + "' failed: " + e.what());
        return error_result(e.what());
    }
    catch (...)
    {
        log::error("tools", "tool '" + name + "' threw a non-standard exception");
        return error_result("Tool '" + name + "' failed with an unknown error");
    }
}

ToolHandler text_handler(std::function<std::string(const Arguments&)> fn)
{
    return [fn = std::move(fn)](const Arguments& args) { return text_result(fn(args)); };
}

ToolHandler json_handler(std::function<Json(const Arguments&)> fn)
{
    return [fn = std::move(fn)](const Arguments& args) { return json_result(fn(args)); };
}

} // namespace mcplink::tools
