#include "mcplink/tools/builder.hpp"

#include "mcplink/exceptions.hpp"

namespace mcplink::tools
{

static Json typed_property(const char* type, const std::string& description)
{
    Json prop = {{"type", type}};
    if (!description.empty())
        prop["description"] = description;
    return prop;
}

ToolBuilder::ToolBuilder(std::string name) : name_(std::move(name)) {}

ToolBuilder& ToolBuilder::description(std::string text)
{
    description_ = std::move(text);
    return *this;
}

ToolBuilder& ToolBuilder::string(const std::string& name, const std::string& description,
                                 bool required)
{
    return add(name, typed_property("string", description), required);
}

ToolBuilder& ToolBuilder::integer(const std::string& name, const std::string& description,
                                  bool required)
{
    return add(name, typed_property("integer", description), required);
}

ToolBuilder& ToolBuilder::number(const std::string& name, const std::string& description,
                                 bool required)
{
    return add(name, typed_property("number", description), required);
}

ToolBuilder& ToolBuilder::boolean(const std::string& name, const std::string& description,
                                  bool required)
{
    return add(name, typed_property("boolean", description), required);
}

ToolBuilder& ToolBuilder::enumeration(const std::string& name, const std::string& description,
                                      const std::vector<std::string>& allowed, bool required)
{
    if (allowed.empty())
        throw ValidationError("enum parameter '" + name + "' of tool '" + name_ +
                              "' needs at least one allowed value");
    Json prop = typed_property("string", description);
    prop["enum"] = allowed;
    return add(name, std::move(prop), required);
}

ToolBuilder& ToolBuilder::default_value(const std::string& name, Json value)
{
    if (!declared_.count(name))
        throw ValidationError("parameter '" + name + "' of tool '" + name_ + "' is not declared");
    properties_[name]["default"] = std::move(value);
    return *this;
}

ToolBuilder& ToolBuilder::add(const std::string& name, Json property, bool required)
{
    if (name.empty())
        throw ValidationError("tool '" + name_ + "' has a parameter with an empty name");
    if (!declared_.insert(name).second)
        throw ValidationError("parameter '" + name + "' declared twice in tool '" + name_ + "'");
    properties_[name] = std::move(property);
    if (required)
        required_.push_back(name);
    return *this;
}

ToolDescriptor ToolBuilder::build() const
{
    ToolDescriptor tool;
    tool.name = name_;
    tool.description = description_;
    tool.input_schema = Json{{"type", "object"}};
    if (!properties_.empty())
        tool.input_schema["properties"] = properties_;
    if (!required_.empty())
        tool.input_schema["required"] = required_;
    return tool;
}

} // namespace mcplink::tools
