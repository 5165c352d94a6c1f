#pragma once
#include "mcplink/tools/tool.hpp"
#include "mcplink/types.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace mcplink::tools
{

/// Fluent declaration of a tool and its parameters.
///
/// @code
/// auto search = ToolBuilder("search_mail")
///                   .description("Search the mailbox")
///                   .string("query", "Search expression", true)
///                   .integer("limit", "Maximum results", false)
///                   .enumeration("folder", "Folder", {"inbox", "sent"}, false)
///                   .build();
/// @endcode
///
/// The resulting input schema is
/// {"type":"object","properties":{...},"required":[...]} with `required` in
/// declaration order. Declaring the same parameter twice throws ValidationError.
class ToolBuilder
{
  public:
    explicit ToolBuilder(std::string name);

    ToolBuilder& description(std::string text);

    ToolBuilder& string(const std::string& name, const std::string& description,
                        bool required = false);
    ToolBuilder& integer(const std::string& name, const std::string& description,
                         bool required = false);
    ToolBuilder& number(const std::string& name, const std::string& description,
                        bool required = false);
    ToolBuilder& boolean(const std::string& name, const std::string& description,
                         bool required = false);
    /// String parameter restricted to `allowed`
    ToolBuilder& enumeration(const std::string& name, const std::string& description,
                             const std::vector<std::string>& allowed, bool required = false);

    /// Attach a default value to an already declared parameter
    ToolBuilder& default_value(const std::string& name, Json value);

    ToolDescriptor build() const;

  private:
    ToolBuilder& add(const std::string& name, Json property, bool required);

    std::string name_;
    std::string description_;
    Json properties_ = Json::object();
    std::vector<std::string> required_;
    std::unordered_set<std::string> declared_;
};

} // namespace mcplink::tools
