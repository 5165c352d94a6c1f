#pragma once
#include "mcplink/types.hpp"

#include <string>
#include <vector>

namespace mcplink
{

/// One block of a tool result. Only "text" blocks are produced by this library;
/// "image" blocks are decoded when a peer sends them.
struct ContentBlock
{
    std::string type{"text"};
    std::string text;
    std::string data;      // base64 payload for image blocks
    std::string mime_type; // e.g. "image/png"
};

inline ContentBlock text_block(std::string text)
{
    ContentBlock block;
    block.text = std::move(text);
    return block;
}

// nlohmann::json adapters
inline void to_json(Json& j, const ContentBlock& c)
{
    j = Json{{"type", c.type}};
    if (c.type == "text")
    {
        j["text"] = c.text;
        return;
    }
    if (!c.text.empty())
        j["text"] = c.text;
    if (!c.data.empty())
        j["data"] = c.data;
    if (!c.mime_type.empty())
        j["mimeType"] = c.mime_type;
}

inline void from_json(const Json& j, ContentBlock& c)
{
    c.type = string_field(j, "type", "text");
    c.text = string_field(j, "text");
    c.data = string_field(j, "data");
    c.mime_type = string_field(j, "mimeType");
}

/// Result of a tools/call. is_error marks a domain failure reported inside a
/// successful protocol exchange; it is never turned into an exception.
struct ToolResult
{
    std::vector<ContentBlock> content;
    bool is_error{false};

    /// Text of the first text block, or empty
    std::string text() const
    {
        for (const auto& block : content)
            if (block.type == "text")
                return block.text;
        return "";
    }
};

inline void to_json(Json& j, const ToolResult& r)
{
    j = Json{{"content", r.content}};
    if (r.is_error)
        j["isError"] = true;
}

inline void from_json(const Json& j, ToolResult& r)
{
    r.content.clear();
    auto content = j.find("content");
    if (content != j.end() && content->is_array())
        for (const auto& c : *content)
            r.content.push_back(c.get<ContentBlock>());
    r.is_error = bool_field(j, "isError", false);
}

inline ToolResult text_result(std::string text)
{
    ToolResult r;
    r.content.push_back(text_block(std::move(text)));
    return r;
}

inline ToolResult error_result(std::string message)
{
    ToolResult r = text_result(std::move(message));
    r.is_error = true;
    return r;
}

/// Pretty-printed JSON wrapped in a single text block
inline ToolResult json_result(const Json& data)
{
    return text_result(data.dump(2));
}

} // namespace mcplink
