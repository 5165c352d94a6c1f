#include "mcplink/exceptions.hpp"
#include "mcplink/tools/builder.hpp"

#include <cassert>
#include <iostream>

using namespace mcplink;
using mcplink::tools::ToolBuilder;

int main()
{
    // Mixed parameters: required in declaration order
    {
        auto tool = ToolBuilder("search")
                        .description("Search documents")
                        .string("query", "Search text", true)
                        .integer("limit", "Max results")
                        .number("threshold", "Score cutoff")
                        .boolean("exact", "Exact match", true)
                        .enumeration("sort", "Ordering", {"relevance", "date"})
                        .default_value("limit", 10)
                        .build();

        assert(tool.name == "search");
        assert(tool.description == "Search documents");
        const auto& s = tool.input_schema;
        assert(s["type"] == "object");
        assert(s["properties"]["query"]["type"] == "string");
        assert(s["properties"]["query"]["description"] == "Search text");
        assert(s["properties"]["limit"]["type"] == "integer");
        assert(s["properties"]["limit"]["default"] == 10);
        assert(s["properties"]["threshold"]["type"] == "number");
        assert(s["properties"]["exact"]["type"] == "boolean");
        assert(s["properties"]["sort"]["enum"] == Json::array({"relevance", "date"}));
        assert(s["required"] == Json::array({"query", "exact"}));
        std::cout << "[PASS] schema for mixed parameters" << std::endl;
    }

    // Zero parameters is legal; empty sections are omitted
    {
        auto tool = ToolBuilder("now").build();
        assert(tool.input_schema == Json({{"type", "object"}}));
        assert(tool.description.empty());
        std::cout << "[PASS] zero-parameter tool" << std::endl;
    }

    // Optional-only parameters: properties present, required omitted
    {
        auto tool = ToolBuilder("opt").string("a", "").build();
        assert(tool.input_schema.contains("properties"));
        assert(!tool.input_schema.contains("required"));
        assert(!tool.input_schema["properties"]["a"].contains("description"));
        std::cout << "[PASS] required omitted when empty" << std::endl;
    }

    // Duplicate parameter names fail at the adding call
    {
        ToolBuilder b("dup");
        b.string("x", "first");
        bool threw = false;
        try
        {
            b.integer("x", "second");
        }
        catch (const ValidationError& e)
        {
            threw = true;
            assert(std::string(e.what()).find("'x'") != std::string::npos);
        }
        assert(threw);
        std::cout << "[PASS] duplicate parameter rejected" << std::endl;
    }

    // Misuse
    {
        bool threw = false;
        try
        {
            ToolBuilder("e").enumeration("mode", "", {});
        }
        catch (const ValidationError&)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            ToolBuilder("d").default_value("undeclared", 1);
        }
        catch (const ValidationError&)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            ToolBuilder("n").string("", "nameless");
        }
        catch (const ValidationError&)
        {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] builder misuse rejected" << std::endl;
    }

    // Wire form of the descriptor
    {
        auto tool = ToolBuilder("echo").string("text", "t", true).build();
        Json j = tool;
        assert(j["name"] == "echo");
        assert(j.contains("inputSchema"));
        assert(!j.contains("description"));
        std::cout << "[PASS] descriptor serialization" << std::endl;
    }

    return 0;
}
