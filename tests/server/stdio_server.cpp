/// @file stdio_server.cpp
/// @brief StdioServerWrapper over in-memory streams

#include "mcplink/server/stdio_server.hpp"
#include "mcplink/tools/builder.hpp"
#include "mcplink/util/json.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <vector>

using namespace mcplink;

static std::vector<Json> lines_of(const std::string& text)
{
    std::vector<Json> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        out.push_back(util::json::parse(line));
    return out;
}

int main()
{
    auto srv = std::make_shared<server::McpServer>("stdio-test", "1.0.0");
    srv->tools().register_tool(
        tools::ToolBuilder("echo").string("text", "", true).build(),
        tools::text_handler([](const tools::Arguments& a) { return a.require_string("text"); }));

    // One reply per request, none for notifications, in order
    {
        std::istringstream in(
            R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"
            "\n"
            R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
            "\n"
            "\n"
            R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})"
            "\r\n"
            "garbage\n"
            R"({"jsonrpc":"2.0","id":3,"method":"ping"})"
            "\n");
        std::ostringstream out;

        server::StdioServerWrapper wrapper(srv, in, out);
        assert(wrapper.run());
        assert(!wrapper.running());

        auto replies = lines_of(out.str());
        assert(replies.size() == 4);
        assert(replies[0]["id"] == 1);
        assert(replies[0]["result"]["serverInfo"]["name"] == "stdio-test");
        assert(replies[1]["id"] == 2);
        assert(replies[1]["result"]["content"][0]["text"] == "hi");
        assert(replies[2]["error"]["code"] == -32700);
        assert(replies[3]["id"] == 3);
        assert(srv->initialized());
        std::cout << "[PASS] request/reply loop" << std::endl;
    }

    // Background mode finishes at EOF; stop() is safe afterwards
    {
        std::istringstream in(R"({"jsonrpc":"2.0","id":9,"method":"tools/list"})"
                              "\n");
        std::ostringstream out;
        server::StdioServerWrapper wrapper(srv, in, out);
        assert(wrapper.start_async());
        wrapper.stop();
        wrapper.stop();
        assert(!wrapper.running());
        std::cout << "[PASS] start_async/stop" << std::endl;
    }

    std::cout << "\n[OK] stdio server tests passed" << std::endl;
    return 0;
}
