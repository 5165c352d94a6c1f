/// @file stdio_client.cpp
/// @brief End-to-end: Client over StdioTransport against the example echo server

#include "mcplink/client/client.hpp"
#include "mcplink/exceptions.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

static std::string find_echo_server_binary()
{
    namespace fs = std::filesystem;
    const char* base = "mcplink_example_echo_server";

    // Candidates relative to current working directory (set by CTest)
    std::vector<fs::path> candidates = {fs::path(".") / base, fs::path("..") / base,
                                        fs::path("../examples") / base};
    for (const auto& p : candidates)
        if (fs::exists(p))
            return p.string();
    // Fallback to name; let PATH resolution try
    return std::string("./") + base;
}

int main()
{
    using namespace mcplink;
    using client::Client;

    auto session = Client::spawn(find_echo_server_binary(), {}, {{"MCPLINK_TEST_MARKER", "e2e"}});

    // initialize
    {
        const auto& init = session->initialize();
        assert(init.server_info.name == "echo");
        assert(init.protocol_version == DEFAULT_PROTOCOL_VERSION);
        assert(init.has_capability("tools"));
        std::cout << "[PASS] initialize" << std::endl;
    }

    // tools/list
    {
        auto tools = session->list_tools();
        bool found_echo = false;
        for (const auto& t : tools)
            if (t.name == "echo")
            {
                found_echo = true;
                assert(t.input_schema["required"] == Json::array({"text"}));
            }
        assert(found_echo);
        std::cout << "[PASS] tools/list returned echo" << std::endl;
    }

    // The echo scenario
    {
        auto result = session->call_tool("echo", Json{{"text", "hi"}});
        assert(!result.is_error);
        assert(result.content.size() == 1);
        assert(result.content[0].type == "text");
        assert(result.text() == "hi");

        auto upper = session->call_tool("echo", Json{{"text", "hi"}, {"upper", true}});
        assert(upper.text() == "HI");

        auto sum = session->call_tool("add", Json{{"a", 3}, {"b", 4}});
        assert(sum.text() == "7");
        std::cout << "[PASS] tools/call echo returned hi" << std::endl;
    }

    // Domain errors are results, not exceptions
    {
        auto failed = session->call_tool("fail", Json{{"message", "nope"}});
        assert(failed.is_error);
        assert(failed.text() == "nope");

        auto unknown = session->call_tool("nope", Json::object());
        assert(unknown.is_error);
        assert(unknown.text() == "Unknown tool: nope");
        std::cout << "[PASS] isError results" << std::endl;
    }

    // Environment overrides reach the child
    {
        auto env = session->call_tool("env", Json{{"name", "MCPLINK_TEST_MARKER"}});
        assert(env.text() == "e2e");
        std::cout << "[PASS] environment override" << std::endl;
    }

    // Resource templates
    {
        auto contents = session->read_resource("memo://shopping");
        assert(contents.size() == 1);
        assert(contents[0].text == "memo: shopping");
        assert(session->list_resource_templates().size() == 1);
        std::cout << "[PASS] resources/read via template" << std::endl;
    }

    // A timed-out call does not poison the connection
    {
        client::CallOptions quick;
        quick.timeout = std::chrono::milliseconds(50);
        bool timed_out = false;
        try
        {
            session->call_tool("sleep", Json{{"ms", 500}}, quick);
        }
        catch (const CallTimeoutError&)
        {
            timed_out = true;
        }
        assert(timed_out);
        assert(session->call_tool("echo", Json{{"text", "still here"}}).text() == "still here");
        std::cout << "[PASS] timeout then recovery" << std::endl;
    }

    // Concurrent callers
    {
        std::atomic<int> good{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t)
            threads.emplace_back(
                [&, t]
                {
                    for (int i = 0; i < 10; ++i)
                    {
                        std::string text = "t" + std::to_string(t) + "-" + std::to_string(i);
                        if (session->call_tool("echo", Json{{"text", text}}).text() == text)
                            good++;
                    }
                });
        for (auto& th : threads)
            th.join();
        assert(good == 40);
        std::cout << "[PASS] concurrent calls over one pipe" << std::endl;
    }

    session->close();
    assert(session->connection().is_closed());

    bool closed = false;
    try
    {
        session->ping();
    }
    catch (const ConnectionClosedError&)
    {
        closed = true;
    }
    assert(closed);

    std::cout << "\n[OK] stdio client end-to-end passed" << std::endl;
    return 0;
}
