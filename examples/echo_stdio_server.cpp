// Minimal stdio MCP server used by the end-to-end tests and the CLI docs.
//
//   echo   {text, upper?}  -> text back
//   add    {a, b}          -> a + b
//   fail   {message?}      -> isError result
//   sleep  {ms}            -> "slept" after ms milliseconds
//   env    {name}          -> value of an environment variable in the server
//   memo://{name}          -> "memo: <name>"
#include "mcplink/server/stdio_server.hpp"
#include "mcplink/settings.hpp"
#include "mcplink/tools/builder.hpp"
#include "mcplink/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>

int main()
{
    using namespace mcplink;

    auto settings = Settings::from_env();
    log::set_level(log::level_from_string(settings.log_level));

    auto srv = std::make_shared<server::McpServer>("echo", "1.0.0", settings.protocol_version);
    auto& registry = srv->tools();

    registry.register_tool(tools::ToolBuilder("echo")
                            .description("Echo the input text")
                            .string("text", "Text to echo", true)
                            .boolean("upper", "Upper-case the reply")
                            .default_value("upper", false)
                            .build(),
                        tools::text_handler(
                            [](const tools::Arguments& args)
                            {
                                std::string text = args.require_string("text");
                                if (args.bool_default("upper", false))
                                    std::transform(text.begin(), text.end(), text.begin(),
                                                   [](unsigned char c)
                                                   { return static_cast<char>(std::toupper(c)); });
                                return text;
                            }));

    registry.register_tool(tools::ToolBuilder("add")
                            .description("Add two numbers")
                            .number("a", "First operand", true)
                            .number("b", "Second operand", true)
                            .build(),
                        tools::text_handler(
                            [](const tools::Arguments& args)
                            {
                                double sum = args.require_number("a") + args.require_number("b");
                                std::ostringstream out;
                                out << sum;
                                return out.str();
                            }));

    registry.register_tool(tools::ToolBuilder("fail")
                            .description("Always fails")
                            .string("message", "Failure message")
                            .build(),
                        [](const tools::Arguments& args) -> ToolResult
                        {
                            throw std::runtime_error(
                                args.string_default("message", "requested failure"));
                        });

    registry.register_tool(tools::ToolBuilder("sleep")
                            .description("Reply after a delay")
                            .integer("ms", "Delay in milliseconds", true)
                            .build(),
                        tools::text_handler(
                            [](const tools::Arguments& args)
                            {
                                std::this_thread::sleep_for(
                                    std::chrono::milliseconds(args.require_int("ms")));
                                return std::string("slept");
                            }));

    registry.register_tool(tools::ToolBuilder("env")
                            .description("Read an environment variable of the server process")
                            .string("name", "Variable name", true)
                            .build(),
                        tools::text_handler(
                            [](const tools::Arguments& args)
                            {
                                const char* value = std::getenv(args.require_string("name").c_str());
                                return std::string(value ? value : "");
                            }));

    srv->resources().register_template(
        resources::ResourceTemplate{"memo://{name}", "memo", "A named memo", "text/plain"},
        resources::text_reader("text/plain", [](const resources::ResourceRequest& req)
                               { return "memo: " + req.params.at("name"); }));

    server::StdioServerWrapper wrapper(srv);
    wrapper.run();
    return 0;
}
