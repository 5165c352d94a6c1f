#include "mcplink/client/client.hpp"
#include "mcplink/exceptions.hpp"
#include "mcplink/settings.hpp"
#include "mcplink/util/json.hpp"
#include "mcplink/util/log.hpp"
#include "mcplink/version.hpp"

#include <chrono>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "mcplink " << mcplink::VERSION_MAJOR << "." << mcplink::VERSION_MINOR << "."
              << mcplink::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  mcplink --help\n";
    std::cout << "  mcplink tools     [options] <command> [args...]\n";
    std::cout << "  mcplink resources [options] <command> [args...]\n";
    std::cout << "  mcplink call <tool> <json-args> [options] -- <command> [args...]\n";
    std::cout << "  mcplink read <uri> [options] -- <command> [args...]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --env KEY=VALUE     Extra environment for the server (repeatable)\n";
    std::cout << "  --timeout-ms <n>    Per-call deadline (default: MCPLINK_CALL_TIMEOUT_MS)\n";
    std::cout << "  --pretty            Pretty-print JSON output\n";
    std::cout << "\n";
    std::cout << "Exit status: 0 ok, 1 error, 2 usage, 3 tool reported isError\n";
    return exit_code;
}

struct Invocation
{
    std::string subcommand;
    std::vector<std::string> positional;
    std::vector<std::string> server_command;
    std::map<std::string, std::string> env;
    std::optional<long long> timeout_ms;
    bool pretty = false;
};

static bool is_flag(const std::string& s)
{
    return !s.empty() && s[0] == '-';
}

static long long parse_timeout(const std::string& s)
{
    size_t pos = 0;
    long long v = -1;
    try
    {
        v = std::stoll(s, &pos, 10);
    }
    catch (const std::exception&)
    {
        throw mcplink::ValidationError("--timeout-ms expects an integer, got '" + s + "'");
    }
    if (pos != s.size() || v < 0)
        throw mcplink::ValidationError("--timeout-ms expects a non-negative integer, got '" + s +
                                       "'");
    return v;
}

/// Options may appear anywhere before "--". Without "--", positionals past
/// the ones the subcommand needs are the server command line.
static Invocation parse_invocation(int argc, char** argv, size_t needed_positionals)
{
    Invocation inv;
    inv.subcommand = argv[1];

    std::vector<std::string> words;
    bool after_separator = false;
    for (int i = 2; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (after_separator)
        {
            inv.server_command.push_back(arg);
            continue;
        }
        if (arg == "--")
        {
            after_separator = true;
            continue;
        }
        // Once the server command has started, its own flags belong to it
        bool command_started = words.size() > needed_positionals;
        if (!command_started && arg == "--env")
        {
            if (i + 1 >= argc)
                throw mcplink::ValidationError("--env requires KEY=VALUE");
            std::string kv = argv[++i];
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0)
                throw mcplink::ValidationError("--env expects KEY=VALUE, got '" + kv + "'");
            inv.env[kv.substr(0, eq)] = kv.substr(eq + 1);
            continue;
        }
        if (!command_started && arg == "--timeout-ms")
        {
            if (i + 1 >= argc)
                throw mcplink::ValidationError("--timeout-ms requires a value");
            inv.timeout_ms = parse_timeout(argv[++i]);
            continue;
        }
        if (!command_started && arg == "--pretty")
        {
            inv.pretty = true;
            continue;
        }
        if (!command_started && words.size() < needed_positionals && is_flag(arg) && arg != "-")
            throw mcplink::ValidationError("unknown option " + arg);
        words.push_back(arg);
    }

    if (words.size() < needed_positionals)
        throw mcplink::ValidationError(inv.subcommand + ": missing arguments");
    inv.positional.assign(words.begin(), words.begin() + static_cast<long long>(needed_positionals));
    for (size_t i = needed_positionals; i < words.size(); ++i)
        inv.server_command.insert(inv.server_command.begin() +
                                      static_cast<long long>(i - needed_positionals),
                                  words[i]);

    if (inv.server_command.empty())
        throw mcplink::ValidationError(inv.subcommand + ": missing server command");
    return inv;
}

static void print_json(const mcplink::Json& j, bool pretty)
{
    std::cout << (pretty ? mcplink::util::json::dump_pretty(j) : mcplink::util::json::dump(j))
              << "\n";
}

static int run(const Invocation& inv)
{
    using namespace mcplink;

    Settings settings = Settings::from_env();
    log::set_level(log::level_from_string(settings.log_level));

    auto options = client::ClientOptions::from_settings(settings);
    if (inv.timeout_ms)
        options.default_timeout = std::chrono::milliseconds(*inv.timeout_ms);

    std::vector<std::string> args(inv.server_command.begin() + 1, inv.server_command.end());
    auto session = client::Client::spawn(inv.server_command.front(), args, inv.env, options);
    session->initialize();

    int exit_code = 0;
    if (inv.subcommand == "tools")
    {
        Json out = Json::array();
        for (const auto& tool : session->list_tools())
            out.push_back(tool);
        print_json(out, inv.pretty);
    }
    else if (inv.subcommand == "resources")
    {
        Json out = {{"resources", session->list_resources()},
                    {"resourceTemplates", session->list_resource_templates()}};
        print_json(out, inv.pretty);
    }
    else if (inv.subcommand == "call")
    {
        Json arguments = util::json::parse(inv.positional[1]);
        auto result = session->call_tool(inv.positional[0], arguments);
        print_json(result, inv.pretty);
        if (result.is_error)
            exit_code = 3;
    }
    else if (inv.subcommand == "read")
    {
        Json out = Json::array();
        for (const auto& content : session->read_resource(inv.positional[0]))
            out.push_back(content);
        print_json(out, inv.pretty);
    }

    session->close();
    return exit_code;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(0);

    size_t needed = 0;
    if (cmd == "tools" || cmd == "resources")
        needed = 0;
    else if (cmd == "call")
        needed = 2;
    else if (cmd == "read")
        needed = 1;
    else
    {
        std::cerr << "Unknown command: " << cmd << "\n";
        return usage(2);
    }

    Invocation inv;
    try
    {
        inv = parse_invocation(argc, argv, needed);
    }
    catch (const mcplink::ValidationError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return usage(2);
    }

    try
    {
        return run(inv);
    }
    catch (const mcplink::RpcError& e)
    {
        std::cerr << "Server error " << e.code() << ": " << e.rpc_message() << "\n";
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
