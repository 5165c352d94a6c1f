/// @file frame.cpp
/// @brief JSON-RPC frame encoding and classification

#include "mcplink/exceptions.hpp"
#include "mcplink/mcp/frame.hpp"
#include "mcplink/util/json.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace mcplink;
using namespace mcplink::mcp;

static bool rejects(const std::string& line)
{
    try
    {
        decode_line(line);
    }
    catch (const ValidationError&)
    {
        return true;
    }
    return false;
}

int main()
{
    // Request encoding: single line, params omitted when absent
    {
        Request req;
        req.id = 7;
        req.method = "tools/list";
        std::string line = encode(req);
        assert(line.find('\n') == std::string::npos);
        auto j = util::json::parse(line);
        assert(j["jsonrpc"] == "2.0");
        assert(j["id"] == 7);
        assert(j["method"] == "tools/list");
        assert(!j.contains("params"));

        req.params = Json{{"cursor", "abc"}};
        j = util::json::parse(encode(req));
        assert(j["params"]["cursor"] == "abc");
        std::cout << "[PASS] request encoding" << std::endl;
    }

    // Notification has no id
    {
        Notification note;
        note.method = "notifications/initialized";
        auto j = util::json::parse(encode(note));
        assert(!j.contains("id"));
        assert(j["method"] == "notifications/initialized");
        std::cout << "[PASS] notification encoding" << std::endl;
    }

    // Responses carry exactly one of result/error
    {
        auto ok = util::json::parse(encode(make_result(3, Json{{"x", 1}})));
        assert(ok.contains("result") && !ok.contains("error"));
        auto err = util::json::parse(encode(make_error("a", METHOD_NOT_FOUND, "no such method")));
        assert(err.contains("error") && !err.contains("result"));
        assert(err["id"] == "a");
        assert(err["error"]["code"] == -32601);
        assert(err["error"]["message"] == "no such method");

        auto null_id = util::json::parse(encode(make_error(Json(), PARSE_ERROR, "Parse error")));
        assert(null_id.contains("id") && null_id["id"].is_null());
        std::cout << "[PASS] response encoding" << std::endl;
    }

    // Classification
    {
        auto f = decode_line(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
        assert(f.kind == FrameKind::Request);
        assert(f.request.method == "ping");
        assert(!f.request.params);

        f = decode_line(R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"p":1}})");
        assert(f.kind == FrameKind::Notification);
        assert(f.notification.params && (*f.notification.params)["p"] == 1);

        f = decode_line(R"({"jsonrpc":"2.0","id":2,"result":{}})");
        assert(f.kind == FrameKind::Response);
        assert(f.response.result && !f.response.error);
        assert(f.response.int_id() == 2);

        f = decode_line(R"({"jsonrpc":"2.0","id":"5","error":{"code":-32602,"message":"bad"}})");
        assert(f.kind == FrameKind::Response);
        assert(f.response.error->code == INVALID_PARAMS);
        assert(f.response.error->message == "bad");
        assert(f.response.int_id() == 5);

        f = decode_line(R"({"jsonrpc":"2.0","id":"req-x","result":null})");
        assert(!f.response.int_id());
        std::cout << "[PASS] frame classification" << std::endl;
    }

    // Malformed frames
    {
        assert(rejects("not json"));
        assert(rejects("[1,2]"));
        assert(rejects(R"({"jsonrpc":"2.0","id":1})"));
        assert(rejects(R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})"));
        assert(rejects(R"({"jsonrpc":"2.0","id":1,"error":"boom"})"));
        assert(rejects(R"({"jsonrpc":"2.0","id":1,"method":42})"));
        std::cout << "[PASS] malformed frames rejected" << std::endl;
    }

    std::cout << "\n[OK] frame codec tests passed" << std::endl;
    return 0;
}
