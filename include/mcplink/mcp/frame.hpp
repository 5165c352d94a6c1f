#pragma once
#include "mcplink/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mcplink::mcp
{

// Standard JSON-RPC 2.0 error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

struct RpcErrorObject
{
    int code{INTERNAL_ERROR};
    std::string message;
    std::optional<Json> data;
};

struct Request
{
    Json id; // integer for requests we issue; peers may use strings
    std::string method;
    std::optional<Json> params;
};

struct Notification
{
    std::string method;
    std::optional<Json> params;
};

struct Response
{
    Json id;
    std::optional<Json> result;
    std::optional<RpcErrorObject> error;

    /// Integer view of the id (also accepts numeric strings); nullopt otherwise
    std::optional<int64_t> int_id() const;
};

enum class FrameKind
{
    Request,
    Notification,
    Response
};

/// A decoded inbound line. Exactly one of the members matching `kind` is meaningful.
struct Frame
{
    FrameKind kind{FrameKind::Response};
    Request request;
    Notification notification;
    Response response;
};

Json to_json(const Request& req);
Json to_json(const Notification& note);
Json to_json(const Response& resp);

/// Serialize to a single line (no trailing newline; the transport appends it)
std::string encode(const Request& req);
std::string encode(const Notification& note);
std::string encode(const Response& resp);

/// Classify and decode one frame. Throws ValidationError when the line is not
/// JSON, not an object, or a response lacks exactly one of result/error.
Frame decode_frame(const Json& message);
Frame decode_line(const std::string& line);

Response make_result(const Json& id, Json result);
Response make_error(const Json& id, int code, std::string message);

} // namespace mcplink::mcp
