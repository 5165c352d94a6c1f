#include "mcplink/mcp/frame.hpp"

#include "mcplink/exceptions.hpp"
#include "mcplink/util/json.hpp"

namespace mcplink::mcp
{

std::optional<int64_t> Response::int_id() const
{
    if (id.is_number_integer())
        return id.get<int64_t>();
    if (id.is_string())
    {
        const auto& s = id.get_ref<const std::string&>();
        try
        {
            size_t used = 0;
            int64_t v = std::stoll(s, &used);
            if (used == s.size())
                return v;
        }
        catch (const std::exception&)
        {
        }
    }
    return std::nullopt;
}

Json to_json(const Request& req)
{
    Json j = {{"jsonrpc", JSONRPC_VERSION}, {"id", req.id}, {"method", req.method}};
    if (req.params && !req.params->is_null())
        j["params"] = *req.params;
    return j;
}

Json to_json(const Notification& note)
{
    Json j = {{"jsonrpc", JSONRPC_VERSION}, {"method", note.method}};
    if (note.params && !note.params->is_null())
        j["params"] = *note.params;
    return j;
}

Json to_json(const Response& resp)
{
    Json j = {{"jsonrpc", JSONRPC_VERSION}, {"id", resp.id}};
    if (resp.error)
    {
        Json err = {{"code", resp.error->code}, {"message", resp.error->message}};
        if (resp.error->data)
            err["data"] = *resp.error->data;
        j["error"] = err;
    }
    else
    {
        j["result"] = resp.result ? *resp.result : Json::object();
    }
    return j;
}

std::string encode(const Request& req)
{
    return util::json::dump(to_json(req));
}

std::string encode(const Notification& note)
{
    return util::json::dump(to_json(note));
}

std::string encode(const Response& resp)
{
    return util::json::dump(to_json(resp));
}

static std::optional<Json> optional_params(const Json& message)
{
    auto it = message.find("params");
    if (it == message.end() || it->is_null())
        return std::nullopt;
    return *it;
}

Frame decode_frame(const Json& message)
{
    if (!message.is_object())
        throw ValidationError("frame is not a JSON object");

    Frame frame;
    auto method_it = message.find("method");
    if (method_it != message.end())
    {
        if (!method_it->is_string())
            throw ValidationError("frame method must be a string");
        auto id_it = message.find("id");
        if (id_it == message.end() || id_it->is_null())
        {
            frame.kind = FrameKind::Notification;
            frame.notification.method = method_it->get<std::string>();
            frame.notification.params = optional_params(message);
        }
        else
        {
            frame.kind = FrameKind::Request;
            frame.request.id = *id_it;
            frame.request.method = method_it->get<std::string>();
            frame.request.params = optional_params(message);
        }
        return frame;
    }

    bool has_result = message.contains("result");
    bool has_error = message.contains("error") && !message["error"].is_null();
    if (has_result == has_error)
        throw ValidationError("response must carry exactly one of result or error");

    frame.kind = FrameKind::Response;
    frame.response.id = message.value("id", Json());
    if (has_error)
    {
        const auto& err = message["error"];
        if (!err.is_object())
            throw ValidationError("response error must be an object");
        RpcErrorObject obj;
        obj.code = err.value("code", INTERNAL_ERROR);
        obj.message = err.value("message", std::string("Unknown error"));
        if (err.contains("data"))
            obj.data = err["data"];
        frame.response.error = std::move(obj);
    }
    else
    {
        frame.response.result = message["result"];
    }
    return frame;
}

Frame decode_line(const std::string& line)
{
    return decode_frame(util::json::parse(line));
}

Response make_result(const Json& id, Json result)
{
    Response resp;
    resp.id = id;
    resp.result = std::move(result);
    return resp;
}

Response make_error(const Json& id, int code, std::string message)
{
    Response resp;
    resp.id = id;
    resp.error = RpcErrorObject{code, std::move(message), std::nullopt};
    return resp;
}

} // namespace mcplink::mcp
