#include "mcplink/settings.hpp"

#include "mcplink/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mcplink
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int64_t getenv_int(const char* key, int64_t defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        return std::stoll(v);
    }
    catch (const std::exception&)
    {
        throw ValidationError(std::string(key) + " must be an integer, got '" + v + "'");
    }
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPLINK_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    s.log_level = lvl;
    s.protocol_version = getenv_str("MCPLINK_PROTOCOL_VERSION", s.protocol_version);
    s.call_timeout_ms = getenv_int("MCPLINK_CALL_TIMEOUT_MS", s.call_timeout_ms);
    s.close_grace_ms = getenv_int("MCPLINK_CLOSE_GRACE_MS", s.close_grace_ms);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("protocol_version"))
        s.protocol_version = j.at("protocol_version").get<std::string>();
    if (j.contains("client_name"))
        s.client_name = j.at("client_name").get<std::string>();
    if (j.contains("client_version"))
        s.client_version = j.at("client_version").get<std::string>();
    if (j.contains("call_timeout_ms"))
        s.call_timeout_ms = j.at("call_timeout_ms").get<int64_t>();
    if (j.contains("close_grace_ms"))
        s.close_grace_ms = j.at("close_grace_ms").get<int64_t>();
    return s;
}

} // namespace mcplink
