#include "mcplink/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace mcplink::log
{

namespace
{
std::atomic<Level> g_level{Level::Info};
std::mutex g_write_mutex;
} // namespace

Level level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "WARN" || upper == "WARNING")
        return Level::Warn;
    if (upper == "ERROR")
        return Level::Error;
    if (upper == "OFF" || upper == "NONE")
        return Level::Off;
    return Level::Info;
}

const char* to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "INFO";
}

void set_level(Level level)
{
    g_level.store(level, std::memory_order_relaxed);
}

Level level()
{
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl)
{
    auto current = level();
    return current != Level::Off && lvl != Level::Off &&
           static_cast<int>(lvl) >= static_cast<int>(current);
}

void write(Level lvl, const std::string& component, const std::string& message)
{
    if (!enabled(lvl))
        return;
    // stdout is reserved for protocol frames
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[mcplink] " << to_string(lvl) << " " << component << ": " << message
              << std::endl;
}

} // namespace mcplink::log
