#pragma once
#include <string>

namespace mcplink::log
{

enum class Level
{
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/// Parse "DEBUG"/"INFO"/"WARN"/"WARNING"/"ERROR"/"OFF" (case-insensitive); unknown -> Info
Level level_from_string(const std::string& name);
const char* to_string(Level level);

void set_level(Level level);
Level level();
bool enabled(Level level);

/// Write one diagnostic line to stderr: "[mcplink] WARN component: message"
void write(Level level, const std::string& component, const std::string& message);

inline void debug(const std::string& component, const std::string& message)
{
    write(Level::Debug, component, message);
}
inline void info(const std::string& component, const std::string& message)
{
    write(Level::Info, component, message);
}
inline void warn(const std::string& component, const std::string& message)
{
    write(Level::Warn, component, message);
}
inline void error(const std::string& component, const std::string& message)
{
    write(Level::Error, component, message);
}

} // namespace mcplink::log
