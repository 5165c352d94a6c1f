#include "mcplink/exceptions.hpp"
#include "mcplink/settings.hpp"
#include "mcplink/util/log.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

int main()
{
    using namespace mcplink;

    // Defaults
    {
        ::unsetenv("MCPLINK_LOG_LEVEL");
        ::unsetenv("MCPLINK_PROTOCOL_VERSION");
        ::unsetenv("MCPLINK_CALL_TIMEOUT_MS");
        ::unsetenv("MCPLINK_CLOSE_GRACE_MS");
        auto s = Settings::from_env();
        assert(s.log_level == "INFO");
        assert(s.protocol_version == DEFAULT_PROTOCOL_VERSION);
        assert(s.client_name == "mcplink");
        assert(s.call_timeout_ms == 0);
        assert(s.close_grace_ms == 2000);
        std::cout << "[PASS] defaults" << std::endl;
    }

    // Environment
    {
        ::setenv("MCPLINK_LOG_LEVEL", "debug", 1);
        ::setenv("MCPLINK_PROTOCOL_VERSION", "2025-03-26", 1);
        ::setenv("MCPLINK_CALL_TIMEOUT_MS", "1500", 1);
        ::setenv("MCPLINK_CLOSE_GRACE_MS", "250", 1);
        auto s = Settings::from_env();
        assert(s.log_level == "DEBUG");
        assert(s.protocol_version == "2025-03-26");
        assert(s.call_timeout_ms == 1500);
        assert(s.close_grace_ms == 250);

        ::setenv("MCPLINK_CALL_TIMEOUT_MS", "soon", 1);
        bool threw = false;
        try
        {
            Settings::from_env();
        }
        catch (const ValidationError&)
        {
            threw = true;
        }
        assert(threw);
        ::unsetenv("MCPLINK_CALL_TIMEOUT_MS");
        std::cout << "[PASS] from_env" << std::endl;
    }

    // JSON
    {
        auto s = Settings::from_json(Json{{"client_name", "inspector"}, {"close_grace_ms", 10}});
        assert(s.client_name == "inspector");
        assert(s.close_grace_ms == 10);
        assert(s.log_level == "INFO");
        std::cout << "[PASS] from_json" << std::endl;
    }

    // Log levels
    {
        assert(log::level_from_string("warning") == log::Level::Warn);
        assert(log::level_from_string("ERROR") == log::Level::Error);
        assert(log::level_from_string("bogus") == log::Level::Info);
        log::set_level(log::Level::Warn);
        assert(!log::enabled(log::Level::Info));
        assert(log::enabled(log::Level::Error));
        log::set_level(log::Level::Off);
        assert(!log::enabled(log::Level::Error));
        log::set_level(log::Level::Info);
        std::cout << "[PASS] log levels" << std::endl;
    }

    // Non-ASCII bytes in level names are tolerated
    {
        assert(log::level_from_string("d\xe9" "bug") == log::Level::Info);
        assert(log::level_from_string("\xff\x80WARN") == log::Level::Info);

        ::setenv("MCPLINK_LOG_LEVEL", "d\xc3\xa9" "bug", 1);
        auto s = Settings::from_env();
        assert(s.log_level == "D\xc3\xa9" "BUG");
        ::unsetenv("MCPLINK_LOG_LEVEL");
        std::cout << "[PASS] non-ASCII log levels" << std::endl;
    }

    return 0;
}
