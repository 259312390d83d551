#include <hosts/system.hpp>
#include <array>
#include <cstdlib>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace hlk::hosts
{
    namespace
    {
        bool execute(const char* command)
        {
            return std::system(command) == 0;
        }
    }

    bool has_privilege()
    {
#ifdef _WIN32
        return execute("net session >nul 2>&1");
#else
        return geteuid() == 0;
#endif
    }

    bool flush_cache()
    {
#if defined(_WIN32)
        return execute("ipconfig /flushdns >nul 2>&1");
#elif defined(__APPLE__)
        // mDNSResponder 负责实际的解析缓存，两条命令都需要执行
        const bool flushed = execute("/usr/bin/dscacheutil -flushcache >/dev/null 2>&1");
        return execute("/usr/bin/killall -HUP mDNSResponder >/dev/null 2>&1") && flushed;
#else
        constexpr std::array<const char*, 2> commands{
            "resolvectl flush-caches >/dev/null 2>&1",
            "systemd-resolve --flush-caches >/dev/null 2>&1",
        };
        for (const auto command : commands)
        {
            if (execute(command))
            {
                return true;
            }
        }
        return false;
#endif
    }
}
