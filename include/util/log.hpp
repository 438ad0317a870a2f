#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <strings.h>  // strcasecmp

namespace osisim
{

enum class Level
{
    Debug   = 0,
    Warning = 1,
    Error   = 2,
    Quiet   = 3  // threshold only, nothing logs at this level
};

inline Level &global_level()
{
    static Level lv = Level::Warning;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

// Case-insensitive. Unknown names leave warn in place and return false.
inline bool set_log_level_by_name(const char *name)
{
    struct Alias
    {
        const char *name;
        Level       level;
    };
    static const Alias aliases[] = {
        {"debug", Level::Debug}, {"warn", Level::Warning}, {"warning", Level::Warning},
        {"info", Level::Warning}, {"error", Level::Error}, {"err", Level::Error},
        {"quiet", Level::Quiet},
    };
    for (const Alias &a : aliases)
    {
        if (name && strcasecmp(name, a.name) == 0)
        {
            set_log_level(a.level);
            return true;
        }
    }
    set_log_level(Level::Warning);
    return false;
}

inline const char *level_tag(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::Quiet:
            break;
    }
    return "?";
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if (static_cast<int>(lv) < static_cast<int>(global_level()))
        return;

    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);

    std::fprintf(stderr, "%02d:%02d:%02d.%03d %s %s: ", tm.tm_hour, tm.tm_min, tm.tm_sec,
                 static_cast<int>(ms.count()), level_tag(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    const size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::osisim::logf(::osisim::Level::Debug, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::osisim::logf(::osisim::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::osisim::logf(::osisim::Level::Error, __func__, __VA_ARGS__)

}  // namespace osisim
