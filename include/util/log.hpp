#pragma once
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

namespace apdulink
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // lifecycle lines, always shown unless the threshold is above it
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

inline bool log_enabled(Level lv)
{
    return (int)lv >= (int)global_level();
}

// Unknown names fall back to Info.
inline void set_log_level_by_name(const char *name)
{
    std::string level = name ? std::string(name) : std::string();
    for (auto &c : level)
        c = (char)std::tolower((unsigned char)c);

    if (level == "debug" || level == "trace")
        set_log_level(Level::Debug);
    else if (level == "warn" || level == "warning")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err")
        set_log_level(Level::Error);
    else if (level == "system" || level == "quiet")
        set_log_level(Level::System);
    else
        set_log_level(Level::Info);
}

// Reads the threshold from the environment; leaves it untouched when unset.
inline void init_log_from_env(const char *env_var)
{
    const char *v = env_var ? std::getenv(env_var) : nullptr;
    if (v && *v)
        set_log_level_by_name(v);
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if (!log_enabled(lv))
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    // one fprintf per line so lines from the link thread and callers do not tear
    char    body[1024];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(body, sizeof(body), fmt, ap);
    va_end(ap);

    size_t      m  = std::strlen(body);
    const char *nl = (m == 0 || body[m - 1] != '\n') ? "\n" : "";
    std::fprintf(stderr, "%s %s %s: %s%s", ts, level_name(lv), func ? func : "?", body, nl);
}

#define LOG_DEBUG(...) ::apdulink::logf(::apdulink::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::apdulink::logf(::apdulink::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::apdulink::logf(::apdulink::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::apdulink::logf(::apdulink::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::apdulink::logf(::apdulink::Level::System, __func__, __VA_ARGS__)

}  // namespace apdulink
