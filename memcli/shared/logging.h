#pragma once
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string_view>

namespace memcli {

enum log_level : uint8_t
{
    log_debug = 0,
    log_info  = 1,
    log_warn  = 2,
    log_error = 3
};

// Verbosity is carried by value; every component that logs receives the
// logger it was constructed with.
class logger
{
public:
    explicit logger(log_level level = log_warn, FILE* out = stderr) noexcept
        : m_level(level), m_out(out) {}

    log_level level() const noexcept { return m_level; }
    void set_level(log_level level) noexcept { m_level = level; }

    bool enabled(log_level level) const noexcept { return level >= m_level && m_out; }

    void log(log_level level, std::string_view msg) const
    {
        if (!enabled(level))
            return;

        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);

        const char* tag;
        switch (level)
        {
            case log_debug: tag = "DEBUG"; break;
            case log_info:  tag = "INFO";  break;
            case log_warn:  tag = "WARN";  break;
            case log_error: tag = "ERROR"; break;
            default:        tag = "?";     break;
        }

        static std::mutex mtx;
        std::lock_guard<std::mutex> lock(mtx);
        std::fprintf(m_out, "[%02d:%02d:%02d] [%s] %.*s\n",
            tm.tm_hour, tm.tm_min, tm.tm_sec, tag,
            static_cast<int>(msg.size()), msg.data());
    }

private:
    log_level m_level;
    FILE* m_out;
};

bool parse_log_level(std::string_view str, log_level& level);

} // namespace memcli

#define MEMCLI_LOG_DEBUG(lg, msg) do { if ((lg).enabled(memcli::log_debug)) (lg).log(memcli::log_debug, msg); } while(0)
#define MEMCLI_LOG_INFO(lg, msg)  do { if ((lg).enabled(memcli::log_info))  (lg).log(memcli::log_info,  msg); } while(0)
#define MEMCLI_LOG_WARN(lg, msg)  do { if ((lg).enabled(memcli::log_warn))  (lg).log(memcli::log_warn,  msg); } while(0)
#define MEMCLI_LOG_ERROR(lg, msg) do { if ((lg).enabled(memcli::log_error)) (lg).log(memcli::log_error, msg); } while(0)
