#pragma once

/*
    TSAA ANTI-ALIASING LIBRARY

    FILE: log.hpp
    MODULE: core
    PURPOSE: Minimal leveled logging. Hosts may install a sink to route messages into
             their own observability tooling.
*/


#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>

namespace tsaa
{
    enum class LogLevel : uint8_t
    {
        Info = 0,
        Warn = 1,
        Error = 2,
        Silent = 3
    };

    using LogSink = std::function<void(LogLevel, const std::string&)>;

    namespace detail
    {
        struct LogState
        {
            std::mutex mtx{};
            LogLevel min_level = LogLevel::Info;
            LogSink sink{};
        };

        inline LogState& log_state()
        {
            static LogState state{};
            return state;
        }

        inline void log_write(LogLevel level, const char* prefix, const std::string& msg)
        {
            LogSink sink{};
            {
                LogState& s = log_state();
                std::lock_guard<std::mutex> lock(s.mtx);
                if (level < s.min_level) return;
                sink = s.sink;
            }
            if (sink)
            {
                sink(level, msg);
                return;
            }
            std::ostream& os = (level == LogLevel::Error) ? std::cerr : std::cout;
            os << prefix << ' ' << msg << std::endl;
        }
    }

    inline void set_log_level(LogLevel level)
    {
        auto& s = detail::log_state();
        std::lock_guard<std::mutex> lock(s.mtx);
        s.min_level = level;
    }

    // Passing an empty sink restores stdout/stderr output.
    inline void set_log_sink(LogSink sink)
    {
        auto& s = detail::log_state();
        std::lock_guard<std::mutex> lock(s.mtx);
        s.sink = std::move(sink);
    }

    inline void log_info(const std::string& msg)
    {
        detail::log_write(LogLevel::Info, "[INFO]", msg);
    }

    inline void log_warn(const std::string& msg)
    {
        detail::log_write(LogLevel::Warn, "[WARN]", msg);
    }

    inline void log_error(const std::string& msg)
    {
        detail::log_write(LogLevel::Error, "[ERROR]", msg);
    }
}
