#pragma once

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#ifndef STRATA_DISABLE_LOGGING
    #define STRATA_LOG(level, ...) ::Strata::Logger::Instance().Log(level, __VA_ARGS__)
#else
    #define STRATA_LOG(level, ...) ((void)0)
#endif

#define STRATA_LOG_DEBUG(...) STRATA_LOG(::Strata::LogLevel::Debug, __VA_ARGS__)
#define STRATA_LOG_INFO(...)  STRATA_LOG(::Strata::LogLevel::Info, __VA_ARGS__)
#define STRATA_LOG_WARN(...)  STRATA_LOG(::Strata::LogLevel::Warn, __VA_ARGS__)
#define STRATA_LOG_ERROR(...) STRATA_LOG(::Strata::LogLevel::Error, __VA_ARGS__)

namespace Strata
{
    enum class LogLevel
    {
        Debug,
        Info,
        Warn,
        Error
    };

    [[nodiscard]] constexpr const char* LogLevelName(LogLevel level) noexcept
    {
        switch (level)
        {
            case LogLevel::Debug: return "debug";
            case LogLevel::Info: return "info";
            case LogLevel::Warn: return "warn";
            case LogLevel::Error: return "error";
        }
        return "unknown";
    }

    // Interface to subscribe to log events
    class LogListener
    {
    public:
        virtual ~LogListener() = default;
        virtual void OnLog(LogLevel level, const std::string& msg) = 0;
    };

    // Process-wide log dispatcher. With no listeners registered, messages go to stderr.
    class Logger
    {
    public:
        Logger(const Logger&) = delete;
        void operator=(const Logger&) = delete;

        static Logger& Instance()
        {
            static Logger s_logger;
            return s_logger;
        }

        template<typename... Args>
        void Log(LogLevel level, fmt::format_string<Args...> msg, Args&&... args)
        {
            if (level < m_minLevel) return;
            LogImpl(level, fmt::format(msg, std::forward<Args>(args)...));
        }

        void SetLevel(LogLevel level) noexcept { m_minLevel = level; }
        [[nodiscard]] LogLevel GetLevel() const noexcept { return m_minLevel; }

        void Register(LogListener* listener)
        {
            m_listeners.push_back(listener);
        }

        void Unregister(LogListener* listener)
        {
            auto pos = std::find(m_listeners.begin(), m_listeners.end(), listener);
            if (pos != m_listeners.end())
                m_listeners.erase(pos);
        }

    private:
        Logger() = default;

        void LogImpl(LogLevel level, const std::string& msg)
        {
            if (m_listeners.empty())
            {
                fmt::print(stderr, "[strata:{}] {}\n", LogLevelName(level), msg);
                return;
            }

            for (auto* listener : m_listeners)
            {
                listener->OnLog(level, msg);
            }
        }

        std::vector<LogListener*> m_listeners;
        LogLevel m_minLevel = LogLevel::Warn;
    };

    // Registers itself for its lifetime. Handy in tests to capture output.
    class ScopedLogListener : public LogListener
    {
    public:
        ScopedLogListener() { Logger::Instance().Register(this); }
        ~ScopedLogListener() override { Logger::Instance().Unregister(this); }

        ScopedLogListener(const ScopedLogListener&) = delete;
        ScopedLogListener& operator=(const ScopedLogListener&) = delete;
    };
}
