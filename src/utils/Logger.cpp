#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

#include <iostream>

namespace LogSeg
{
    namespace Utils
    {
        std::optional<LogLevel> parseLogLevel(std::string_view name)
        {
            const std::string_view n = trim(name);
            if (iequals(n, "trace"))    return LogLevel::TRACE;
            if (iequals(n, "debug"))    return LogLevel::DEBUG;
            if (iequals(n, "info"))     return LogLevel::INFO;
            if (iequals(n, "warn") || iequals(n, "warning")) return LogLevel::WARN;
            if (iequals(n, "error"))    return LogLevel::ERROR;
            if (iequals(n, "critical")) return LogLevel::CRITICAL;
            return std::nullopt;
        }

        const char *logLevelName(LogLevel level) noexcept
        {
            switch (level)
            {
            case LogLevel::TRACE:    return "TRACE";
            case LogLevel::DEBUG:    return "DEBUG";
            case LogLevel::INFO:     return "INFO";
            case LogLevel::WARN:     return "WARN";
            case LogLevel::ERROR:    return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN";
            }
        }

        // ------------ Logger implementation ------------

        Logger::Logger()
            : m_level(LogLevel::INFO),
              m_file(),
              m_console(&std::cerr)
        {
        }

        Logger::~Logger()
        {
            if (m_file.is_open())
            {
                m_file.flush();
                m_file.close();
            }
        }

        void Logger::setLevel(LogLevel level) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_level = level;
        }

        LogLevel Logger::level() const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_level;
        }

        bool Logger::isEnabled(LogLevel level) const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return static_cast<int>(level) >= static_cast<int>(m_level);
        }

        bool Logger::setFile(const std::string &filePath)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_file.is_open())
            {
                m_file.close();
            }
            if (filePath.empty())
            {
                return true;
            }

            m_file.clear();
            m_file.open(filePath, std::ios::out | std::ios::app);
            return m_file.is_open();
        }

        void Logger::setConsole(std::ostream *console) noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_console = console;
        }

        void Logger::log(LogLevel level, std::string_view message)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (static_cast<int>(level) < static_cast<int>(m_level))
            {
                return;
            }

            // "[timestamp] [LEVEL] message"
            const std::string tsStr = formatTimestamp(now(), "%Y-%m-%d %H:%M:%S");
            const char *levelStr = logLevelName(level);

            std::string line;
            line.reserve(tsStr.size() + message.size() + 16);
            line.append("[");
            line.append(tsStr);
            line.append("] [");
            line.append(levelStr);
            line.append("] ");
            line.append(message);

            writeLineUnlocked(line);
        }

        void Logger::writeLineUnlocked(std::string_view line)
        {
            if (m_console)
            {
                (*m_console) << line << '\n';
                m_console->flush();
            }

            if (m_file.is_open())
            {
                m_file << line << '\n';
                m_file.flush();
            }
        }

        // ------------ Global logger accessor ------------

        Logger &getLogger()
        {
            // Lazy-initialized, process-wide logger: stderr only, INFO level.
            static Logger instance;
            return instance;
        }

    } // namespace Utils
} // namespace LogSeg
