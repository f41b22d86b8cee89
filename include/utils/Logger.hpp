#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>

namespace LogSeg
{
    namespace Utils
    {
        /**
         * Diagnostic log levels for the tool's own output.
         *
         * Not to be confused with the severity tokens the segmenter extracts
         * from the logs it parses (those are plain strings on core::LogEntry).
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /// Parse "debug", "INFO", "warning", ... into a LogLevel.
        std::optional<LogLevel> parseLogLevel(std::string_view name);

        /// Upper-case name of a level, e.g. "INFO".
        const char *logLevelName(LogLevel level) noexcept;

        /**
         * Logger
         *
         * Thread-safe, minimal logging facility. The parser may run on a
         * ParseWorker thread while the CLI logs from the main thread, so every
         * write is serialized by one mutex.
         *
         * Output format: "[YYYY-MM-DD HH:MM:SS] [LEVEL] message", written to
         * the console stream (stderr by default) and, when configured, to an
         * append-mode log file.
         */
        class Logger
        {
        public:
            /// Create a logger that writes to stderr only, at INFO.
            Logger();

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            /// Set the minimum severity that will be logged.
            void setLevel(LogLevel level) noexcept;

            /// Get the currently configured minimum severity.
            LogLevel level() const noexcept;

            /// Check quickly whether this level would be logged.
            bool isEnabled(LogLevel level) const noexcept;

            /**
             * Attach (or replace) the file sink.
             *
             * Returns false if the file cannot be opened; console logging
             * continues either way. An empty path detaches the file sink.
             */
            bool setFile(const std::string &filePath);

            /// Redirect console output (nullptr disables it). Used by tests.
            void setConsole(std::ostream *console) noexcept;

            /// Log a message with a given severity.
            void log(LogLevel level, std::string_view message);

            void trace(std::string_view message)   { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)   { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)    { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)    { log(LogLevel::WARN,  message); }
            void error(std::string_view message)   { log(LogLevel::ERROR, message); }
            void critical(std::string_view message){ log(LogLevel::CRITICAL, message); }

        private:
            /// Write a fully formatted line to the active sinks (lock held).
            void writeLineUnlocked(std::string_view line);

        private:
            LogLevel                        m_level;
            std::ofstream                   m_file;       // RAII-managed file handle
            std::ostream                   *m_console;    // usually &std::cerr
            mutable std::mutex              m_mutex;      // protects all state
        };

        /**
         * Process-wide logger.
         *
         * Example usage:
         *   Utils::getLogger().info("Parsing app.log");
         */
        Logger &getLogger();

    } // namespace Utils
} // namespace LogSeg
