#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>

namespace LogSeg
{
    namespace Utils
    {
        /**
         * Time utilities for log line prefixes and parse timing.
         *
         * Notes:
         *  - system_clock is used for wall-clock stamps written by the Logger.
         *  - steady_clock is used for durations (ParsingStats::durationMs),
         *    so clock adjustments never produce negative timings.
         */

        using Clock     = std::chrono::system_clock;
        using TimePoint = std::chrono::time_point<Clock>;

        /// Get current system time as TimePoint.
        TimePoint now() noexcept;

        /**
         * Format a TimePoint into a human-readable local timestamp string.
         *
         * Default format: "YYYY-MM-DD HH:MM:SS"
         */
        std::string formatTimestamp(TimePoint tp,
                                    std::string_view format = "%Y-%m-%d %H:%M:%S");

        /**
         * Stopwatch
         *
         * Measures elapsed wall-clock time on the monotonic clock, starting at
         * construction (or the last restart()). Used to fill durationMs.
         */
        class Stopwatch
        {
        public:
            using SteadyClock = std::chrono::steady_clock;

            Stopwatch() noexcept;

            /// Milliseconds elapsed since start, with sub-millisecond precision.
            double elapsedMillis() const noexcept;

        private:
            SteadyClock::time_point m_start;
        };

    } // namespace Utils
} // namespace LogSeg
