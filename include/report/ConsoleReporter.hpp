#pragma once

#include <cstddef>
#include <iostream>
#include <vector>

#include "core/LogEntry.hpp"
#include "core/ParsingStats.hpp"
#include "report/EntryFilter.hpp"

namespace LogSeg
{
    namespace Report
    {
        /**
         * ConsoleReporter
         *
         * Responsibilities:
         *  - Print a list of entries as a log viewer would: line range column,
         *    severity column, then the entry text with continuation lines
         *    aligned under the first line.
         *  - Color the severity column (ERROR/FATAL red, WARN/WARNING yellow,
         *    INFO blue, DEBUG/TRACE grey) when writing to a terminal.
         *  - Print a parse summary (statistics and per-severity counts).
         */
        class ConsoleReporter
        {
        public:
            /// Writes to std::cout; colors auto-detected from the terminal.
            ConsoleReporter();

            /// Writes to a caller-provided stream; colors off by default.
            explicit ConsoleReporter(std::ostream& output);

            ConsoleReporter(const ConsoleReporter&) = default;
            ConsoleReporter& operator=(const ConsoleReporter&) = default;

            /**
             * Print the entries selected by `indices` (positions in `entries`),
             * followed by a "showing N of M" footer when not everything fit.
             */
            void printEntries(const std::vector<core::LogEntry>& entries,
                              const std::vector<std::size_t>& indices,
                              std::size_t totalMatches);

            /// Print one entry row.
            void printEntry(const core::LogEntry& entry);

            /// Print the statistics block for a finished parse.
            void printSummary(const core::ParsingStats& stats, const SeverityCounts& counts);

            void flush();

            void setEnableColors(bool enable) noexcept;
            bool colorsEnabled() const noexcept { return m_colorsEnabled; }

        private:
            static const char* severityColor(const core::LogEntry& entry) noexcept;

        private:
            bool          m_colorsEnabled;
            std::ostream* m_output;
        };

    } // namespace Report
} // namespace LogSeg
