#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "core/LogEntry.hpp"
#include "core/ParsingStats.hpp"

namespace LogSeg
{
    namespace Report
    {
        /**
         * JsonReporter
         *
         * Responsibilities:
         *  - Serialize a finished parse as {"entries": [...], "stats": {...}}
         *    for machine consumption.
         *  - Entry objects carry lineStart, lineEnd and text; severity and
         *    timestamp are omitted when absent.
         *
         * Design notes:
         *  - Hand-written JSON generation (no external dependencies).
         *  - Compact and pretty-print modes.
         *  - RFC 8259 string escaping via Utils::escapeJson.
         */
        class JsonReporter
        {
        public:
            enum class PrettyPrint
            {
                COMPACT,  // Single line, minimal whitespace
                PRETTY    // Indented, human-readable JSON
            };

            explicit JsonReporter(PrettyPrint pretty = PrettyPrint::COMPACT);

            JsonReporter(const JsonReporter&) = default;
            JsonReporter& operator=(const JsonReporter&) = default;

            /**
             * Write the entries selected by `indices` (positions in `entries`)
             * and the statistics.
             */
            void write(std::ostream& output,
                       const std::vector<core::LogEntry>& entries,
                       const std::vector<std::size_t>& indices,
                       const core::ParsingStats& stats) const;

            /// Write every entry and the statistics.
            void write(std::ostream& output,
                       const std::vector<core::LogEntry>& entries,
                       const core::ParsingStats& stats) const;

            std::string entryToJson(const core::LogEntry& entry) const;
            std::string statsToJson(const core::ParsingStats& stats) const;

        private:
            PrettyPrint m_prettyPrint;
        };

    } // namespace Report
} // namespace LogSeg
