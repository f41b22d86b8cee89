#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/LogEntry.hpp"

namespace LogSeg
{
    namespace Input
    {
        /**
         * EntryGrouper
         *
         * The entry grouping state machine. Physical lines go in, one at a
         * time and in order; logical entries come out.
         *
         * States:
         *  - no current entry: the next line always opens an entry.
         *  - in entry: a line that starts a new record and is not a
         *    continuation closes the current entry and opens the next one;
         *    anything else is appended to the current entry.
         *
         * Every line lands in exactly one entry, so the produced line ranges
         * tile [1, lineCount()] without gaps or overlaps.
         */
        class EntryGrouper
        {
        public:
            EntryGrouper() = default;

            EntryGrouper(const EntryGrouper &)            = delete;
            EntryGrouper &operator=(const EntryGrouper &) = delete;

            /// Feed the next physical line (terminator already stripped).
            void addLine(std::string_view line);

            /// End of stream: finalize the open entry, if any.
            void finish();

            /// Physical lines seen so far.
            std::uint64_t lineCount() const noexcept { return m_lineNumber; }

            /// Finalized entries so far (the open entry is not counted).
            std::uint64_t entryCount() const noexcept { return m_entries.size(); }

            bool hasOpenEntry() const noexcept { return m_open.has_value(); }

            const std::vector<core::LogEntry> &entries() const noexcept { return m_entries; }

            /// Move the finalized entries out, leaving the grouper empty of them.
            std::vector<core::LogEntry> takeEntries();

        private:
            struct OpenEntry
            {
                core::LogEntry::LineNumber startLine = 0;
                core::LogEntry::LineNumber lineCount = 0;
                std::string                text;
                std::optional<std::string> severity;
                std::optional<std::string> timestamp;
            };

            void open(std::string_view line,
                      std::optional<std::string> severity,
                      std::optional<std::string> timestamp);
            void finalize();

        private:
            std::uint64_t               m_lineNumber = 0;
            std::optional<OpenEntry>    m_open;
            std::vector<core::LogEntry> m_entries;
        };

    } // namespace Input
} // namespace LogSeg
