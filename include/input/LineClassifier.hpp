#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace LogSeg
{
    namespace Input
    {
        /**
         * LineClassifier
         *
         * Responsibilities:
         *  - Extract the timestamp and severity token of a physical line.
         *  - Decide whether a line looks like the start of a new record.
         *  - Decide whether a line looks like part of a preceding multi-line
         *    block (stack frame, wrapped exception, indented or blank line).
         *
         * Design notes:
         *  - Stateless; all members are static and thread-safe (the regexes
         *    are function-local statics, initialized once).
         *  - The two line tests are independent. EntryGrouper gives the
         *    continuation test precedence.
         */
        class LineClassifier
        {
        public:
            /// Everything the grouping state machine needs to know about a line.
            struct Traits
            {
                std::optional<std::string> timestamp;
                std::optional<std::string> severity;
                bool jsonStart    = false;
                bool continuation = false;

                /// Timestamp, severity token or JSON opener present.
                bool isEntryStart() const noexcept
                {
                    return timestamp.has_value() || severity.has_value() || jsonStart;
                }

                /// Entry-start signal not overridden by a continuation signal.
                bool startsNewEntry() const noexcept
                {
                    return isEntryStart() && !continuation;
                }
            };

            /// Classify a physical line (without its terminator).
            static Traits classify(std::string_view line);

            /**
             * First "YYYY-MM-DD[T or whitespace]HH:MM:SS[.fraction]" substring.
             * Timezone designators after the match are not included.
             */
            static std::optional<std::string> detectTimestamp(std::string_view line);

            /**
             * First whole-word, case-insensitive ERROR / WARN / WARNING / INFO /
             * DEBUG / TRACE / FATAL token, returned uppercased.
             */
            static std::optional<std::string> detectSeverity(std::string_view line);

            /// Line begins, after leading whitespace, with '{'.
            static bool isJsonStart(std::string_view line) noexcept;

            /**
             * Blank, indented, or starting with "at ", "Caused by",
             * "Traceback" or File "..." after trimming.
             */
            static bool isContinuationLine(std::string_view line) noexcept;

            static bool isEntryStart(std::string_view line);
        };

    } // namespace Input
} // namespace LogSeg
