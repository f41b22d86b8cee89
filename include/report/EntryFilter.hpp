#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/LogEntry.hpp"
#include "core/Severity.hpp"

namespace LogSeg
{
    namespace Report
    {
        /**
         * EntryFilter
         *
         * Consumer-side selection over a finished entry list:
         *  - Severity filter on the presentation class, so WARN also selects
         *    WARNING entries and ERROR also selects FATAL entries.
         *  - Case-insensitive substring search over the full entry text.
         *  - Display limit applied after filtering.
         *
         * The filter never modifies entries; it yields indices into the
         * original list so callers can keep referring to entries by position.
         */
        class EntryFilter
        {
        public:
            EntryFilter() = default;

            /// nullopt means "all severities" (entries without a severity included).
            void setSeverity(std::optional<core::SeverityClass> severity) noexcept;

            /// Empty or whitespace-only queries disable the search.
            void setSearch(std::string query);

            /// Maximum number of indices returned by apply(); 0 = unlimited.
            void setLimit(std::size_t limit) noexcept;

            bool matches(const core::LogEntry &entry) const;

            /// Indices of the matching entries, in order, at most limit() of them.
            std::vector<std::size_t> apply(const std::vector<core::LogEntry> &entries) const;

            /// Number of matching entries, ignoring the limit.
            std::size_t countMatches(const std::vector<core::LogEntry> &entries) const;

            std::size_t limit() const noexcept { return m_limit; }

        private:
            std::optional<core::SeverityClass> m_severity;
            std::string                        m_query;
            std::size_t                        m_limit = 0;
        };

        /**
         * Parse a CLI severity filter: "ALL" or any token classifySeverity()
         * accepts ("error", "WARNING", "fatal", ...).
         *
         * Returns nullopt for unknown names; an engaged optional holding
         * nullopt means "all".
         */
        std::optional<std::optional<core::SeverityClass>> parseSeverityFilter(std::string_view name);

        /// Entries per presentation class, plus entries without severity.
        struct SeverityCounts
        {
            std::size_t error = 0;
            std::size_t warn  = 0;
            std::size_t info  = 0;
            std::size_t debug = 0;
            std::size_t trace = 0;
            std::size_t none  = 0;
        };

        SeverityCounts countSeverities(const std::vector<core::LogEntry> &entries);

    } // namespace Report
} // namespace LogSeg
