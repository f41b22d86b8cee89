#include "report/EntryFilter.hpp"
#include "utils/StringUtils.hpp"

#include <utility>

namespace LogSeg
{
namespace Report
{
    void EntryFilter::setSeverity(std::optional<core::SeverityClass> severity) noexcept
    {
        m_severity = severity;
    }

    void EntryFilter::setSearch(std::string query)
    {
        if (Utils::trim(query).empty())
            m_query.clear();
        else
            m_query = std::move(query);
    }

    void EntryFilter::setLimit(std::size_t limit) noexcept
    {
        m_limit = limit;
    }

    bool EntryFilter::matches(const core::LogEntry& entry) const
    {
        if (m_severity)
        {
            if (!entry.severity())
                return false;
            const auto cls = core::classifySeverity(*entry.severity());
            if (!cls || *cls != *m_severity)
                return false;
        }

        if (!m_query.empty() && !Utils::containsIgnoreCase(entry.text(), m_query))
            return false;

        return true;
    }

    std::vector<std::size_t> EntryFilter::apply(const std::vector<core::LogEntry>& entries) const
    {
        std::vector<std::size_t> indices;
        for (std::size_t i = 0; i < entries.size(); ++i)
        {
            if (m_limit > 0 && indices.size() >= m_limit)
                break;
            if (matches(entries[i]))
                indices.push_back(i);
        }
        return indices;
    }

    std::size_t EntryFilter::countMatches(const std::vector<core::LogEntry>& entries) const
    {
        std::size_t n = 0;
        for (const auto& e : entries)
        {
            if (matches(e))
                ++n;
        }
        return n;
    }

    std::optional<std::optional<core::SeverityClass>> parseSeverityFilter(std::string_view name)
    {
        const std::string_view n = Utils::trim(name);
        if (Utils::iequals(n, "all"))
            return std::optional<core::SeverityClass>{};

        if (const auto cls = core::classifySeverity(n))
            return std::optional<core::SeverityClass>{*cls};

        return std::nullopt;
    }

    SeverityCounts countSeverities(const std::vector<core::LogEntry>& entries)
    {
        SeverityCounts counts;
        for (const auto& e : entries)
        {
            const auto cls = e.severity() ? core::classifySeverity(*e.severity())
                                          : std::optional<core::SeverityClass>{};
            if (!cls)
            {
                ++counts.none;
                continue;
            }
            switch (*cls)
            {
            case core::SeverityClass::ERROR: ++counts.error; break;
            case core::SeverityClass::WARN:  ++counts.warn;  break;
            case core::SeverityClass::INFO:  ++counts.info;  break;
            case core::SeverityClass::DEBUG: ++counts.debug; break;
            case core::SeverityClass::TRACE: ++counts.trace; break;
            }
        }
        return counts;
    }

} // namespace Report
} // namespace LogSeg
