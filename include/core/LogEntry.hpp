// Core data model for one logical log entry produced by the segmenter.
// Value type: cheap to move into std::vector, no references back into the
// byte source it was parsed from.

#ifndef LOGSEG_CORE_LOG_ENTRY_HPP
#define LOGSEG_CORE_LOG_ENTRY_HPP

#include <string>
#include <optional>
#include <cstdint>
#include <utility>

namespace LogSeg
{
namespace core
{

/**
 * @brief One logical log record, possibly spanning several physical lines.
 *
 * Invariants (maintained by Input::EntryGrouper):
 *  - lineStart() <= lineEnd(), both 1-based and inclusive.
 *  - text() holds exactly lineCount() lines joined by '\n'.
 *  - severity() and timestamp() come from the first physical line only.
 *
 * severity() is the matched token uppercased verbatim ("WARNING" stays
 * "WARNING"); alias folding is a presentation concern, see core/Severity.hpp.
 */
class LogEntry
{
public:
    using LineNumber = std::uint64_t;

    LogEntry() = default;

    LogEntry(LineNumber lineStart,
             LineNumber lineEnd,
             std::string text,
             std::optional<std::string> severity = std::nullopt,
             std::optional<std::string> timestamp = std::nullopt)
        : m_lineStart(lineStart),
          m_lineEnd(lineEnd),
          m_text(std::move(text)),
          m_severity(std::move(severity)),
          m_timestamp(std::move(timestamp))
    {
    }

    LogEntry(const LogEntry&)            = default;
    LogEntry(LogEntry&&) noexcept        = default;
    LogEntry& operator=(const LogEntry&) = default;
    LogEntry& operator=(LogEntry&&) noexcept = default;

    // ---------- Accessors ----------

    /// First physical line of the entry (1-based).
    LineNumber lineStart() const noexcept
    {
        return m_lineStart;
    }

    /// Last physical line of the entry (inclusive).
    LineNumber lineEnd() const noexcept
    {
        return m_lineEnd;
    }

    /// Number of physical lines in the entry.
    LineNumber lineCount() const noexcept
    {
        return m_lineEnd - m_lineStart + 1;
    }

    bool isMultiLine() const noexcept
    {
        return m_lineEnd != m_lineStart;
    }

    /// Constituent lines joined by '\n', terminators stripped.
    const std::string& text() const noexcept
    {
        return m_text;
    }

    /// Uppercased severity token from the first line, if any.
    const std::optional<std::string>& severity() const noexcept
    {
        return m_severity;
    }

    /// Date-time substring from the first line, if any.
    const std::optional<std::string>& timestamp() const noexcept
    {
        return m_timestamp;
    }

    friend bool operator==(const LogEntry& a, const LogEntry& b)
    {
        return a.m_lineStart == b.m_lineStart &&
               a.m_lineEnd == b.m_lineEnd &&
               a.m_text == b.m_text &&
               a.m_severity == b.m_severity &&
               a.m_timestamp == b.m_timestamp;
    }

    friend bool operator!=(const LogEntry& a, const LogEntry& b)
    {
        return !(a == b);
    }

private:
    LineNumber                 m_lineStart{1};
    LineNumber                 m_lineEnd{1};
    std::string                m_text;
    std::optional<std::string> m_severity;
    std::optional<std::string> m_timestamp;
};

} // namespace core
} // namespace LogSeg

#endif // LOGSEG_CORE_LOG_ENTRY_HPP
