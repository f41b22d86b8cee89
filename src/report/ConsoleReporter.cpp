#include "report/ConsoleReporter.hpp"
#include "core/Severity.hpp"
#include "utils/StringUtils.hpp"

#include <cstdio>
#include <iomanip>
#include <string>

#if defined(_WIN32)
  #include <io.h>      // _isatty, _fileno
#else
  #include <unistd.h>  // isatty, fileno
#endif

namespace LogSeg
{
namespace Report
{
    namespace
    {
        constexpr int kLineColumnWidth     = 13;
        constexpr int kSeverityColumnWidth = 8;

        bool stdoutIsTty() noexcept
        {
        #if defined(_WIN32)
            return _isatty(_fileno(stdout)) != 0;
        #else
            return ::isatty(::fileno(stdout)) != 0;
        #endif
        }

        // "42" for single-line entries, "42-57" for multi-line ones.
        std::string lineLabel(const core::LogEntry& entry)
        {
            std::string label = std::to_string(entry.lineStart());
            if (entry.isMultiLine())
            {
                label += '-';
                label += std::to_string(entry.lineEnd());
            }
            return label;
        }
    } // namespace

    ConsoleReporter::ConsoleReporter()
        : m_colorsEnabled(stdoutIsTty()),
          m_output(&std::cout)
    {
    }

    ConsoleReporter::ConsoleReporter(std::ostream& output)
        : m_colorsEnabled(false),
          m_output(&output)
    {
    }

    void ConsoleReporter::printEntries(const std::vector<core::LogEntry>& entries,
                                       const std::vector<std::size_t>& indices,
                                       std::size_t totalMatches)
    {
        for (const std::size_t i : indices)
        {
            if (i < entries.size())
                printEntry(entries[i]);
        }

        if (indices.size() < totalMatches)
        {
            *m_output << "... showing " << indices.size() << " of " << totalMatches
                      << " matching entries\n";
        }
        flush();
    }

    void ConsoleReporter::printEntry(const core::LogEntry& entry)
    {
        const char* color = m_colorsEnabled ? severityColor(entry) : "";
        const char* reset = m_colorsEnabled ? "\033[0m" : "";

        *m_output << std::right << std::setw(kLineColumnWidth) << lineLabel(entry) << "  ";

        const std::string sev = entry.severity().value_or("");
        *m_output << color << std::left << std::setw(kSeverityColumnWidth) << sev << reset;

        const auto lines = Utils::split(entry.text(), '\n');
        const std::string indent(static_cast<std::size_t>(kLineColumnWidth + 2 + kSeverityColumnWidth), ' ');
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            if (i > 0)
                *m_output << indent;
            *m_output << lines[i] << "\n";
        }
    }

    void ConsoleReporter::printSummary(const core::ParsingStats& stats, const SeverityCounts& counts)
    {
        *m_output << "\n=== PARSE SUMMARY ===\n";
        *m_output << "Bytes:          " << stats.bytesProcessed << " / " << stats.totalBytes << "\n";
        *m_output << "Lines:          " << stats.lines << "\n";
        *m_output << "Entries:        " << stats.entries << "\n";
        *m_output << "Duration:       " << std::fixed << std::setprecision(1) << stats.durationMs << " ms\n";
        *m_output << "Errors:         " << counts.error << "\n";
        *m_output << "Warnings:       " << counts.warn << "\n";
        *m_output << "Info:           " << counts.info << "\n";
        *m_output << "Debug:          " << counts.debug << "\n";
        *m_output << "Trace:          " << counts.trace << "\n";
        *m_output << "No severity:    " << counts.none << "\n";
        flush();
    }

    void ConsoleReporter::flush()
    {
        m_output->flush();
    }

    void ConsoleReporter::setEnableColors(bool enable) noexcept
    {
        m_colorsEnabled = enable;
    }

    const char* ConsoleReporter::severityColor(const core::LogEntry& entry) noexcept
    {
        if (!entry.severity())
            return "";

        const auto cls = core::classifySeverity(*entry.severity());
        if (!cls)
            return "";

        switch (*cls)
        {
        case core::SeverityClass::ERROR: return "\033[91m"; // bright red
        case core::SeverityClass::WARN:  return "\033[93m"; // yellow
        case core::SeverityClass::INFO:  return "\033[94m"; // blue
        case core::SeverityClass::DEBUG: return "\033[37m"; // grey
        case core::SeverityClass::TRACE: return "\033[90m"; // dark grey
        }
        return "";
    }

} // namespace Report
} // namespace LogSeg
