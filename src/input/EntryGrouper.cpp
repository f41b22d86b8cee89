#include "input/EntryGrouper.hpp"
#include "input/LineClassifier.hpp"

#include <utility>

namespace LogSeg
{
    namespace Input
    {
        void EntryGrouper::addLine(std::string_view line)
        {
            ++m_lineNumber;
            LineClassifier::Traits traits = LineClassifier::classify(line);

            if (!m_open)
            {
                open(line, std::move(traits.severity), std::move(traits.timestamp));
                return;
            }

            if (traits.startsNewEntry())
            {
                finalize();
                open(line, std::move(traits.severity), std::move(traits.timestamp));
                return;
            }

            m_open->text.push_back('\n');
            m_open->text.append(line.data(), line.size());
            ++m_open->lineCount;
        }

        void EntryGrouper::finish()
        {
            finalize();
        }

        std::vector<core::LogEntry> EntryGrouper::takeEntries()
        {
            std::vector<core::LogEntry> out;
            out.swap(m_entries);
            return out;
        }

        void EntryGrouper::open(std::string_view line,
                                std::optional<std::string> severity,
                                std::optional<std::string> timestamp)
        {
            // Severity and timestamp are fixed by the first line.
            OpenEntry e;
            e.startLine = m_lineNumber;
            e.lineCount = 1;
            e.text.assign(line.data(), line.size());
            e.severity  = std::move(severity);
            e.timestamp = std::move(timestamp);
            m_open = std::move(e);
        }

        void EntryGrouper::finalize()
        {
            if (!m_open)
            {
                return;
            }

            const auto lineEnd = m_open->startLine + m_open->lineCount - 1;
            m_entries.emplace_back(m_open->startLine,
                                   lineEnd,
                                   std::move(m_open->text),
                                   std::move(m_open->severity),
                                   std::move(m_open->timestamp));
            m_open.reset();
        }

    } // namespace Input
} // namespace LogSeg
