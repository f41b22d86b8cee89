#include "report/JsonReporter.hpp"

#include <iomanip>
#include <numeric>
#include <sstream>

#include "utils/StringUtils.hpp"

namespace LogSeg
{
namespace Report
{
    JsonReporter::JsonReporter(PrettyPrint pretty)
        : m_prettyPrint(pretty)
    {
    }

    std::string JsonReporter::entryToJson(const core::LogEntry& e) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"lineStart\":" << e.lineStart() << ",";
        oss << "\"lineEnd\":" << e.lineEnd() << ",";
        oss << "\"text\":\"" << Utils::escapeJson(e.text()) << "\"";
        if (e.severity())
            oss << ",\"severity\":\"" << Utils::escapeJson(*e.severity()) << "\"";
        if (e.timestamp())
            oss << ",\"timestamp\":\"" << Utils::escapeJson(*e.timestamp()) << "\"";
        oss << "}";
        return oss.str();
    }

    std::string JsonReporter::statsToJson(const core::ParsingStats& stats) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"bytesProcessed\":" << stats.bytesProcessed << ",";
        oss << "\"totalBytes\":" << stats.totalBytes << ",";
        oss << "\"lines\":" << stats.lines << ",";
        oss << "\"entries\":" << stats.entries << ",";
        oss << "\"durationMs\":" << std::fixed << std::setprecision(3) << stats.durationMs;
        oss << "}";
        return oss.str();
    }

    void JsonReporter::write(std::ostream& output,
                             const std::vector<core::LogEntry>& entries,
                             const core::ParsingStats& stats) const
    {
        std::vector<std::size_t> all(entries.size());
        std::iota(all.begin(), all.end(), std::size_t{0});
        write(output, entries, all, stats);
    }

    void JsonReporter::write(std::ostream& output,
                             const std::vector<core::LogEntry>& entries,
                             const std::vector<std::size_t>& indices,
                             const core::ParsingStats& stats) const
    {
        const bool pretty = m_prettyPrint == PrettyPrint::PRETTY;
        const char* nl    = pretty ? "\n" : "";
        const char* ind1  = pretty ? "  " : "";
        const char* ind2  = pretty ? "    " : "";
        const char* colon = pretty ? ": " : ":";

        output << "{" << nl;
        output << ind1 << "\"entries\"" << colon << "[" << nl;

        bool first = true;
        for (const std::size_t i : indices)
        {
            if (i >= entries.size())
                continue;
            if (!first)
                output << "," << nl;
            output << ind2 << entryToJson(entries[i]);
            first = false;
        }
        if (!first)
            output << nl;

        output << ind1 << "]," << nl;
        output << ind1 << "\"stats\"" << colon << statsToJson(stats) << nl;
        output << "}" << nl;
    }

} // namespace Report
} // namespace LogSeg
