#include "input/LineClassifier.hpp"
#include "utils/StringUtils.hpp"

#include <regex>

namespace LogSeg
{
    namespace Input
    {
        namespace
        {
            // "at" / "File" followed by at least one whitespace code point.
            bool startsWithWord(std::string_view trimmed, std::string_view word) noexcept
            {
                return Utils::startsWith(trimmed, word) &&
                       Utils::unicodeSpacePrefix(trimmed.substr(word.size())) > 0;
            }

            bool isPythonFrame(std::string_view trimmed) noexcept
            {
                if (!startsWithWord(trimmed, "File"))
                {
                    return false;
                }
                const std::string_view rest = Utils::ltrimUnicode(trimmed.substr(4));
                return !rest.empty() && rest.front() == '"';
            }

            bool isAsciiDigit(char c) noexcept
            {
                return c >= '0' && c <= '9';
            }
        } // anonymous namespace

        LineClassifier::Traits LineClassifier::classify(std::string_view line)
        {
            Traits t;
            t.timestamp    = detectTimestamp(line);
            t.severity     = detectSeverity(line);
            t.jsonStart    = isJsonStart(line);
            t.continuation = isContinuationLine(line);
            return t;
        }

        std::optional<std::string> LineClassifier::detectTimestamp(std::string_view line)
        {
            // Cheap reject: every match contains "-" and ":".
            if (line.size() < 19 ||
                line.find(':') == std::string_view::npos ||
                line.find('-') == std::string_view::npos)
            {
                return std::nullopt;
            }

            // Fixed-width part only. The fraction is scanned by hand below,
            // it may be arbitrarily long.
            static const std::regex tsRe(R"(\d{4}-\d{2}-\d{2}[T\s]\d{2}:\d{2}:\d{2})");

            std::cmatch m;
            if (!std::regex_search(line.data(), line.data() + line.size(), m, tsRe))
            {
                return std::nullopt;
            }

            const auto begin = static_cast<std::size_t>(m.position(0));
            std::size_t end  = begin + static_cast<std::size_t>(m.length(0));

            // Optional fraction: '.' followed by one or more digits.
            if (end + 1 < line.size() && line[end] == '.' && isAsciiDigit(line[end + 1]))
            {
                end += 2;
                while (end < line.size() && isAsciiDigit(line[end]))
                {
                    ++end;
                }
            }
            return std::string(line.substr(begin, end - begin));
        }

        std::optional<std::string> LineClassifier::detectSeverity(std::string_view line)
        {
            // WARN is tried before WARNING; \b makes "WARNING" fall through to it.
            static const std::regex sevRe(R"(\b(ERROR|WARN|WARNING|INFO|DEBUG|TRACE|FATAL)\b)",
                                          std::regex::ECMAScript | std::regex::icase);

            std::cmatch m;
            if (std::regex_search(line.data(), line.data() + line.size(), m, sevRe))
            {
                return Utils::toUpper(m.str(1));
            }
            return std::nullopt;
        }

        bool LineClassifier::isJsonStart(std::string_view line) noexcept
        {
            const std::string_view rest = Utils::ltrimUnicode(line);
            return !rest.empty() && rest.front() == '{';
        }

        bool LineClassifier::isContinuationLine(std::string_view line) noexcept
        {
            const std::string_view trimmed = Utils::trimUnicode(line);
            if (trimmed.empty())
            {
                return true;
            }
            if (Utils::unicodeSpacePrefix(line) > 0)
            {
                return true;
            }
            return startsWithWord(trimmed, "at") ||
                   Utils::startsWith(trimmed, "Caused by") ||
                   Utils::startsWith(trimmed, "Traceback") ||
                   isPythonFrame(trimmed);
        }

        bool LineClassifier::isEntryStart(std::string_view line)
        {
            return detectTimestamp(line).has_value() ||
                   detectSeverity(line).has_value() ||
                   isJsonStart(line);
        }

    } // namespace Input
} // namespace LogSeg
