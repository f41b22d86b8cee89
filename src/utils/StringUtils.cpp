// File: src/utils/StringUtils.cpp

#include "utils/StringUtils.hpp"

#include <cstdint>
#include <cstdio>
#include <limits>

namespace {
    char foldAscii(char c) noexcept {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    // Non-ASCII whitespace code points, UTF-8 encoded.
    constexpr std::string_view kUnicodeSpaces[] = {
        "\xC2\xA0",                                      // U+00A0 no-break space
        "\xE1\x9A\x80",                                  // U+1680 ogham space mark
        "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", // U+2000..U+200A
        "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85",
        "\xE2\x80\x86", "\xE2\x80\x87", "\xE2\x80\x88",
        "\xE2\x80\x89", "\xE2\x80\x8A",
        "\xE2\x80\xA8", "\xE2\x80\xA9",                 // line / paragraph separator
        "\xE2\x80\xAF",                                  // U+202F narrow no-break space
        "\xE2\x81\x9F",                                  // U+205F medium mathematical space
        "\xE3\x80\x80",                                  // U+3000 ideographic space
        "\xEF\xBB\xBF",                                  // U+FEFF zero width no-break space
    };
}

namespace LogSeg::Utils {

std::size_t unicodeSpacePrefix(std::string_view sv) noexcept
{
    if (sv.empty()) return 0;
    if (isSpace(sv.front())) return 1;
    if (static_cast<unsigned char>(sv.front()) < 0x80) return 0;

    for (const std::string_view ws : kUnicodeSpaces)
    {
        if (startsWith(sv, ws)) return ws.size();
    }
    return 0;
}

std::size_t unicodeSpaceSuffix(std::string_view sv) noexcept
{
    if (sv.empty()) return 0;
    if (isSpace(sv.back())) return 1;
    if (static_cast<unsigned char>(sv.back()) < 0x80) return 0;

    for (const std::string_view ws : kUnicodeSpaces)
    {
        if (sv.size() >= ws.size() && sv.compare(sv.size() - ws.size(), ws.size(), ws) == 0)
            return ws.size();
    }
    return 0;
}

std::string_view ltrimUnicode(std::string_view sv) noexcept
{
    while (const std::size_t n = unicodeSpacePrefix(sv))
        sv.remove_prefix(n);
    return sv;
}

std::string_view trimUnicode(std::string_view sv) noexcept
{
    sv = ltrimUnicode(sv);
    while (const std::size_t n = unicodeSpaceSuffix(sv))
        sv.remove_suffix(n);
    return sv;
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) noexcept
{
    if (needle.empty()) return true;
    if (needle.size() > haystack.size()) return false;

    const auto it = std::search(haystack.begin(), haystack.end(),
                                needle.begin(), needle.end(),
                                [](char a, char b) { return foldAscii(a) == foldAscii(b); });
    return it != haystack.end();
}

std::vector<std::string_view> split(std::string_view sv, char delimiter)
{
    std::vector<std::string_view> tokens;
    std::size_t start = 0;

    while (true)
    {
        const std::size_t pos = sv.find(delimiter, start);
        if (pos == std::string_view::npos)
        {
            tokens.push_back(sv.substr(start));
            break;
        }
        tokens.push_back(sv.substr(start, pos - start));
        start = pos + 1;
    }

    return tokens;
}

std::optional<std::uint64_t> parseByteSize(std::string_view sv)
{
    sv = trim(sv);
    if (sv.empty()) return std::nullopt;

    std::size_t i = 0;
    std::uint64_t value = 0;
    while (i < sv.size() && sv[i] >= '0' && sv[i] <= '9')
    {
        const std::uint64_t digit = static_cast<std::uint64_t>(sv[i] - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
            return std::nullopt;
        value = value * 10 + digit;
        ++i;
    }
    if (i == 0) return std::nullopt;

    const std::string_view suffix = trim(sv.substr(i));
    std::uint64_t multiplier = 1;
    if (suffix.empty())
        multiplier = 1;
    else if (iequals(suffix, "k") || iequals(suffix, "kb") || iequals(suffix, "kib"))
        multiplier = 1024ULL;
    else if (iequals(suffix, "m") || iequals(suffix, "mb") || iequals(suffix, "mib"))
        multiplier = 1024ULL * 1024ULL;
    else if (iequals(suffix, "g") || iequals(suffix, "gb") || iequals(suffix, "gib"))
        multiplier = 1024ULL * 1024ULL * 1024ULL;
    else
        return std::nullopt;

    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier)
        return std::nullopt;
    return value * multiplier;
}

std::string escapeJson(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

} // namespace LogSeg::Utils
