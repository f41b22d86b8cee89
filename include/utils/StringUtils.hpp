#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>
#include <iterator>
#include <cctype>
#include <cstdint>

namespace LogSeg
{
    namespace Utils
    {
        /**
         * String helpers shared by the classifier, the configuration layer
         * and the reporters.
         *
         * All functions are:
         *  - Stateless and thread-safe.
         *  - Using std::string_view where possible to avoid copies of
         *    (potentially long) multi-line entry text.
         *  - ASCII-only for case folding and whitespace.
         */

        /// True for the ASCII whitespace set (space, \t, \n, \v, \f, \r).
        inline bool isSpace(char ch) noexcept
        {
            return std::isspace(static_cast<unsigned char>(ch)) != 0;
        }

        /// Trim whitespace from the left side of the string view.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(sv.begin(), sv.end(), isSpace);
            return sv.substr(static_cast<std::size_t>(it - sv.begin()));
        }

        /// Trim whitespace from the right side of the string view.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(sv.rbegin(), sv.rend(), isSpace);
            return sv.substr(0, static_cast<std::size_t>(sv.rend() - it));
        }

        /// Trim whitespace from both ends of the string view.
        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        /// Convert a string to lowercase (returns a new std::string).
        inline std::string toLower(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); }
            );
            return result;
        }

        /// Convert a string to uppercase (returns a new std::string).
        inline std::string toUpper(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); }
            );
            return result;
        }

        /// Check if a string_view starts with a given prefix (case-sensitive).
        inline bool startsWith(std::string_view sv, std::string_view prefix) noexcept
        {
            return sv.size() >= prefix.size()
                   && sv.compare(0, prefix.size(), prefix) == 0;
        }

        /// Case-insensitive equality comparison without allocations.
        inline bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i)
            {
                unsigned char ca = static_cast<unsigned char>(a[i]);
                unsigned char cb = static_cast<unsigned char>(b[i]);
                if (std::tolower(ca) != std::tolower(cb))
                {
                    return false;
                }
            }
            return true;
        }

        /**
         * Byte length of the whitespace code point at the start of `sv`, or 0.
         *
         * Recognizes the full Unicode White_Space set used by line
         * classification: ASCII whitespace, U+00A0, U+1680, U+2000..U+200A,
         * U+2028, U+2029, U+202F, U+205F, U+3000 and U+FEFF, each UTF-8
         * encoded.
         */
        std::size_t unicodeSpacePrefix(std::string_view sv) noexcept;

        /// Byte length of the whitespace code point at the end of `sv`, or 0.
        std::size_t unicodeSpaceSuffix(std::string_view sv) noexcept;

        /// Trim Unicode whitespace (see unicodeSpacePrefix) from the left.
        std::string_view ltrimUnicode(std::string_view sv) noexcept;

        /// Trim Unicode whitespace from both ends.
        std::string_view trimUnicode(std::string_view sv) noexcept;

        /**
         * Case-insensitive substring search.
         *
         * An empty needle matches everything. Bytes outside ASCII compare
         * exactly, so UTF-8 text is searched byte-wise.
         */
        bool containsIgnoreCase(std::string_view haystack, std::string_view needle) noexcept;

        /**
         * Split a string_view by a single-character delimiter.
         *
         * Empty fields are preserved, so splitting "a\n\nb" on '\n' yields
         * three fields. This mirrors how entry text is rebuilt from lines.
         */
        std::vector<std::string_view> split(std::string_view sv, char delimiter);

        /**
         * Parse a non-negative integer with an optional binary size suffix.
         *
         * Accepted suffixes (case-insensitive): K, KB, KiB, M, MB, MiB, G,
         * GB, GiB. All of them are powers of 1024. Whitespace between the
         * number and the suffix is allowed.
         */
        std::optional<std::uint64_t> parseByteSize(std::string_view sv);

        /// Escape a string for inclusion in a JSON string literal (RFC 8259).
        std::string escapeJson(std::string_view s);

    } // namespace Utils
} // namespace LogSeg
