#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <mutex>

namespace LogSeg
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a simple text configuration file (key = value format).
         *  - Expose read-only access to configuration values.
         *  - Provide typed getters with defaults (for robustness).
         *
         * Format:
         *  - Each line is: key = value
         *  - Lines starting with '#' or ';' are comments.
         *  - Empty lines are ignored.
         *  - Whitespace around key and value is trimmed.
         *  - The last occurrence of a repeated key wins.
         *
         * Example:
         *   chunk_size_bytes        = 256KiB
         *   progress_interval_bytes = 1MiB
         *   decode_errors           = strict
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            /**
             * Load configuration from a file path.
             *
             * Returns true on success, false if the file cannot be opened (the
             * previous values are kept). Malformed lines are skipped and
             * counted; see malformedLines().
             */
            bool loadFromFile(const std::string &filePath);

            /// Set a key explicitly (tests, command-line overrides).
            void set(std::string key, std::string value);

            /// Check if a key exists in the loaded configuration.
            bool hasKey(std::string_view key) const;

            /// Number of lines skipped by the last loadFromFile().
            std::size_t malformedLines() const noexcept;

            /// Get raw string value for a key; returns std::nullopt if missing.
            std::optional<std::string> getString(std::string_view key) const;

            /// Get string value or a default if the key is missing.
            std::string getStringOr(std::string_view key,
                                    std::string_view defaultValue) const;

            /// Get a signed integer; std::nullopt if missing or invalid.
            std::optional<std::int64_t> getInt(std::string_view key) const;

            /// Get a signed integer or a default if missing/invalid.
            std::int64_t getIntOr(std::string_view key, std::int64_t defaultValue) const;

            /**
             * Get a byte count such as "262144", "256KiB" or "30 MiB".
             * Returns std::nullopt if missing or invalid.
             */
            std::optional<std::uint64_t> getByteSize(std::string_view key) const;

            /// Get a byte count or a default if missing/invalid.
            std::uint64_t getByteSizeOr(std::string_view key, std::uint64_t defaultValue) const;

            /**
             * Get boolean value; returns std::nullopt if missing or invalid.
             *
             * Accepted true values (case-insensitive): "1", "true", "yes", "on"
             * Accepted false values (case-insensitive): "0", "false", "no", "off"
             */
            std::optional<bool> getBool(std::string_view key) const;

            /// Get boolean value or a default if missing/invalid.
            bool getBoolOr(std::string_view key, bool defaultValue) const;

        private:
            std::optional<std::string> getRawUnlocked(std::string_view key) const;

        private:
            std::unordered_map<std::string, std::string> m_values;
            std::size_t m_malformed = 0;

            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace LogSeg
