#include "utils/ConfigLoader.hpp"
#include "utils/StringUtils.hpp"

#include <fstream>
#include <stdexcept>

namespace LogSeg
{
    namespace Utils
    {
        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
            {
                return false;
            }

            std::unordered_map<std::string, std::string> newValues;
            std::size_t malformed = 0;

            std::string line;
            while (std::getline(in, line))
            {
                const std::string_view content = trim(line);
                if (content.empty() || content.front() == '#' || content.front() == ';')
                {
                    continue;
                }

                const auto pos = content.find('=');
                if (pos == std::string_view::npos)
                {
                    ++malformed;
                    continue;
                }

                const std::string_view key   = trim(content.substr(0, pos));
                const std::string_view value = trim(content.substr(pos + 1));
                if (key.empty())
                {
                    ++malformed;
                    continue;
                }

                newValues[std::string(key)] = std::string(value);
            }

            // Commit under the mutex so readers never see a half-loaded file.
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values    = std::move(newValues);
            m_malformed = malformed;
            return true;
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[std::move(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.find(std::string(key)) != m_values.end();
        }

        std::size_t ConfigLoader::malformedLines() const noexcept
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_malformed;
        }

        std::optional<std::string> ConfigLoader::getRawUnlocked(std::string_view key) const
        {
            auto it = m_values.find(std::string(key));
            if (it == m_values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return getRawUnlocked(key);
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view defaultValue) const
        {
            auto v = getString(key);
            return v ? *v : std::string(defaultValue);
        }

        std::optional<std::int64_t> ConfigLoader::getInt(std::string_view key) const
        {
            auto v = getString(key);
            if (!v || v->empty())
            {
                return std::nullopt;
            }

            try
            {
                std::size_t idx = 0;
                const long long value = std::stoll(*v, &idx);
                if (idx != v->size())
                {
                    return std::nullopt;
                }
                return static_cast<std::int64_t>(value);
            }
            catch (const std::invalid_argument &)
            {
                return std::nullopt;
            }
            catch (const std::out_of_range &)
            {
                return std::nullopt;
            }
        }

        std::int64_t ConfigLoader::getIntOr(std::string_view key, std::int64_t defaultValue) const
        {
            auto v = getInt(key);
            return v ? *v : defaultValue;
        }

        std::optional<std::uint64_t> ConfigLoader::getByteSize(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }
            return parseByteSize(*v);
        }

        std::uint64_t ConfigLoader::getByteSizeOr(std::string_view key, std::uint64_t defaultValue) const
        {
            auto v = getByteSize(key);
            return v ? *v : defaultValue;
        }

        std::optional<bool> ConfigLoader::getBool(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }

            const std::string_view s = trim(*v);
            if (iequals(s, "1") || iequals(s, "true") ||
                iequals(s, "yes") || iequals(s, "on"))
            {
                return true;
            }
            if (iequals(s, "0") || iequals(s, "false") ||
                iequals(s, "no") || iequals(s, "off"))
            {
                return false;
            }

            return std::nullopt;
        }

        bool ConfigLoader::getBoolOr(std::string_view key, bool defaultValue) const
        {
            auto v = getBool(key);
            return v ? *v : defaultValue;
        }

    } // namespace Utils
} // namespace LogSeg
