#include "input/ByteSource.hpp"
#include "input/ParseErrors.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

namespace LogSeg
{
    namespace Input
    {
        // -------- FileByteSource --------

        FileByteSource::FileByteSource(FileByteSource &&other) noexcept
            : m_stream(std::move(other.m_stream)),
              m_filePath(std::move(other.m_filePath)),
              m_size(other.m_size)
        {
            other.m_size = 0;
        }

        FileByteSource &FileByteSource::operator=(FileByteSource &&other) noexcept
        {
            if (this != &other)
            {
                if (m_stream.is_open())
                {
                    m_stream.close();
                }

                m_stream   = std::move(other.m_stream);
                m_filePath = std::move(other.m_filePath);
                m_size     = other.m_size;
                other.m_size = 0;
            }
            return *this;
        }

        FileByteSource::~FileByteSource()
        {
            if (m_stream.is_open())
            {
                m_stream.close();
            }
        }

        bool FileByteSource::open(const std::string &filePath)
        {
            close();

            std::error_code ec;
            const auto size = std::filesystem::file_size(filePath, ec);
            if (ec)
            {
                return false;
            }

            m_stream.open(filePath, std::ios::in | std::ios::binary);
            if (!m_stream.is_open())
            {
                return false;
            }

            m_filePath = filePath;
            m_size     = static_cast<std::uint64_t>(size);
            return true;
        }

        void FileByteSource::close() noexcept
        {
            if (m_stream.is_open())
            {
                m_stream.close();
            }
            m_stream.clear();
            m_filePath.clear();
            m_size = 0;
        }

        bool FileByteSource::isOpen() const noexcept
        {
            return m_stream.is_open();
        }

        const std::string &FileByteSource::filePath() const noexcept
        {
            return m_filePath;
        }

        std::uint64_t FileByteSource::totalSize() const
        {
            return m_size;
        }

        std::size_t FileByteSource::read(char *dst, std::size_t maxBytes)
        {
            if (!m_stream.is_open())
            {
                throw SourceReadError("file is not open");
            }
            if (maxBytes == 0)
            {
                return 0;
            }

            m_stream.read(dst, static_cast<std::streamsize>(maxBytes));
            const std::streamsize got = m_stream.gcount();

            // A short read sets failbit together with eofbit; only badbit, or
            // failbit without eof, is a real I/O failure.
            if (m_stream.bad() || (m_stream.fail() && !m_stream.eof()))
            {
                throw SourceReadError("failed to read " + m_filePath);
            }
            return static_cast<std::size_t>(got);
        }

        std::string FileByteSource::describe() const
        {
            return m_filePath.empty() ? std::string("<closed file>") : m_filePath;
        }

        // -------- MemoryByteSource --------

        MemoryByteSource::MemoryByteSource(std::string bytes, std::size_t maxReadSize)
            : m_bytes(std::move(bytes)),
              m_maxReadSize(maxReadSize)
        {
        }

        std::uint64_t MemoryByteSource::totalSize() const
        {
            return static_cast<std::uint64_t>(m_bytes.size());
        }

        std::size_t MemoryByteSource::read(char *dst, std::size_t maxBytes)
        {
            std::size_t n = std::min(maxBytes, m_bytes.size() - m_position);
            if (m_maxReadSize > 0)
            {
                n = std::min(n, m_maxReadSize);
            }
            if (n > 0)
            {
                std::memcpy(dst, m_bytes.data() + m_position, n);
                m_position += n;
            }
            return n;
        }

        std::string MemoryByteSource::describe() const
        {
            return "<memory>";
        }

    } // namespace Input
} // namespace LogSeg
