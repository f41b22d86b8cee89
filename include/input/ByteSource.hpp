#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace LogSeg
{
    namespace Input
    {
        /**
         * ByteSource
         *
         * A sequentially readable byte stream whose total size is known up
         * front. The parser only ever reads forward; no implementation needs
         * to support seeking.
         *
         * read() fills up to maxBytes bytes and returns the count. A return of
         * 0 means end of data. Failures throw SourceReadError.
         */
        class ByteSource
        {
        public:
            virtual ~ByteSource() = default;

            /// Total number of bytes the source will deliver.
            virtual std::uint64_t totalSize() const = 0;

            /// Read the next bytes into dst (at most maxBytes).
            virtual std::size_t read(char *dst, std::size_t maxBytes) = 0;

            /// Human-readable name for log messages (path, "<memory>", ...).
            virtual std::string describe() const = 0;
        };

        /**
         * FileByteSource
         *
         * Responsibilities:
         *  - Stream a file from disk in binary mode (no newline translation,
         *    so byte counts match the file size).
         *  - Capture the file size when the file is opened.
         *  - Manage the file handle via RAII.
         *
         * Not copyable (owns a file handle), but movable.
         */
        class FileByteSource : public ByteSource
        {
        public:
            FileByteSource() = default;

            FileByteSource(const FileByteSource &)            = delete;
            FileByteSource &operator=(const FileByteSource &) = delete;

            FileByteSource(FileByteSource &&other) noexcept;
            FileByteSource &operator=(FileByteSource &&other) noexcept;

            ~FileByteSource() override;

            /**
             * Open a file for reading and record its size.
             * Returns false if the file cannot be opened or sized.
             */
            bool open(const std::string &filePath);

            void close() noexcept;

            bool isOpen() const noexcept;

            const std::string &filePath() const noexcept;

            std::uint64_t totalSize() const override;
            std::size_t read(char *dst, std::size_t maxBytes) override;
            std::string describe() const override;

        private:
            std::ifstream m_stream;
            std::string   m_filePath;
            std::uint64_t m_size = 0;
        };

        /**
         * MemoryByteSource
         *
         * Owns a byte buffer and serves it sequentially. maxReadSize caps how
         * much a single read() returns (0 = no cap), which lets tests force
         * short reads at arbitrary positions.
         */
        class MemoryByteSource : public ByteSource
        {
        public:
            explicit MemoryByteSource(std::string bytes, std::size_t maxReadSize = 0);

            std::uint64_t totalSize() const override;
            std::size_t read(char *dst, std::size_t maxBytes) override;
            std::string describe() const override;

        private:
            std::string m_bytes;
            std::size_t m_position = 0;
            std::size_t m_maxReadSize;
        };

    } // namespace Input
} // namespace LogSeg
