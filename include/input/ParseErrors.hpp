#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace LogSeg
{
    namespace Input
    {
        /**
         * Base of every failure that aborts a parse.
         *
         * Thrown by the components below StreamParser (byte sources, the
         * decoder, the cancellation check) and caught in exactly one place:
         * StreamParser::parse(), which turns it into the terminal error
         * outcome. Nothing is retried.
         */
        class ParseError : public std::runtime_error
        {
        public:
            explicit ParseError(const std::string &what)
                : std::runtime_error(what)
            {
            }
        };

        /// The byte stream cannot be interpreted as UTF-8 text (strict mode).
        class DecodeError : public ParseError
        {
        public:
            DecodeError(const std::string &what, std::uint64_t byteOffset)
                : ParseError(what),
                  m_byteOffset(byteOffset)
            {
            }

            /// Offset of the first byte of the malformed sequence.
            std::uint64_t byteOffset() const noexcept { return m_byteOffset; }

        private:
            std::uint64_t m_byteOffset;
        };

        /// The underlying byte source failed or ended early.
        class SourceReadError : public ParseError
        {
        public:
            using ParseError::ParseError;
        };

        /// Cooperative cancellation observed between two chunks.
        class ParseCancelled : public ParseError
        {
        public:
            ParseCancelled()
                : ParseError("parse cancelled")
            {
            }
        };

    } // namespace Input
} // namespace LogSeg
