#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace LogSeg
{
    namespace Input
    {
        /// What the decoder does with malformed UTF-8.
        enum class DecodeErrorMode
        {
            REPLACE,  // emit U+FFFD per maximal invalid subsequence
            STRICT    // throw DecodeError at the first malformed sequence
        };

        /**
         * Utf8Decoder
         *
         * Incremental UTF-8 decoder. decode() may be fed arbitrary byte
         * ranges: a multi-byte sequence split across two calls is held back
         * until its remaining bytes arrive. finish() flushes a truncated
         * trailing sequence.
         *
         * The output is always well-formed UTF-8, so decoding is a validating
         * copy rather than a conversion. A byte-order mark at the very start
         * of the stream is dropped.
         *
         * Error recovery follows the WHATWG "utf-8 decode" algorithm: an
         * unexpected byte ends the pending sequence (one U+FFFD) and is then
         * reprocessed as the start of a new sequence.
         */
        class Utf8Decoder
        {
        public:
            explicit Utf8Decoder(DecodeErrorMode mode = DecodeErrorMode::REPLACE);

            /// Decode the next bytes of the stream, appending text to out.
            void decode(const char *data, std::size_t size, std::string &out);

            /// End of stream: resolve any pending partial sequence.
            void finish(std::string &out);

            /// Number of U+FFFD substitutions made so far (REPLACE mode).
            std::uint64_t replacements() const noexcept { return m_replacements; }

            /// Total bytes consumed so far.
            std::uint64_t bytesConsumed() const noexcept { return m_offset; }

        private:
            void fail(std::string &out, const char *reason);
            void emitPending(std::string &out);
            void resetSequence() noexcept;

        private:
            DecodeErrorMode m_mode;

            // Pending sequence state.
            unsigned      m_needed = 0;
            unsigned      m_seen   = 0;
            unsigned char m_lower  = 0x80;
            unsigned char m_upper  = 0xBF;
            char          m_pending[4] = {};
            std::uint64_t m_sequenceStart = 0;

            std::uint64_t m_offset = 0;
            std::uint64_t m_replacements = 0;
            bool          m_atStreamStart = true;
        };

    } // namespace Input
} // namespace LogSeg
