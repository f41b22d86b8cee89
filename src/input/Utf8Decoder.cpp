#include "input/Utf8Decoder.hpp"
#include "input/ParseErrors.hpp"

namespace LogSeg
{
    namespace Input
    {
        namespace
        {
            constexpr char kReplacement[] = "\xEF\xBF\xBD";
        } // anonymous namespace

        Utf8Decoder::Utf8Decoder(DecodeErrorMode mode)
            : m_mode(mode)
        {
        }

        void Utf8Decoder::resetSequence() noexcept
        {
            m_needed = 0;
            m_seen   = 0;
            m_lower  = 0x80;
            m_upper  = 0xBF;
        }

        void Utf8Decoder::fail(std::string &out, const char *reason)
        {
            if (m_mode == DecodeErrorMode::STRICT)
            {
                throw DecodeError("invalid UTF-8 at byte offset " + std::to_string(m_sequenceStart) +
                                      ": " + reason,
                                  m_sequenceStart);
            }
            out.append(kReplacement, 3);
            ++m_replacements;
            m_atStreamStart = false;
        }

        void Utf8Decoder::emitPending(std::string &out)
        {
            const std::size_t len = m_seen + 1;
            // U+FEFF as the first code point of the stream is a BOM.
            const bool isBom = len == 3 &&
                               static_cast<unsigned char>(m_pending[0]) == 0xEF &&
                               static_cast<unsigned char>(m_pending[1]) == 0xBB &&
                               static_cast<unsigned char>(m_pending[2]) == 0xBF;
            if (!(isBom && m_atStreamStart))
            {
                out.append(m_pending, len);
            }
            m_atStreamStart = false;
        }

        void Utf8Decoder::decode(const char *data, std::size_t size, std::string &out)
        {
            out.reserve(out.size() + size);

            std::size_t i = 0;
            while (i < size)
            {
                const auto byte = static_cast<unsigned char>(data[i]);

                if (m_needed == 0)
                {
                    m_sequenceStart = m_offset + i;

                    if (byte < 0x80)
                    {
                        out.push_back(static_cast<char>(byte));
                        m_atStreamStart = false;
                        ++i;
                        continue;
                    }

                    if (byte >= 0xC2 && byte <= 0xDF)
                    {
                        m_needed = 1;
                    }
                    else if (byte >= 0xE0 && byte <= 0xEF)
                    {
                        if (byte == 0xE0) m_lower = 0xA0;
                        if (byte == 0xED) m_upper = 0x9F;
                        m_needed = 2;
                    }
                    else if (byte >= 0xF0 && byte <= 0xF4)
                    {
                        if (byte == 0xF0) m_lower = 0x90;
                        if (byte == 0xF4) m_upper = 0x8F;
                        m_needed = 3;
                    }
                    else
                    {
                        fail(out, "unexpected byte");
                        ++i;
                        continue;
                    }

                    m_pending[0] = static_cast<char>(byte);
                    ++i;
                    continue;
                }

                if (byte < m_lower || byte > m_upper)
                {
                    // The offending byte is not consumed; it may start a new sequence.
                    resetSequence();
                    fail(out, "truncated multi-byte sequence");
                    continue;
                }

                m_lower = 0x80;
                m_upper = 0xBF;
                ++m_seen;
                m_pending[m_seen] = static_cast<char>(byte);
                ++i;

                if (m_seen == m_needed)
                {
                    emitPending(out);
                    resetSequence();
                }
            }

            m_offset += size;
        }

        void Utf8Decoder::finish(std::string &out)
        {
            if (m_needed != 0)
            {
                resetSequence();
                fail(out, "stream ends inside a multi-byte sequence");
            }
        }

    } // namespace Input
} // namespace LogSeg
