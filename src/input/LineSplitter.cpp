#include "input/LineSplitter.hpp"

#include <utility>

namespace LogSeg
{
    namespace Input
    {
        LineSplitter::LineSplitter(LineSink sink)
            : m_sink(std::move(sink))
        {
        }

        void LineSplitter::emit(std::string_view line)
        {
            if (!line.empty() && line.back() == '\r')
            {
                line.remove_suffix(1);
            }
            m_sink(line);
        }

        void LineSplitter::feed(std::string_view text)
        {
            std::size_t start = 0;
            std::size_t pos = text.find('\n');

            // The first line of this piece completes the carried fragment.
            if (pos != std::string_view::npos && !m_partial.empty())
            {
                m_partial.append(text.data(), pos);
                emit(m_partial);
                m_partial.clear();
                start = pos + 1;
                pos = text.find('\n', start);
            }

            while (pos != std::string_view::npos)
            {
                emit(text.substr(start, pos - start));
                start = pos + 1;
                pos = text.find('\n', start);
            }

            m_partial.append(text.data() + start, text.size() - start);
        }

        void LineSplitter::finish()
        {
            if (!m_partial.empty())
            {
                // No terminator follows, so a trailing '\r' stays in the line.
                std::string last;
                last.swap(m_partial);
                m_sink(last);
            }
        }

    } // namespace Input
} // namespace LogSeg
