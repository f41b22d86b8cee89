#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace LogSeg
{
    namespace Input
    {
        /**
         * LineSplitter
         *
         * Turns decoded text, delivered in arbitrary pieces, into complete
         * physical lines. Terminators are "\n" and "\r\n"; the terminator is
         * not part of the emitted line. A lone '\r' is ordinary text.
         *
         * The text after the last terminator of a piece is carried over and
         * prepended to the next piece, so a line (or a "\r\n" pair) split
         * across chunks comes out whole.
         */
        class LineSplitter
        {
        public:
            /// Receives each complete line. The view is valid only during the call.
            using LineSink = std::function<void(std::string_view)>;

            explicit LineSplitter(LineSink sink);

            LineSplitter(const LineSplitter &)            = delete;
            LineSplitter &operator=(const LineSplitter &) = delete;

            /// Split the next piece of text, emitting every line it completes.
            void feed(std::string_view text);

            /// End of stream: a non-empty carried fragment becomes the final line.
            void finish();

            /// The incomplete fragment currently carried over.
            const std::string &pending() const noexcept { return m_partial; }

        private:
            void emit(std::string_view line);

        private:
            LineSink    m_sink;
            std::string m_partial;
        };

    } // namespace Input
} // namespace LogSeg
