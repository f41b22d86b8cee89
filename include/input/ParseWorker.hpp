#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "core/ParsingStats.hpp"
#include "input/ByteSource.hpp"
#include "input/StreamParser.hpp"

namespace LogSeg
{
    namespace Input
    {
        /**
         * One message on the worker's event channel.
         *
         * A parse produces zero or more PROGRESS events followed by exactly
         * one terminal event (DONE or ERROR).
         */
        struct ParseEvent
        {
            enum class Kind
            {
                PROGRESS,
                DONE,
                ERROR
            };

            Kind                       kind = Kind::PROGRESS;
            core::ParseProgress        progress;   // PROGRESS
            std::optional<ParseResult> result;     // DONE
            std::string                error;      // ERROR

            bool isTerminal() const noexcept { return kind != Kind::PROGRESS; }
        };

        /**
         * ParseWorker
         *
         * Runs StreamParser on a background thread so the caller's own flow
         * (a UI loop, a CLI spinner) stays responsive.
         *
         * Design notes:
         *  - Events go through a FIFO guarded by a mutex; the parser never
         *    waits for the consumer, and events are received in the order
         *    they were produced.
         *  - The worker owns the source for the duration of the parse and
         *    releases it before posting the terminal event.
         *  - cancel() is cooperative: the parser notices it at the next chunk
         *    boundary and ends with an ERROR event ("parse cancelled").
         *  - The destructor cancels a running parse and joins the thread.
         */
        class ParseWorker
        {
        public:
            explicit ParseWorker(ParserOptions options = {});

            ParseWorker(const ParseWorker &)            = delete;
            ParseWorker &operator=(const ParseWorker &) = delete;

            ~ParseWorker();

            /**
             * Start parsing `source` on the worker thread.
             *
             * A null source is valid input: it completes immediately with an
             * empty DONE event. Returns false if a parse is still running.
             * Events still queued from a previous parse are discarded.
             * If the thread cannot be created the worker is left idle and
             * the std::system_error propagates.
             */
            bool start(std::unique_ptr<ByteSource> source);

            /// Ask the running parse to stop at the next chunk boundary.
            void cancel() noexcept;

            /// True from start() until the terminal event has been posted.
            bool isRunning() const noexcept;

            /**
             * Block until the next event is available.
             * Throws std::logic_error if no event is pending and no parse is running.
             */
            ParseEvent waitEvent();

            /// Wait up to `timeout` for the next event.
            std::optional<ParseEvent> waitEventFor(std::chrono::milliseconds timeout);

            /// Return the next event if one is already queued.
            std::optional<ParseEvent> tryEvent();

            /// Wait for the worker thread to exit (events stay queued).
            void join();

        private:
            void run(std::unique_ptr<ByteSource> source);
            void post(ParseEvent event);
            ParseEvent popUnlocked();

        private:
            StreamParser m_parser;

            std::thread       m_thread;
            std::atomic<bool> m_cancel{false};
            std::atomic<bool> m_running{false};

            mutable std::mutex      m_mutex;
            std::condition_variable m_cv;
            std::deque<ParseEvent>  m_events;
        };

    } // namespace Input
} // namespace LogSeg
