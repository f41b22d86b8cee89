#include "input/ParseWorker.hpp"
#include "utils/Logger.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace LogSeg
{
    namespace Input
    {
        ParseWorker::ParseWorker(ParserOptions options)
            : m_parser(std::move(options))
        {
        }

        ParseWorker::~ParseWorker()
        {
            cancel();
            join();
        }

        bool ParseWorker::start(std::unique_ptr<ByteSource> source)
        {
            if (m_running.load())
            {
                return false;
            }

            // Reap the previous, already finished, thread.
            join();

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_events.clear();
            }

            m_cancel.store(false);
            m_running.store(true);

            if (!source)
            {
                Utils::getLogger().debug("ParseWorker started without a source; reporting an empty result");
                ParseEvent done;
                done.kind   = ParseEvent::Kind::DONE;
                done.result = ParseResult{};
                post(std::move(done));
                return true;
            }

            try
            {
                m_thread = std::thread(&ParseWorker::run, this, std::move(source));
            }
            catch (const std::system_error &e)
            {
                Utils::getLogger().error(std::string("ParseWorker could not start its thread: ") + e.what());
                m_running.store(false);
                throw;
            }
            return true;
        }

        void ParseWorker::cancel() noexcept
        {
            m_cancel.store(true);
        }

        bool ParseWorker::isRunning() const noexcept
        {
            return m_running.load();
        }

        void ParseWorker::join()
        {
            if (m_thread.joinable())
            {
                m_thread.join();
            }
        }

        void ParseWorker::run(std::unique_ptr<ByteSource> source)
        {
            ParseOutcome outcome = m_parser.parse(
                *source,
                [this](const core::ParseProgress &progress) {
                    ParseEvent ev;
                    ev.kind     = ParseEvent::Kind::PROGRESS;
                    ev.progress = progress;
                    post(std::move(ev));
                },
                &m_cancel);

            // The engine keeps no reference to the input past this point.
            source.reset();

            ParseEvent terminal;
            if (outcome.ok())
            {
                terminal.kind   = ParseEvent::Kind::DONE;
                terminal.result = std::move(outcome.result);
            }
            else
            {
                terminal.kind  = ParseEvent::Kind::ERROR;
                terminal.error = std::move(outcome.error);
            }
            post(std::move(terminal));
        }

        void ParseWorker::post(ParseEvent event)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                const bool terminal = event.isTerminal();
                m_events.push_back(std::move(event));
                if (terminal)
                {
                    m_running.store(false);
                }
            }
            m_cv.notify_all();
        }

        ParseEvent ParseWorker::popUnlocked()
        {
            ParseEvent ev = std::move(m_events.front());
            m_events.pop_front();
            return ev;
        }

        ParseEvent ParseWorker::waitEvent()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_events.empty() && !m_running.load())
            {
                throw std::logic_error("ParseWorker::waitEvent: no parse in progress");
            }
            m_cv.wait(lock, [this] { return !m_events.empty(); });
            return popUnlocked();
        }

        std::optional<ParseEvent> ParseWorker::waitEventFor(std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_cv.wait_for(lock, timeout, [this] { return !m_events.empty(); }))
            {
                return std::nullopt;
            }
            return popUnlocked();
        }

        std::optional<ParseEvent> ParseWorker::tryEvent()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_events.empty())
            {
                return std::nullopt;
            }
            return popUnlocked();
        }

    } // namespace Input
} // namespace LogSeg
