#include "utils/TimeUtils.hpp"

#include <iomanip>
#include <sstream>

namespace LogSeg
{
    namespace Utils
    {
        TimePoint now() noexcept
        {
            return Clock::now();
        }

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            std::time_t t = Clock::to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            localtime_s(&tm_buf, &t);
        #else
            localtime_r(&t, &tm_buf);
        #endif

            // put_time needs a NUL-terminated format.
            const std::string fmt(format);
            std::ostringstream oss;
            oss << std::put_time(&tm_buf, fmt.c_str());
            return oss.str();
        }

        // -------- Stopwatch --------

        Stopwatch::Stopwatch() noexcept
            : m_start(SteadyClock::now())
        {
        }

        double Stopwatch::elapsedMillis() const noexcept
        {
            const auto elapsed = SteadyClock::now() - m_start;
            return std::chrono::duration<double, std::milli>(elapsed).count();
        }

    } // namespace Utils
} // namespace LogSeg
