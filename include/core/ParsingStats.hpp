#ifndef LOGSEG_CORE_PARSING_STATS_HPP
#define LOGSEG_CORE_PARSING_STATS_HPP

#include <cstdint>

namespace LogSeg
{
namespace core
{

/**
 * @brief Intermediate progress notification emitted while streaming.
 *
 * entries counts finalized entries only; the entry still open at the time of
 * the report is not included.
 */
struct ParseProgress
{
    std::uint64_t bytesProcessed = 0;
    std::uint64_t totalBytes     = 0;
    double        fraction       = 0.0;  ///< bytesProcessed / totalBytes, clamped to [0,1].
    std::uint64_t lines          = 0;
    std::uint64_t entries        = 0;
};

/**
 * @brief Aggregate statistics of one completed parse.
 *
 * On success bytesProcessed == totalBytes.
 */
struct ParsingStats
{
    std::uint64_t bytesProcessed = 0;
    std::uint64_t totalBytes     = 0;
    std::uint64_t lines          = 0;
    std::uint64_t entries        = 0;
    double        durationMs     = 0.0;  ///< Wall-clock time of the whole parse.
};

} // namespace core
} // namespace LogSeg

#endif // LOGSEG_CORE_PARSING_STATS_HPP
