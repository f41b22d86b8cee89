#include "input/StreamParser.hpp"
#include "input/EntryGrouper.hpp"
#include "input/LineSplitter.hpp"
#include "input/ParseErrors.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TimeUtils.hpp"

#include <algorithm>
#include <utility>

namespace LogSeg
{
    namespace Input
    {
        namespace
        {
            // Fill dst with exactly `want` bytes unless the source runs dry.
            std::size_t readChunk(ByteSource &source, char *dst, std::size_t want)
            {
                std::size_t got = 0;
                while (got < want)
                {
                    const std::size_t n = source.read(dst + got, want - got);
                    if (n == 0)
                    {
                        break;
                    }
                    got += n;
                }
                return got;
            }

            core::ParseProgress makeProgress(std::uint64_t processed,
                                             std::uint64_t total,
                                             const EntryGrouper &grouper)
            {
                core::ParseProgress p;
                p.bytesProcessed = processed;
                p.totalBytes     = total;
                p.fraction       = total == 0 ? 1.0
                                              : std::min(1.0, static_cast<double>(processed) /
                                                                  static_cast<double>(total));
                p.lines          = grouper.lineCount();
                p.entries        = grouper.entryCount();
                return p;
            }
        } // anonymous namespace

        // -------- ParserOptions --------

        ParserOptions ParserOptions::fromConfig(const Utils::ConfigLoader &config)
        {
            auto &logger = Utils::getLogger();
            ParserOptions opts;

            if (config.hasKey("chunk_size_bytes"))
            {
                const auto v = config.getByteSize("chunk_size_bytes");
                if (v && *v > 0)
                    opts.chunkSize = static_cast<std::size_t>(*v);
                else
                    logger.warn("Ignoring invalid chunk_size_bytes: " + config.getStringOr("chunk_size_bytes", ""));
            }

            if (config.hasKey("progress_interval_bytes"))
            {
                const auto v = config.getByteSize("progress_interval_bytes");
                if (v)
                    opts.progressInterval = *v;
                else
                    logger.warn("Ignoring invalid progress_interval_bytes: " +
                                config.getStringOr("progress_interval_bytes", ""));
            }

            if (const auto mode = config.getString("decode_errors"))
            {
                if (Utils::iequals(*mode, "strict"))
                    opts.decodeErrors = DecodeErrorMode::STRICT;
                else if (Utils::iequals(*mode, "replace"))
                    opts.decodeErrors = DecodeErrorMode::REPLACE;
                else
                    logger.warn("Ignoring invalid decode_errors (expected replace|strict): " + *mode);
            }

            return opts;
        }

        // -------- StreamParser --------

        StreamParser::StreamParser(ParserOptions options)
            : m_options(std::move(options))
        {
            if (m_options.chunkSize == 0)
            {
                m_options.chunkSize = 1;
            }
        }

        ParseOutcome StreamParser::parse(ByteSource &source,
                                         const ProgressCallback &onProgress,
                                         const std::atomic<bool> *cancelRequested) const
        {
            auto &logger = Utils::getLogger();
            ParseOutcome outcome;

            try
            {
                outcome.result = run(source, onProgress, cancelRequested);
            }
            catch (const ParseError &e)
            {
                logger.error("Parse of " + source.describe() + " failed: " + e.what());
                outcome.error = e.what();
            }
            catch (const std::exception &e)
            {
                logger.error("Parse of " + source.describe() + " aborted: " + e.what());
                outcome.error = e.what();
            }

            return outcome;
        }

        ParseResult StreamParser::run(ByteSource &source,
                                      const ProgressCallback &onProgress,
                                      const std::atomic<bool> *cancelRequested) const
        {
            auto &logger = Utils::getLogger();
            const Utils::Stopwatch stopwatch;

            const std::uint64_t total = source.totalSize();
            logger.info("Parsing " + source.describe() + " (" + std::to_string(total) + " bytes)");

            Utf8Decoder  decoder(m_options.decodeErrors);
            EntryGrouper grouper;
            LineSplitter splitter([&grouper](std::string_view line) { grouper.addLine(line); });

            std::vector<char> buffer(static_cast<std::size_t>(
                std::min<std::uint64_t>(m_options.chunkSize, std::max<std::uint64_t>(total, 1))));
            std::string text;

            std::uint64_t processed      = 0;
            std::uint64_t lastProgressAt = 0;

            while (processed < total)
            {
                if (cancelRequested && cancelRequested->load())
                {
                    throw ParseCancelled();
                }

                const auto want = static_cast<std::size_t>(
                    std::min<std::uint64_t>(buffer.size(), total - processed));
                const std::size_t got = readChunk(source, buffer.data(), want);
                if (got < want)
                {
                    throw SourceReadError("source ended after " + std::to_string(processed + got) +
                                          " of " + std::to_string(total) + " bytes");
                }

                text.clear();
                decoder.decode(buffer.data(), got, text);
                splitter.feed(text);
                processed += got;

                if (processed - lastProgressAt >= m_options.progressInterval || processed >= total)
                {
                    lastProgressAt = processed;
                    const core::ParseProgress progress = makeProgress(processed, total, grouper);
                    if (logger.isEnabled(Utils::LogLevel::DEBUG))
                    {
                        logger.debug("Progress " + std::to_string(progress.bytesProcessed) + "/" +
                                     std::to_string(progress.totalBytes) + " bytes, " +
                                     std::to_string(progress.lines) + " lines, " +
                                     std::to_string(progress.entries) + " entries");
                    }
                    if (onProgress)
                    {
                        onProgress(progress);
                    }
                }
            }

            // Flush the decoder, then the carried line, then the open entry.
            text.clear();
            decoder.finish(text);
            if (!text.empty())
            {
                splitter.feed(text);
            }
            splitter.finish();
            grouper.finish();

            if (decoder.replacements() > 0)
            {
                logger.warn(source.describe() + ": replaced " + std::to_string(decoder.replacements()) +
                            " malformed UTF-8 sequence(s) with U+FFFD");
            }

            ParseResult result;
            result.stats.bytesProcessed = processed;
            result.stats.totalBytes     = total;
            result.stats.lines          = grouper.lineCount();
            result.stats.entries        = grouper.entryCount();
            result.entries              = grouper.takeEntries();
            result.stats.durationMs     = stopwatch.elapsedMillis();

            logger.info("Parsed " + std::to_string(result.stats.lines) + " lines into " +
                        std::to_string(result.stats.entries) + " entries in " +
                        std::to_string(static_cast<long long>(result.stats.durationMs)) + " ms");
            return result;
        }

        ParseOutcome parseText(std::string text, ParserOptions options)
        {
            MemoryByteSource source(std::move(text));
            return StreamParser(std::move(options)).parse(source);
        }

    } // namespace Input
} // namespace LogSeg
