#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/LogEntry.hpp"
#include "core/ParsingStats.hpp"
#include "input/ByteSource.hpp"
#include "input/Utf8Decoder.hpp"

namespace LogSeg
{
    namespace Utils
    {
        class ConfigLoader;
    }

    namespace Input
    {
        /// Tunables of one parse. Defaults match config/logseg.conf.
        struct ParserOptions
        {
            static constexpr std::size_t   kDefaultChunkSize        = 256 * 1024;
            static constexpr std::uint64_t kDefaultProgressInterval = 1024 * 1024;

            std::size_t     chunkSize        = kDefaultChunkSize;
            std::uint64_t   progressInterval = kDefaultProgressInterval;
            DecodeErrorMode decodeErrors     = DecodeErrorMode::REPLACE;

            /**
             * Read chunk_size_bytes, progress_interval_bytes and decode_errors.
             * Missing keys keep their defaults; invalid values are logged and
             * ignored.
             */
            static ParserOptions fromConfig(const Utils::ConfigLoader &config);
        };

        /// Success payload: every entry in line order plus the final statistics.
        struct ParseResult
        {
            std::vector<core::LogEntry> entries;
            core::ParsingStats          stats;
        };

        /**
         * Terminal outcome of a parse: exactly one of result / error is set.
         * There are no partial results.
         */
        struct ParseOutcome
        {
            std::optional<ParseResult> result;
            std::string                error;

            bool ok() const noexcept { return result.has_value(); }
        };

        /**
         * StreamParser
         *
         * Responsibilities:
         *  - Drive one forward pass over a ByteSource in fixed-size chunks.
         *  - Chain decoder -> line splitter -> entry grouper, carrying their
         *    state from chunk to chunk.
         *  - Emit progress after a chunk when the progress interval has
         *    elapsed or the last chunk was read.
         *  - Convert any ParseError into the single terminal error outcome.
         *
         * Design notes:
         *  - All per-parse state lives on the stack of parse(); a StreamParser
         *    only holds options and can be reused, also from several threads
         *    on different sources.
         *  - Cancellation is cooperative and checked between chunks only.
         */
        class StreamParser
        {
        public:
            /// Called synchronously on the parsing thread, in order.
            using ProgressCallback = std::function<void(const core::ParseProgress &)>;

            explicit StreamParser(ParserOptions options = {});

            /**
             * Parse the whole source.
             *
             * Never throws for decode, read or cancellation failures; those
             * come back as outcome.error. Exceptions thrown by onProgress are
             * treated the same way.
             */
            ParseOutcome parse(ByteSource &source,
                               const ProgressCallback &onProgress = {},
                               const std::atomic<bool> *cancelRequested = nullptr) const;

            const ParserOptions &options() const noexcept { return m_options; }

        private:
            ParseResult run(ByteSource &source,
                            const ProgressCallback &onProgress,
                            const std::atomic<bool> *cancelRequested) const;

        private:
            ParserOptions m_options;
        };

        /// Convenience: parse an in-memory string with the given options.
        ParseOutcome parseText(std::string text, ParserOptions options = {});

    } // namespace Input
} // namespace LogSeg
