#include "input/ByteSource.hpp"
#include "input/ParseErrors.hpp"
#include "input/StreamParser.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/StringUtils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace LogSeg::test {

using Input::DecodeErrorMode;
using Input::MemoryByteSource;
using Input::ParserOptions;
using Input::StreamParser;

namespace {

const std::string kMixedLog =
    "\xEF\xBB\xBF"
    "2026-01-03T06:29:46.882Z TRACE hello\r\n"
    "world\r\n"
    "2026-01-03 10:00:00 ERROR Unhandled exception in caf\xC3\xA9\n"
    "java.lang.IllegalStateException: bad \xE2\x82\xAC\n"
    "  at com.foo.Bar.baz(Bar.java:10)\n"
    "Caused by: java.io.IOException: disk \xF0\x9F\x92\xBE\n"
    "  ... 3 more\n"
    "\n"
    "WARNING low memory\n"
    "{\n"
    "  \"event\": \"gc\",\n"
    "  \"pause\": 12\n"
    "}\n"
    "ERROR job failed\n"
    "Traceback (most recent call last):\n"
    "  File \"app.py\", line 3, in <module>\n"
    "    main()\n"
    "ValueError: boom\n"
    "  ERROR retrying\n"
    "INFO done";

ParserOptions withChunkSize(std::size_t chunkSize) {
    ParserOptions opts;
    opts.chunkSize = chunkSize;
    return opts;
}

// Claims more bytes than it can deliver.
class TruncatedSource : public Input::ByteSource {
public:
    std::uint64_t totalSize() const override { return 100; }
    std::size_t read(char* dst, std::size_t maxBytes) override {
        const std::size_t n = std::min(maxBytes, remaining_);
        std::memset(dst, 'x', n);
        remaining_ -= n;
        return n;
    }
    std::string describe() const override { return "<truncated>"; }

private:
    std::size_t remaining_ = 10;
};

class FailingSource : public Input::ByteSource {
public:
    std::uint64_t totalSize() const override { return 64; }
    std::size_t read(char*, std::size_t) override {
        throw Input::SourceReadError("device not ready");
    }
    std::string describe() const override { return "<failing>"; }
};

void expectTiling(const Input::ParseResult& result) {
    std::uint64_t expectedStart = 1;
    for (const auto& e : result.entries) {
        EXPECT_EQ(e.lineStart(), expectedStart);
        EXPECT_LE(e.lineStart(), e.lineEnd());
        EXPECT_EQ(Utils::split(e.text(), '\n').size(), e.lineCount());
        expectedStart = e.lineEnd() + 1;
    }
    EXPECT_EQ(expectedStart - 1, result.stats.lines);
    EXPECT_EQ(result.entries.size(), result.stats.entries);
}

}  // namespace

TEST(StreamParserTest, SplitsTraceEntryWithContinuation) {
    const auto outcome = Input::parseText(
        "2026-01-03T06:29:46.882Z TRACE hello\nworld\n2026-01-03T06:29:47.000Z ERROR boom\n");
    ASSERT_TRUE(outcome.ok()) << outcome.error;

    const auto& entries = outcome.result->entries;
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].lineStart(), 1u);
    EXPECT_EQ(entries[0].lineEnd(), 2u);
    EXPECT_EQ(entries[0].text(), "2026-01-03T06:29:46.882Z TRACE hello\nworld");
    EXPECT_EQ(entries[0].severity(), "TRACE");
    EXPECT_EQ(entries[0].timestamp(), "2026-01-03T06:29:46.882");
    EXPECT_EQ(entries[1].lineStart(), 3u);
    EXPECT_EQ(entries[1].lineEnd(), 3u);
    EXPECT_EQ(entries[1].severity(), "ERROR");
    EXPECT_EQ(outcome.result->stats.lines, 3u);
}

TEST(StreamParserTest, StackFrameNeverStartsAnEntry) {
    const auto outcome = Input::parseText(
        "ERROR failed\n  at com.foo.Bar.baz(Bar.java:10)\n");
    ASSERT_TRUE(outcome.ok());
    ASSERT_EQ(outcome.result->entries.size(), 1u);
    EXPECT_EQ(outcome.result->entries[0].lineEnd(), 2u);
}

TEST(StreamParserTest, UnicodeIndentedLinesContinueEntry) {
    const auto outcome = Input::parseText(
        "ERROR failed\n"
        "\xC2\xA0\xC2\xA0" "at com.foo.Bar.baz(Bar.java:10)\n"
        "\xE3\x80\x80INFO wrapped\n");
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    ASSERT_EQ(outcome.result->entries.size(), 1u);
    EXPECT_EQ(outcome.result->entries[0].lineStart(), 1u);
    EXPECT_EQ(outcome.result->entries[0].lineEnd(), 3u);
    EXPECT_EQ(outcome.result->entries[0].severity(), "ERROR");
}

TEST(StreamParserTest, MegabyteTimestampFraction) {
    const std::string fraction(1 << 20, '7');
    const auto outcome = Input::parseText("2026-01-03 10:00:00." + fraction + " INFO x\n");
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    ASSERT_EQ(outcome.result->entries.size(), 1u);
    const auto& entry = outcome.result->entries[0];
    EXPECT_EQ(entry.timestamp(), "2026-01-03 10:00:00." + fraction);
    EXPECT_EQ(entry.severity(), "INFO");
}

TEST(StreamParserTest, GroupsMixedLog) {
    const auto outcome = Input::parseText(kMixedLog);
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    const auto& result = *outcome.result;

    ASSERT_EQ(result.entries.size(), 6u);
    EXPECT_EQ(result.entries[0].text(), "2026-01-03T06:29:46.882Z TRACE hello\nworld");
    EXPECT_EQ(result.entries[1].severity(), "ERROR");
    EXPECT_EQ(result.entries[1].lineStart(), 3u);
    EXPECT_EQ(result.entries[1].lineEnd(), 8u);
    EXPECT_EQ(result.entries[2].severity(), "WARNING");
    EXPECT_EQ(result.entries[3].lineStart(), 10u);
    EXPECT_EQ(result.entries[3].lineEnd(), 13u);
    EXPECT_FALSE(result.entries[3].severity());
    EXPECT_EQ(result.entries[4].lineStart(), 14u);
    EXPECT_EQ(result.entries[4].lineEnd(), 19u);
    EXPECT_EQ(result.entries[5].text(), "INFO done");

    EXPECT_EQ(result.stats.lines, 20u);
    EXPECT_EQ(result.stats.bytesProcessed, kMixedLog.size());
    EXPECT_EQ(result.stats.totalBytes, kMixedLog.size());
    EXPECT_GE(result.stats.durationMs, 0.0);
    expectTiling(result);
}

TEST(StreamParserTest, ChunkBoundariesDoNotChangeResult) {
    const auto reference = Input::parseText(kMixedLog, withChunkSize(1 << 20));
    ASSERT_TRUE(reference.ok());

    for (std::size_t chunk = 1; chunk <= 24; ++chunk) {
        const auto outcome = Input::parseText(kMixedLog, withChunkSize(chunk));
        ASSERT_TRUE(outcome.ok()) << "chunk size " << chunk;
        EXPECT_EQ(outcome.result->entries, reference.result->entries) << "chunk size " << chunk;
        EXPECT_EQ(outcome.result->stats.lines, reference.result->stats.lines);
    }
}

TEST(StreamParserTest, ShortReadsAreFilledUp) {
    const auto reference = Input::parseText(kMixedLog);
    ASSERT_TRUE(reference.ok());

    MemoryByteSource source(kMixedLog, 3);
    const auto outcome = StreamParser(withChunkSize(64)).parse(source);
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    EXPECT_EQ(outcome.result->entries, reference.result->entries);
}

TEST(StreamParserTest, ParsingIsRepeatable) {
    const StreamParser parser(withChunkSize(7));
    MemoryByteSource first(kMixedLog);
    MemoryByteSource second(kMixedLog);
    const auto a = parser.parse(first);
    const auto b = parser.parse(second);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(a.result->entries, b.result->entries);
}

TEST(StreamParserTest, EmptyInput) {
    std::vector<core::ParseProgress> progress;
    MemoryByteSource source("");
    const auto outcome = StreamParser().parse(
        source, [&](const core::ParseProgress& p) { progress.push_back(p); });

    ASSERT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.result->entries.empty());
    EXPECT_EQ(outcome.result->stats.lines, 0u);
    EXPECT_EQ(outcome.result->stats.totalBytes, 0u);
    EXPECT_TRUE(progress.empty());
}

TEST(StreamParserTest, LineCounting) {
    EXPECT_EQ(Input::parseText("a\nb").result->stats.lines, 2u);
    EXPECT_EQ(Input::parseText("a\nb\n").result->stats.lines, 2u);
    EXPECT_EQ(Input::parseText("a\r\nb\r\n").result->stats.lines, 2u);

    const auto blank = Input::parseText("\n");
    ASSERT_TRUE(blank.ok());
    EXPECT_EQ(blank.result->stats.lines, 1u);
    ASSERT_EQ(blank.result->entries.size(), 1u);
    EXPECT_EQ(blank.result->entries[0].text(), "");
}

TEST(StreamParserTest, ProgressIsMonotonicAndEndsComplete) {
    std::string log;
    for (int i = 0; i < 200; ++i) {
        log += "2026-01-03T06:29:46 INFO message number " + std::to_string(i) + "\n";
    }

    ParserOptions opts;
    opts.chunkSize = 100;
    opts.progressInterval = 1000;

    std::vector<core::ParseProgress> progress;
    MemoryByteSource source(log);
    const auto outcome = StreamParser(opts).parse(
        source, [&](const core::ParseProgress& p) { progress.push_back(p); });
    ASSERT_TRUE(outcome.ok());
    ASSERT_GE(progress.size(), 2u);

    for (const auto& p : progress) {
        EXPECT_GE(p.fraction, 0.0);
        EXPECT_LE(p.fraction, 1.0);
    }
    for (std::size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GE(progress[i].bytesProcessed, progress[i - 1].bytesProcessed);
        EXPECT_GE(progress[i].fraction, progress[i - 1].fraction);
        EXPECT_GE(progress[i].lines, progress[i - 1].lines);
        EXPECT_GE(progress[i].entries, progress[i - 1].entries);
        if (i + 1 < progress.size()) {
            EXPECT_GE(progress[i].bytesProcessed - progress[i - 1].bytesProcessed, opts.progressInterval);
        }
    }

    const auto& last = progress.back();
    EXPECT_DOUBLE_EQ(last.fraction, 1.0);
    EXPECT_EQ(last.bytesProcessed, log.size());
    EXPECT_EQ(last.totalBytes, log.size());
    EXPECT_LE(last.entries, outcome.result->stats.entries);
}

TEST(StreamParserTest, ReplacesMalformedUtf8ByDefault) {
    const auto outcome = Input::parseText("ERROR bad \xFF byte\n");
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result->entries[0].text(), "ERROR bad \xEF\xBF\xBD byte");
}

TEST(StreamParserTest, StrictModeFailsWithoutPartialResult) {
    ParserOptions opts;
    opts.decodeErrors = DecodeErrorMode::STRICT;
    const auto outcome = Input::parseText("ok\n\xFF\n", opts);
    EXPECT_FALSE(outcome.ok());
    EXPECT_FALSE(outcome.result.has_value());
    EXPECT_NE(outcome.error.find("invalid UTF-8 at byte offset 3"), std::string::npos);
}

TEST(StreamParserTest, SourceShorterThanAdvertisedFails) {
    TruncatedSource source;
    const auto outcome = StreamParser().parse(source);
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, "source ended after 10 of 100 bytes");
}

TEST(StreamParserTest, ReadFailureBecomesError) {
    FailingSource source;
    const auto outcome = StreamParser().parse(source);
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, "device not ready");
}

TEST(StreamParserTest, CancelledBeforeFirstChunk) {
    std::atomic<bool> cancel{true};
    MemoryByteSource source(kMixedLog);
    const auto outcome = StreamParser().parse(source, {}, &cancel);
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, "parse cancelled");
}

TEST(StreamParserTest, CancelledBetweenChunks) {
    ParserOptions opts;
    opts.chunkSize = 8;
    opts.progressInterval = 1;

    std::atomic<bool> cancel{false};
    int reports = 0;
    MemoryByteSource source(kMixedLog);
    const auto outcome = StreamParser(opts).parse(
        source,
        [&](const core::ParseProgress&) {
            ++reports;
            cancel.store(true);
        },
        &cancel);

    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, "parse cancelled");
    EXPECT_EQ(reports, 1);
}

TEST(StreamParserTest, ProgressCallbackExceptionBecomesError) {
    MemoryByteSource source("INFO x\n");
    const auto outcome = StreamParser().parse(
        source, [](const core::ParseProgress&) { throw std::runtime_error("consumer gone"); });
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, "consumer gone");
}

TEST(StreamParserTest, ZeroChunkSizeIsClamped) {
    const StreamParser parser(withChunkSize(0));
    EXPECT_EQ(parser.options().chunkSize, 1u);
}

TEST(ParserOptionsTest, FromConfig) {
    Utils::ConfigLoader config;
    config.set("chunk_size_bytes", "4KiB");
    config.set("progress_interval_bytes", "0");
    config.set("decode_errors", "STRICT");

    const auto opts = ParserOptions::fromConfig(config);
    EXPECT_EQ(opts.chunkSize, 4096u);
    EXPECT_EQ(opts.progressInterval, 0u);
    EXPECT_EQ(opts.decodeErrors, DecodeErrorMode::STRICT);
}

TEST(ParserOptionsTest, InvalidConfigKeepsDefaults) {
    Utils::ConfigLoader config;
    config.set("chunk_size_bytes", "0");
    config.set("progress_interval_bytes", "often");
    config.set("decode_errors", "ignore");

    const auto opts = ParserOptions::fromConfig(config);
    EXPECT_EQ(opts.chunkSize, ParserOptions::kDefaultChunkSize);
    EXPECT_EQ(opts.progressInterval, ParserOptions::kDefaultProgressInterval);
    EXPECT_EQ(opts.decodeErrors, DecodeErrorMode::REPLACE);
}

}  // namespace LogSeg::test
