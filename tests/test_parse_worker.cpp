#include "input/ByteSource.hpp"
#include "input/ParseWorker.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace LogSeg::test {

using Input::ParseEvent;
using Input::ParseWorker;
using Input::ParserOptions;

namespace {

std::string makeLog(int lines) {
    std::string log;
    for (int i = 0; i < lines; ++i) {
        log += "2026-01-03T06:29:46 INFO line " + std::to_string(i) + "\n";
        if (i % 5 == 0) {
            log += "  at com.example.Worker.run(Worker.java:" + std::to_string(i) + ")\n";
        }
    }
    return log;
}

// Blocks inside the first read() until the test opens the gate.
class GatedSource : public Input::ByteSource {
public:
    GatedSource(std::string bytes, std::promise<void>& entered, std::shared_future<void> gate)
        : bytes_(std::move(bytes)), entered_(entered), gate_(std::move(gate)) {}

    std::uint64_t totalSize() const override { return bytes_.size(); }

    std::size_t read(char* dst, std::size_t maxBytes) override {
        if (!blocked_) {
            blocked_ = true;
            entered_.set_value();
            gate_.wait();
        }
        const std::size_t n = std::min(maxBytes, bytes_.size() - pos_);
        std::memcpy(dst, bytes_.data() + pos_, n);
        pos_ += n;
        return n;
    }

    std::string describe() const override { return "<gated>"; }

private:
    std::string bytes_;
    std::size_t pos_ = 0;
    bool blocked_ = false;
    std::promise<void>& entered_;
    std::shared_future<void> gate_;
};

std::vector<ParseEvent> drain(ParseWorker& worker) {
    std::vector<ParseEvent> events;
    while (true) {
        events.push_back(worker.waitEvent());
        if (events.back().isTerminal()) {
            break;
        }
    }
    return events;
}

}  // namespace

class ParseWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.chunkSize = 64;
        options_.progressInterval = 256;
    }

    ParserOptions options_;
};

TEST_F(ParseWorkerTest, DeliversProgressThenDoneInOrder) {
    const std::string log = makeLog(100);
    const auto expected = Input::parseText(log, options_);
    ASSERT_TRUE(expected.ok());

    ParseWorker worker(options_);
    ASSERT_TRUE(worker.start(std::make_unique<Input::MemoryByteSource>(log)));
    const auto events = drain(worker);
    worker.join();

    ASSERT_GE(events.size(), 2u);
    for (std::size_t i = 0; i + 1 < events.size(); ++i) {
        EXPECT_EQ(events[i].kind, ParseEvent::Kind::PROGRESS);
        if (i > 0) {
            EXPECT_GE(events[i].progress.bytesProcessed, events[i - 1].progress.bytesProcessed);
        }
    }
    EXPECT_DOUBLE_EQ(events[events.size() - 2].progress.fraction, 1.0);

    const auto& done = events.back();
    ASSERT_EQ(done.kind, ParseEvent::Kind::DONE);
    ASSERT_TRUE(done.result.has_value());
    EXPECT_EQ(done.result->entries, expected.result->entries);
    EXPECT_EQ(done.result->stats.lines, expected.result->stats.lines);

    EXPECT_FALSE(worker.isRunning());
    EXPECT_FALSE(worker.tryEvent().has_value());
    EXPECT_THROW(worker.waitEvent(), std::logic_error);
}

TEST_F(ParseWorkerTest, NullSourceCompletesEmpty) {
    ParseWorker worker(options_);
    ASSERT_TRUE(worker.start(nullptr));

    const auto ev = worker.waitEvent();
    ASSERT_EQ(ev.kind, ParseEvent::Kind::DONE);
    ASSERT_TRUE(ev.result.has_value());
    EXPECT_TRUE(ev.result->entries.empty());
    EXPECT_EQ(ev.result->stats.lines, 0u);
    EXPECT_FALSE(worker.isRunning());
}

TEST_F(ParseWorkerTest, InvalidInputEndsWithError) {
    options_.decodeErrors = Input::DecodeErrorMode::STRICT;
    ParseWorker worker(options_);
    ASSERT_TRUE(worker.start(std::make_unique<Input::MemoryByteSource>("INFO \xC3(\n")));

    const auto events = drain(worker);
    ASSERT_EQ(events.back().kind, ParseEvent::Kind::ERROR);
    EXPECT_FALSE(events.back().result.has_value());
    EXPECT_NE(events.back().error.find("invalid UTF-8"), std::string::npos);
}

TEST_F(ParseWorkerTest, CancelStopsAtNextChunk) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    ParseWorker worker(options_);
    ASSERT_TRUE(worker.start(std::make_unique<GatedSource>(makeLog(50), entered, gate)));
    entered.get_future().wait();

    EXPECT_TRUE(worker.isRunning());
    EXPECT_FALSE(worker.start(nullptr));
    EXPECT_FALSE(worker.waitEventFor(std::chrono::milliseconds(10)).has_value());

    worker.cancel();
    release.set_value();

    const auto events = drain(worker);
    const auto& last = events.back();
    ASSERT_EQ(last.kind, ParseEvent::Kind::ERROR);
    EXPECT_EQ(last.error, "parse cancelled");
    EXPECT_FALSE(worker.isRunning());
}

TEST_F(ParseWorkerTest, CanBeReusedAfterCompletion) {
    ParseWorker worker(options_);

    ASSERT_TRUE(worker.start(std::make_unique<Input::MemoryByteSource>("ERROR first\n")));
    EXPECT_EQ(drain(worker).back().kind, ParseEvent::Kind::DONE);

    ASSERT_TRUE(worker.start(std::make_unique<Input::MemoryByteSource>("INFO a\nINFO b\n")));
    const auto events = drain(worker);
    ASSERT_EQ(events.back().kind, ParseEvent::Kind::DONE);
    EXPECT_EQ(events.back().result->entries.size(), 2u);
}

TEST_F(ParseWorkerTest, RestartDiscardsUndrainedEvents) {
    ParseWorker worker(options_);

    ASSERT_TRUE(worker.start(std::make_unique<Input::MemoryByteSource>(makeLog(40))));
    worker.join();
    ASSERT_TRUE(worker.tryEvent().has_value());
    EXPECT_FALSE(worker.isRunning());

    ASSERT_TRUE(worker.start(std::make_unique<Input::MemoryByteSource>("INFO a\nINFO b\n")));
    const auto events = drain(worker);
    ASSERT_EQ(events.back().kind, ParseEvent::Kind::DONE);
    EXPECT_EQ(events.back().result->entries.size(), 2u);
    for (const auto& ev : events) {
        if (ev.kind == ParseEvent::Kind::PROGRESS) {
            EXPECT_EQ(ev.progress.totalBytes, 14u);
        }
    }
    EXPECT_FALSE(worker.tryEvent().has_value());
}

}  // namespace LogSeg::test
