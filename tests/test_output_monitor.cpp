#include <gtest/gtest.h>
#include "supervisor/output_monitor.hpp"

#include <chrono>
#include <fcntl.h>
#include <regex>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using std::chrono::milliseconds;

class OutputMonitorTest : public ::testing::Test {
protected:
    std::vector<std::string> lines;
    std::regex heartbeat{"alive"};

    OutputMonitor make_monitor(int fd = -1, bool with_heartbeat = true) {
        return OutputMonitor(fd, with_heartbeat ? &heartbeat : nullptr,
                             [this](const std::string& line) { lines.push_back(line); });
    }
};

// ── Record framing ──────────────────────────────────────────

TEST_F(OutputMonitorTest, NewlineFinalizesRecord) {
    auto monitor = make_monitor();
    auto result = monitor.feed("hello\nworld\n");
    EXPECT_EQ(result.status, OutputMonitor::Status::Activity);
    EXPECT_EQ(result.records, 2u);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "hello");
    EXPECT_EQ(lines[1], "world");
}

TEST_F(OutputMonitorTest, PartialRecordWaitsForNewline) {
    auto monitor = make_monitor();
    auto result = monitor.feed("progr");
    EXPECT_EQ(result.status, OutputMonitor::Status::Idle);
    EXPECT_TRUE(lines.empty());

    monitor.feed("ess\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "progress");
}

TEST_F(OutputMonitorTest, CarriageReturnOverwrites) {
    auto monitor = make_monitor();
    monitor.feed("ab\rcd\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "cd");
}

TEST_F(OutputMonitorTest, ProgressBarKeepsLastFrame) {
    auto monitor = make_monitor();
    monitor.feed("10%\r50%\r100%\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "100%");
}

TEST_F(OutputMonitorTest, CrlfIsLineEnding) {
    auto monitor = make_monitor();
    monitor.feed("first\r\nsecond\r\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], "second");
}

TEST_F(OutputMonitorTest, CrlfSplitAcrossReads) {
    auto monitor = make_monitor();
    monitor.feed("first\r");
    EXPECT_TRUE(lines.empty());
    monitor.feed("\nsecond\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "first");
}

TEST_F(OutputMonitorTest, EmptyLineIsRecord) {
    auto monitor = make_monitor();
    auto result = monitor.feed("\n");
    EXPECT_EQ(result.records, 1u);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "");
}

TEST_F(OutputMonitorTest, OversizedRecordIsSplit) {
    auto monitor = make_monitor();
    std::string big(OutputMonitor::MAX_RECORD_BYTES + 10, 'x');
    monitor.feed(big + "\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].size(), OutputMonitor::MAX_RECORD_BYTES);
    EXPECT_EQ(lines[1].size(), 10u);
}

// ── Flush ───────────────────────────────────────────────────

TEST_F(OutputMonitorTest, FlushEmitsTrailingRecord) {
    auto monitor = make_monitor();
    monitor.feed("no newline");
    auto result = monitor.flush();
    EXPECT_EQ(result.records, 1u);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "no newline");

    // Nothing left the second time
    EXPECT_EQ(monitor.flush().records, 0u);
}

TEST_F(OutputMonitorTest, FlushDropsOverwrittenRecord) {
    auto monitor = make_monitor();
    monitor.feed("spinner\r");
    auto result = monitor.flush();
    EXPECT_EQ(result.records, 0u);
    EXPECT_TRUE(lines.empty());
}

// ── Heartbeat ───────────────────────────────────────────────

TEST_F(OutputMonitorTest, HeartbeatMatchesAnywhereInRecord) {
    auto monitor = make_monitor();
    auto result = monitor.feed("worker still alive at 12:00\nother\n");
    EXPECT_EQ(result.records, 2u);
    EXPECT_EQ(result.heartbeats, 1u);
    EXPECT_EQ(monitor.total_heartbeats(), 1u);
    EXPECT_EQ(monitor.total_records(), 2u);
}

TEST_F(OutputMonitorTest, NonMatchingOutputIsStillActivity) {
    auto monitor = make_monitor();
    auto result = monitor.feed("nothing to see\n");
    EXPECT_EQ(result.status, OutputMonitor::Status::Activity);
    EXPECT_EQ(result.heartbeats, 0u);
}

TEST_F(OutputMonitorTest, NoPatternNeverMatches) {
    auto monitor = make_monitor(-1, false);
    auto result = monitor.feed("alive\n");
    EXPECT_EQ(result.records, 1u);
    EXPECT_EQ(result.heartbeats, 0u);
}

TEST(OutputMonitorHeartbeat, LongRecordWithGreedyPatternOnWorkerThread) {
    // Worker threads run the match; a long record must not exhaust their stack
    std::regex pattern(".*heartbeat");
    std::size_t records = 0;
    std::size_t heartbeats = 0;
    std::thread worker([&]() {
        OutputMonitor monitor(-1, &pattern, nullptr);
        auto result = monitor.feed(std::string(60000, 'x') + "\n");
        records = result.records;
        heartbeats = result.heartbeats;
    });
    worker.join();
    EXPECT_EQ(records, 1u);
    EXPECT_EQ(heartbeats, 0u);
}

TEST(OutputMonitorHeartbeat, MatchInLeadingPartOfLongRecord) {
    std::regex pattern("heartbeat");
    OutputMonitor monitor(-1, &pattern, nullptr);
    auto result = monitor.feed("heartbeat " + std::string(50000, 'x') + "\n");
    EXPECT_EQ(result.heartbeats, 1u);

    // Beyond the scanned prefix the record still counts as activity
    result = monitor.feed(std::string(OutputMonitor::MAX_HEARTBEAT_SCAN_BYTES, 'x') + "heartbeat\n");
    EXPECT_EQ(result.records, 1u);
    EXPECT_EQ(result.heartbeats, 0u);
}

// ── UTF-8 ───────────────────────────────────────────────────

TEST(OutputMonitorUtf8, ValidTextUnchanged) {
    std::string text = "caf\xC3\xA9 \xE2\x9C\x93 \xF0\x9F\x98\x80";
    EXPECT_EQ(OutputMonitor::sanitize_utf8(text), text);
}

TEST(OutputMonitorUtf8, InvalidByteReplaced) {
    EXPECT_EQ(OutputMonitor::sanitize_utf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
}

TEST(OutputMonitorUtf8, TruncatedSequenceReplaced) {
    EXPECT_EQ(OutputMonitor::sanitize_utf8("x\xE2\x9C"), "x\xEF\xBF\xBD");
}

TEST(OutputMonitorUtf8, OverlongEncodingReplaced) {
    EXPECT_EQ(OutputMonitor::sanitize_utf8("\xC0\xAF"), "\xEF\xBF\xBD");
}

TEST_F(OutputMonitorTest, InvalidUtf8DoesNotDropRecord) {
    auto monitor = make_monitor();
    monitor.feed("bad \x80 byte\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "bad \xEF\xBF\xBD byte");
}

// ── Reading from a descriptor ───────────────────────────────

class OutputMonitorPipeTest : public OutputMonitorTest {
protected:
    int fds[2] = {-1, -1};

    void SetUp() override {
        ASSERT_EQ(pipe2(fds, O_CLOEXEC | O_NONBLOCK), 0);
    }

    void TearDown() override {
        if (fds[0] >= 0) close(fds[0]);
        if (fds[1] >= 0) close(fds[1]);
    }

    void write_all(const std::string& data) {
        ASSERT_EQ(write(fds[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void close_writer() {
        close(fds[1]);
        fds[1] = -1;
    }
};

TEST_F(OutputMonitorPipeTest, PollTimesOutWhenQuiet) {
    auto monitor = make_monitor(fds[0]);
    auto start = std::chrono::steady_clock::now();
    auto result = monitor.poll(milliseconds(50));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(result.status, OutputMonitor::Status::Idle);
    EXPECT_GE(elapsed, milliseconds(40));
}

TEST_F(OutputMonitorPipeTest, PollReadsAvailableRecords) {
    auto monitor = make_monitor(fds[0]);
    write_all("one\ntwo alive\n");
    auto result = monitor.poll(milliseconds(500));
    EXPECT_EQ(result.status, OutputMonitor::Status::Activity);
    EXPECT_EQ(result.records, 2u);
    EXPECT_EQ(result.heartbeats, 1u);
}

TEST_F(OutputMonitorPipeTest, EndOfStreamFlushesPartialRecord) {
    auto monitor = make_monitor(fds[0]);
    write_all("done\nlast words");
    close_writer();

    auto result = monitor.poll(milliseconds(500));
    EXPECT_EQ(result.status, OutputMonitor::Status::EndOfStream);
    EXPECT_TRUE(monitor.at_end());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "last words");

    // Further polls report the same state without blocking
    EXPECT_EQ(monitor.poll(milliseconds(500)).status, OutputMonitor::Status::EndOfStream);
}

TEST_F(OutputMonitorPipeTest, FinishDrainsAndFlushes) {
    auto monitor = make_monitor(fds[0]);
    write_all("tail");
    auto result = monitor.finish();
    EXPECT_EQ(result.status, OutputMonitor::Status::EndOfStream);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "tail");
}
