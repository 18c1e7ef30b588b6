#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <regex>
#include <string>

/// Turns a worker's combined output stream into records.
///
/// A carriage return discards the unfinished record (terminal-style
/// overwrite) unless it is part of a CRLF line ending. A newline finalizes
/// the record: it is passed to the sink and tested against the heartbeat
/// pattern. Invalid UTF-8 is replaced with U+FFFD, never rejected.
class OutputMonitor {
public:
    using LineSink = std::function<void(const std::string& line)>;

    enum class Status {
        Idle,         // nothing finalized during this call
        Activity,     // at least one record finalized
        EndOfStream,  // writer side closed; trailing content already flushed
        Error         // read() failed; see PollResult::error
    };

    struct PollResult {
        Status status = Status::Idle;
        std::size_t records = 0;
        std::size_t heartbeats = 0;
        int error = 0;
    };

    static constexpr std::size_t MAX_RECORD_BYTES = 64 * 1024;
    static constexpr std::size_t MAX_READ_PER_POLL = 64 * 1024;

    // std::regex recurses per character; only this prefix of a record is matched
    static constexpr std::size_t MAX_HEARTBEAT_SCAN_BYTES = 4 * 1024;

    /// `fd` is borrowed, not closed. `heartbeat` may be null and must
    /// outlive the monitor.
    OutputMonitor(int fd, const std::regex* heartbeat, LineSink sink);

    /// Wait at most `timeout` for output and consume what is readable
    PollResult poll(std::chrono::milliseconds timeout);

    /// Consume whatever is readable right now, then flush the partial
    /// record. Used once the process has exited.
    PollResult finish();

    /// Feed raw bytes directly (no descriptor involved)
    PollResult feed(const std::string& data);

    /// Emit the unfinished record, if any, as a final record
    PollResult flush();

    bool at_end() const { return eof_; }
    std::size_t total_records() const { return total_records_; }
    std::size_t total_heartbeats() const { return total_heartbeats_; }

    /// Replace every invalid UTF-8 sequence with U+FFFD
    static std::string sanitize_utf8(const std::string& input);

private:
    int fd_;
    const std::regex* heartbeat_;
    LineSink sink_;

    std::string buffer_;
    bool pending_cr_ = false;
    bool eof_ = false;

    std::size_t total_records_ = 0;
    std::size_t total_heartbeats_ = 0;

    void consume(const char* data, std::size_t size, PollResult& result);
    void read_available(PollResult& result);
    void finalize(PollResult& result);
    void flush_into(PollResult& result);
};
