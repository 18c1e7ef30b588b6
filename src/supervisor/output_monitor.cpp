#include "supervisor/output_monitor.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <poll.h>
#include <unistd.h>

static const char* REPLACEMENT_CHAR = "\xEF\xBF\xBD";

OutputMonitor::OutputMonitor(int fd, const std::regex* heartbeat, LineSink sink)
    : fd_(fd), heartbeat_(heartbeat), sink_(std::move(sink)) {}

std::string OutputMonitor::sanitize_utf8(const std::string& input) {
    std::string out;
    out.reserve(input.size());

    const std::size_t n = input.size();
    std::size_t i = 0;
    while (i < n) {
        auto c = static_cast<unsigned char>(input[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F; min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F; min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07; min_cp = 0x10000;
        } else {
            // stray continuation byte or invalid lead byte
            out += REPLACEMENT_CHAR;
            ++i;
            continue;
        }

        std::size_t k = 1;
        while (k < len && i + k < n &&
               (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80) {
            cp = (cp << 6) | (static_cast<unsigned char>(input[i + k]) & 0x3F);
            ++k;
        }

        if (k < len) {
            // truncated sequence: one replacement for the whole prefix
            out += REPLACEMENT_CHAR;
            i += k;
            continue;
        }

        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            out += REPLACEMENT_CHAR;
        } else {
            out.append(input, i, len);
        }
        i += len;
    }
    return out;
}

void OutputMonitor::finalize(PollResult& result) {
    std::string line = sanitize_utf8(buffer_);
    buffer_.clear();

    ++result.records;
    ++total_records_;

    if (sink_) sink_(line);

    if (heartbeat_ == nullptr) return;
    try {
        std::size_t scan = std::min(line.size(), MAX_HEARTBEAT_SCAN_BYTES);
        if (std::regex_search(line.cbegin(), line.cbegin() + static_cast<std::ptrdiff_t>(scan), *heartbeat_)) {
            ++result.heartbeats;
            ++total_heartbeats_;
        }
    } catch (const std::regex_error& e) {
        Logging::get()->debug("Heartbeat pattern could not be evaluated: {}", e.what());
    }
}

void OutputMonitor::consume(const char* data, std::size_t size, PollResult& result) {
    for (std::size_t i = 0; i < size; ++i) {
        char c = data[i];

        if (pending_cr_) {
            pending_cr_ = false;
            if (c == '\n') {
                finalize(result);
                continue;
            }
            buffer_.clear();
        }

        if (c == '\r') {
            pending_cr_ = true;
        } else if (c == '\n') {
            finalize(result);
        } else {
            buffer_ += c;
            if (buffer_.size() >= MAX_RECORD_BYTES) {
                finalize(result);
            }
        }
    }

    if (result.records > 0 && result.status == Status::Idle) {
        result.status = Status::Activity;
    }
}

void OutputMonitor::flush_into(PollResult& result) {
    if (pending_cr_) {
        pending_cr_ = false;
        buffer_.clear();
    }
    if (!buffer_.empty()) {
        finalize(result);
    }
}

OutputMonitor::PollResult OutputMonitor::feed(const std::string& data) {
    PollResult result;
    consume(data.data(), data.size(), result);
    return result;
}

OutputMonitor::PollResult OutputMonitor::flush() {
    PollResult result;
    flush_into(result);
    if (result.records > 0) result.status = Status::Activity;
    return result;
}

void OutputMonitor::read_available(PollResult& result) {
    char buf[4096];
    std::size_t total = 0;

    while (total < MAX_READ_PER_POLL) {
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n > 0) {
            total += static_cast<std::size_t>(n);
            consume(buf, static_cast<std::size_t>(n), result);
            continue;
        }
        if (n == 0) {
            eof_ = true;
            flush_into(result);
            result.status = Status::EndOfStream;
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) break;

        result.status = Status::Error;
        result.error = errno;
        return;
    }

    result.status = result.records > 0 ? Status::Activity : Status::Idle;
}

OutputMonitor::PollResult OutputMonitor::poll(std::chrono::milliseconds timeout) {
    PollResult result;
    if (eof_) {
        result.status = Status::EndOfStream;
        return result;
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ret = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret < 0) {
        if (errno != EINTR) {
            result.status = Status::Error;
            result.error = errno;
        }
        return result;
    }
    if (ret == 0) return result;

    read_available(result);
    return result;
}

OutputMonitor::PollResult OutputMonitor::finish() {
    PollResult result;
    if (!eof_) {
        read_available(result);
    }
    flush_into(result);
    if (result.status != Status::Error) {
        result.status = Status::EndOfStream;
    }
    return result;
}
