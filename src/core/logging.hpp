#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

class Logging {
public:
    /// Configure the supervisor logger. Unknown level names fall back to info.
    static void init(const std::string& level = "info");

    /// Supervisor logger ("restart-manager"); created with defaults on first use
    static std::shared_ptr<spdlog::logger> get();

    /// Logger for one worker's output records.
    /// Writes to stdout unless `to_console` is false and to
    /// <log_dir>/worker-<id>.log when `log_dir` is set.
    /// Returns nullptr when neither destination applies.
    static std::shared_ptr<spdlog::logger> worker_output(int worker_id, bool to_console,
                                                         const std::string& log_dir);

    /// Flush every sink (called before exit)
    static void flush();

private:
    static std::shared_ptr<spdlog::logger> create_default();
};
