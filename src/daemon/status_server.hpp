#pragma once

#include "supervisor/worker_supervisor.hpp"

#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

/// Local control endpoint of a running supervisor.
/// Unix stream socket; one JSON request line in, one JSON response line out.
class StatusServer {
public:
    using SnapshotProvider = std::function<std::vector<WorkerSnapshot>()>;

    StatusServer(std::string socket_path, SnapshotProvider provider, std::function<void()> on_stop);
    ~StatusServer();

    /// Bind the socket and start serving on a background thread
    bool start();

    /// Stop serving and remove the socket file
    void stop();

    const std::string& socket_path() const { return socket_path_; }

    /// Handle one request line, returns the response (without newline)
    std::string handle_command(const std::string& json_line);

    static nlohmann::json to_json(const WorkerSnapshot& snapshot);

private:
    std::string socket_path_;
    SnapshotProvider provider_;
    std::function<void()> on_stop_;
    std::atomic<bool> stop_flag_{false};
    int socket_fd_ = -1;
    std::thread thread_;

    void serve_loop();
    void cleanup_socket();
};
