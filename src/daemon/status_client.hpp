#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <string>
#include <vector>

class StatusClient {
public:
    explicit StatusClient(std::string socket_path);

    struct WorkerStatus {
        int id = 0;
        std::string state;
        int pid = -1;
        std::size_t restarts = 0;
        std::size_t records = 0;
        std::size_t heartbeats = 0;
        long long ms_since_activity = -1;
        long long ms_since_heartbeat = -1;
    };

    /// Fetch per-worker state
    bool get_status(std::vector<WorkerStatus>& workers, std::string& err);

    /// Ask the supervisor to stop all workers and exit
    bool request_stop(std::string& err);

private:
    std::string socket_path_;

    /// Send a JSON command and receive response
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd);
};
