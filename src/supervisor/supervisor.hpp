#pragma once

#include "core/config.hpp"
#include "supervisor/shutdown_signal.hpp"
#include "supervisor/worker_supervisor.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

class StatusServer;

struct SupervisorOptions {
    int instances = 1;
    std::string command;
    std::string heartbeat_pattern;
    std::chrono::milliseconds idle_timeout = std::chrono::minutes(5);
    bool silent = false;

    std::chrono::milliseconds stagger{1000};
    WorkerOptions worker;
    std::string status_socket;  // empty = no status channel

    static SupervisorOptions from_config(const AppConfig& config);
};

/// Owns a pool of worker slots running the same command.
class Supervisor {
public:
    /// Throws std::invalid_argument on an unusable configuration
    explicit Supervisor(SupervisorOptions options);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// Start every worker (staggered), block until all of them have
    /// stopped. SIGINT and SIGTERM request shutdown while this runs.
    int run();

    /// Request graceful stop (safe from any thread)
    void request_stop();

    const ShutdownSignal& shutdown_signal() const { return shutdown_; }

    std::size_t worker_count() const { return workers_.size(); }

    /// Set callbacks on a worker before run()
    WorkerSupervisor& worker(std::size_t index) { return *workers_.at(index); }

    std::vector<WorkerSnapshot> snapshot() const;

private:
    SupervisorOptions options_;
    ShutdownSignal shutdown_;
    std::vector<std::unique_ptr<WorkerSupervisor>> workers_;
    std::unique_ptr<StatusServer> status_server_;

    bool all_stopped() const;
};
