#pragma once

#include "supervisor/managed_process.hpp"
#include "supervisor/output_monitor.hpp"
#include "supervisor/process_terminator.hpp"
#include "supervisor/shutdown_signal.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <sys/types.h>

/// Immutable configuration of one worker slot
struct WorkerSlot {
    int id = 0;
    std::string command;
    std::chrono::milliseconds idle_timeout = std::chrono::minutes(5);
    std::string heartbeat_pattern;  // empty disables heartbeat tracking
    bool silent = false;
};

/// Tuning shared by every slot of a pool
struct WorkerOptions {
    std::chrono::milliseconds poll_interval{500};         // clamped to [10ms, 1s]
    std::chrono::milliseconds grace_period{3000};
    std::chrono::milliseconds restart_backoff{1000};
    std::chrono::milliseconds max_restart_backoff{30000};
    std::chrono::milliseconds stable_uptime{10000};       // resets the backoff
    std::chrono::milliseconds eof_grace{1000};            // EOF while alive -> read error
    std::string log_dir;                                  // per-worker output files
};

enum class WorkerState { Starting, Running, Restarting, Stopping, Stopped };

enum class RestartReason { None, Exited, IdleTimeout, ReadError, SpawnFailure, Shutdown };

const char* to_string(WorkerState state);
const char* to_string(RestartReason reason);

struct LivenessState {
    std::chrono::steady_clock::time_point last_activity;
    std::optional<std::chrono::steady_clock::time_point> last_heartbeat;

    void reset(std::chrono::steady_clock::time_point now) {
        last_activity = now;
        last_heartbeat.reset();
    }
};

struct WorkerSnapshot {
    int id = 0;
    WorkerState state = WorkerState::Starting;
    pid_t pid = -1;
    std::size_t restarts = 0;
    std::size_t records = 0;
    std::size_t heartbeats = 0;
    long long ms_since_activity = -1;   // -1 while no process is running
    long long ms_since_heartbeat = -1;  // -1 if none seen for this process
};

class WorkerSupervisor {
public:
    /// Throws std::regex_error if the heartbeat pattern does not compile
    WorkerSupervisor(WorkerSlot slot, const ShutdownSignal& shutdown, WorkerOptions options = {});
    ~WorkerSupervisor();

    WorkerSupervisor(const WorkerSupervisor&) = delete;
    WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

    /// Supervision loop. Blocks until shutdown is requested and the
    /// current process tree has been terminated.
    void run();

    WorkerState state() const { return state_.load(); }
    const WorkerSlot& slot() const { return slot_; }

    /// Thread-safe copy of the observable state
    WorkerSnapshot snapshot() const;

    /// Invoked on the worker thread
    std::function<void(pid_t pid)> on_spawn;
    std::function<void(const std::string& line)> on_line;
    std::function<void(RestartReason reason)> on_restart;

private:
    const WorkerSlot slot_;
    const ShutdownSignal& shutdown_;
    const WorkerOptions options_;
    const std::string label_;
    ProcessTerminator terminator_;

    std::optional<std::regex> heartbeat_;
    std::shared_ptr<spdlog::logger> output_log_;

    std::unique_ptr<ManagedProcess> process_;
    std::unique_ptr<OutputMonitor> monitor_;
    int quick_failures_ = 0;

    std::atomic<WorkerState> state_{WorkerState::Starting};
    std::atomic<pid_t> pid_{-1};
    std::atomic<std::size_t> restarts_{0};
    std::atomic<std::size_t> records_{0};
    std::atomic<std::size_t> heartbeats_{0};

    mutable std::mutex liveness_mutex_;
    LivenessState liveness_;

    void set_state(WorkerState state);
    bool start_process();
    RestartReason supervise();
    void restart(RestartReason reason);
    void stop_process();
    void record_activity(const OutputMonitor::PollResult& result);
    void emit_line(const std::string& line);
    std::chrono::milliseconds next_backoff(RestartReason reason, std::chrono::milliseconds uptime);
    std::chrono::milliseconds poll_slice() const;
};
