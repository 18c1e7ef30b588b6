#pragma once

#include "supervisor/process_terminator.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <sys/types.h>

/// One running instance of a worker's command.
/// The child runs `/bin/sh -c <command>` in its own process group with
/// stdout and stderr sharing one pipe and stdin on /dev/null.
class ManagedProcess {
    // Only spawn() can construct one
    struct Token { explicit Token() = default; };

public:
    struct SpawnResult {
        std::unique_ptr<ManagedProcess> process;
        std::string error;  // set when process is null
    };

    /// Start `command`. Fails only when the shell itself cannot be started;
    /// an unknown command inside the shell shows up as an early exit.
    static SpawnResult spawn(const std::string& command);

    ManagedProcess(Token, pid_t pid, int output_fd);

    /// Terminates the process tree if terminate() was never called
    ~ManagedProcess();

    ManagedProcess(const ManagedProcess&) = delete;
    ManagedProcess& operator=(const ManagedProcess&) = delete;

    pid_t pid() const { return pid_; }

    /// Read end of the combined output pipe, in non-blocking mode
    int output_fd() const { return output_fd_; }

    std::chrono::steady_clock::time_point started_at() const { return started_at_; }
    std::chrono::milliseconds uptime() const;

    /// Non-blocking exit probe. The child is left unreaped so its pid
    /// stays reserved until terminate() runs.
    bool has_exited();

    /// "exit code N" / "signal N", or "running"
    std::string describe_exit() const;

    /// Run the termination ladder on this process tree and reap the root.
    /// Subsequent calls return the first result.
    TerminationResult terminate(const ProcessTerminator& terminator);

    bool terminated() const { return terminated_; }

private:
    pid_t pid_ = -1;
    int output_fd_ = -1;
    std::chrono::steady_clock::time_point started_at_;

    bool exited_ = false;
    int exit_code_ = 0;
    int exit_signal_ = 0;

    bool terminated_ = false;
    TerminationResult termination_;
};
