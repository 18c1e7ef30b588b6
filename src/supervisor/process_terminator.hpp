#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include <sys/types.h>

struct TerminationResult {
    pid_t root = -1;
    bool root_found = false;
    std::size_t descendants = 0;        // enumerated before the first signal
    std::size_t exited_gracefully = 0;  // gone within the grace period (root included)
    std::size_t force_killed = 0;
    std::vector<pid_t> survivors;       // still alive after the whole ladder

    bool success() const { return survivors.empty(); }
};

class ProcessTerminator {
public:
    explicit ProcessTerminator(std::string label = "Process",
                               std::chrono::milliseconds grace_period = std::chrono::seconds(3));

    /// Escalating shutdown of `root` and everything it spawned:
    /// SIGTERM (descendants first), wait for the grace period, SIGKILL
    /// the rest, then a final probe of the root. Reaps the root when it
    /// is a child of this process. Never throws.
    TerminationResult terminate(pid_t root) const;

    /// Live descendants of `root` read from /proc, parents before children.
    /// Members of the process group led by `root` are included as well,
    /// which catches background jobs orphaned by an exited shell.
    static std::vector<pid_t> enumerate_tree(pid_t root);

    /// True if `pid` exists and is not a zombie
    static bool is_alive(pid_t pid);

    std::chrono::milliseconds grace_period() const { return grace_period_; }

private:
    std::string label_;
    std::chrono::milliseconds grace_period_;

    void send_signal(pid_t pid, int sig) const;
};
