#include "supervisor/process_terminator.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <dirent.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using Clock = std::chrono::steady_clock;

namespace {

struct ProcEntry {
    pid_t pid = -1;
    pid_t ppid = -1;
    pid_t pgrp = -1;
    char state = 0;
};

bool read_proc_stat(pid_t pid, ProcEntry& entry) {
    char path[64];
    std::snprintf(path, sizeof(path), "/proc/%d/stat", static_cast<int>(pid));

    FILE* file = std::fopen(path, "r");
    if (file == nullptr) return false;

    char buf[512];
    bool ok = std::fgets(buf, sizeof(buf), file) != nullptr;
    std::fclose(file);
    if (!ok) return false;

    // comm may contain spaces and parentheses; fields resume after the last ')'
    const char* comm_end = std::strrchr(buf, ')');
    if (comm_end == nullptr || comm_end[1] == '\0') return false;

    int ppid = -1;
    int pgrp = -1;
    char state = 0;
    if (std::sscanf(comm_end + 1, " %c %d %d", &state, &ppid, &pgrp) != 3) return false;

    entry.pid = pid;
    entry.ppid = ppid;
    entry.pgrp = pgrp;
    entry.state = state;
    return true;
}

std::vector<ProcEntry> read_proc_table() {
    std::vector<ProcEntry> entries;
    DIR* proc_dir = opendir("/proc");
    if (proc_dir == nullptr) return entries;

    struct dirent* item = nullptr;
    while ((item = readdir(proc_dir)) != nullptr) {
        if (item->d_name[0] < '0' || item->d_name[0] > '9') continue;

        ProcEntry entry;
        if (read_proc_stat(static_cast<pid_t>(std::atoi(item->d_name)), entry)) {
            entries.push_back(entry);
        }
    }
    closedir(proc_dir);
    return entries;
}

bool is_zombie(char state) {
    return state == 'Z' || state == 'X';
}

/// True if `pid` is a child of this process, exited or not. Does not reap.
bool is_child(pid_t pid) {
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    return waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0;
}

/// Reap `pid` if it has exited. Returns true once it is gone.
bool try_reap(pid_t pid) {
    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) return true;
    return r < 0 && errno == ECHILD;
}

} // namespace

ProcessTerminator::ProcessTerminator(std::string label, std::chrono::milliseconds grace_period)
    : label_(std::move(label)), grace_period_(grace_period) {}

bool ProcessTerminator::is_alive(pid_t pid) {
    if (pid <= 0) return false;

    ProcEntry entry;
    if (read_proc_stat(pid, entry)) {
        return !is_zombie(entry.state);
    }
    return kill(pid, 0) == 0;
}

std::vector<pid_t> ProcessTerminator::enumerate_tree(pid_t root) {
    std::vector<pid_t> result;
    if (root <= 0) return result;

    std::unordered_map<pid_t, std::vector<pid_t>> children;
    std::deque<pid_t> pending{root};

    for (const auto& entry : read_proc_table()) {
        if (is_zombie(entry.state)) continue;
        children[entry.ppid].push_back(entry.pid);
        if (entry.pgrp == root && entry.pid != root) {
            pending.push_back(entry.pid);
        }
    }

    std::unordered_set<pid_t> visited{getpid()};
    while (!pending.empty()) {
        pid_t pid = pending.front();
        pending.pop_front();
        if (!visited.insert(pid).second) continue;
        if (pid != root) result.push_back(pid);

        auto it = children.find(pid);
        if (it == children.end()) continue;
        for (pid_t child : it->second) {
            pending.push_back(child);
        }
    }
    return result;
}

void ProcessTerminator::send_signal(pid_t pid, int sig) const {
    if (kill(pid, sig) == 0) return;

    if (errno == ESRCH) {
        Logging::get()->debug("{}: process {} already exited", label_, pid);
    } else {
        Logging::get()->warn("{}: cannot signal process {}: {}", label_, pid, std::strerror(errno));
    }
}

TerminationResult ProcessTerminator::terminate(pid_t root) const {
    TerminationResult result;
    result.root = root;
    if (root <= 0) return result;

    auto log = Logging::get();

    const bool root_is_child = is_child(root);
    bool reaped = false;
    auto root_gone = [&]() {
        if (reaped) return true;
        if (root_is_child) {
            reaped = try_reap(root);
            return reaped;
        }
        return !is_alive(root);
    };

    result.root_found = root_is_child || kill(root, 0) == 0 || errno == EPERM;

    // 1. Enumerate before anything is signalled
    std::vector<pid_t> tree = enumerate_tree(root);
    result.descendants = tree.size();

    if (!result.root_found && tree.empty()) {
        log->info("{}: process {} already exited", label_, root);
        return result;
    }

    log->info("{}: Terminating process {} ({} descendants)...", label_, root, tree.size());

    // 2. SIGTERM, deepest descendants first, root last
    for (auto it = tree.rbegin(); it != tree.rend(); ++it) {
        send_signal(*it, SIGTERM);
    }
    if (!root_gone()) {
        send_signal(root, SIGTERM);
    }

    // 3. Grace period
    auto everything_gone = [&]() {
        bool gone = root_gone();
        for (pid_t pid : tree) {
            if (is_alive(pid)) gone = false;
        }
        return gone;
    };

    auto deadline = Clock::now() + grace_period_;
    while (!everything_gone() && Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::vector<pid_t> remaining;
    for (pid_t pid : tree) {
        if (is_alive(pid)) remaining.push_back(pid);
    }
    const bool root_remaining = !root_gone();
    result.exited_gracefully = tree.size() - remaining.size();
    if (result.root_found && !root_remaining) ++result.exited_gracefully;

    // 4. Force kill, including anything forked during the grace period
    for (pid_t pid : enumerate_tree(root)) {
        if (std::find(remaining.begin(), remaining.end(), pid) == remaining.end()) {
            remaining.push_back(pid);
        }
    }

    if (!remaining.empty() || root_remaining) {
        log->warn("{}: Force killing process {} ({} still running)...", label_, root,
                  remaining.size() + (root_remaining ? 1 : 0));
        for (pid_t pid : remaining) {
            send_signal(pid, SIGKILL);
            ++result.force_killed;
        }
        if (root_remaining) {
            send_signal(root, SIGKILL);
            ++result.force_killed;
        }
    }

    // 5. Final verification of the root
    if (!root_gone() && kill(root, 0) == 0) {
        send_signal(root, SIGKILL);
    }

    // SIGKILL is asynchronous; give the kernel a bounded moment to finish
    auto kill_deadline = Clock::now() + std::chrono::seconds(1);
    while (Clock::now() < kill_deadline) {
        bool gone = root_gone();
        for (pid_t pid : remaining) {
            if (is_alive(pid)) gone = false;
        }
        if (gone) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    for (pid_t pid : remaining) {
        if (is_alive(pid)) result.survivors.push_back(pid);
    }
    if (!root_gone()) result.survivors.push_back(root);

    if (result.success()) {
        log->info("{}: Process terminated", label_);
    } else {
        log->error("{}: {} process(es) survived termination", label_, result.survivors.size());
    }
    return result;
}
