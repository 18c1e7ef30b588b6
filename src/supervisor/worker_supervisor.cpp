#include "supervisor/worker_supervisor.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cstring>
#include <thread>

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

// Consecutive failed reads before the stream is given up on
static const int MAX_READ_ERRORS = 3;

const char* to_string(WorkerState state) {
    switch (state) {
        case WorkerState::Starting:   return "starting";
        case WorkerState::Running:    return "running";
        case WorkerState::Restarting: return "restarting";
        case WorkerState::Stopping:   return "stopping";
        case WorkerState::Stopped:    return "stopped";
    }
    return "unknown";
}

const char* to_string(RestartReason reason) {
    switch (reason) {
        case RestartReason::None:         return "none";
        case RestartReason::Exited:       return "process exited";
        case RestartReason::IdleTimeout:  return "no output";
        case RestartReason::ReadError:    return "output stream error";
        case RestartReason::SpawnFailure: return "spawn failure";
        case RestartReason::Shutdown:     return "shutdown";
    }
    return "unknown";
}

static std::string format_duration(milliseconds d) {
    auto ms = d.count();
    if (ms % 60000 == 0) {
        auto minutes = ms / 60000;
        return std::to_string(minutes) + (minutes == 1 ? " minute" : " minutes");
    }
    if (ms % 1000 == 0) {
        auto seconds = ms / 1000;
        return std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");
    }
    return std::to_string(ms) + " ms";
}

static long long elapsed_ms(Clock::time_point since, Clock::time_point now) {
    return std::chrono::duration_cast<milliseconds>(now - since).count();
}

WorkerSupervisor::WorkerSupervisor(WorkerSlot slot, const ShutdownSignal& shutdown, WorkerOptions options)
    : slot_(std::move(slot)),
      shutdown_(shutdown),
      options_(std::move(options)),
      label_("Worker " + std::to_string(slot_.id)),
      terminator_(label_, options_.grace_period) {
    if (!slot_.heartbeat_pattern.empty()) {
        heartbeat_.emplace(slot_.heartbeat_pattern);
    }
    output_log_ = Logging::worker_output(slot_.id, !slot_.silent, options_.log_dir);
    liveness_.reset(Clock::now());
}

WorkerSupervisor::~WorkerSupervisor() {
    stop_process();
}

milliseconds WorkerSupervisor::poll_slice() const {
    return std::clamp(options_.poll_interval, milliseconds(10), milliseconds(1000));
}

void WorkerSupervisor::set_state(WorkerState state) {
    state_.store(state);
    Logging::get()->debug("{}: -> {}", label_, to_string(state));
}

WorkerSnapshot WorkerSupervisor::snapshot() const {
    WorkerSnapshot snap;
    snap.id = slot_.id;
    snap.state = state_.load();
    snap.pid = pid_.load();
    snap.restarts = restarts_.load();
    snap.records = records_.load();
    snap.heartbeats = heartbeats_.load();

    if (snap.pid > 0) {
        auto now = Clock::now();
        std::lock_guard<std::mutex> lock(liveness_mutex_);
        snap.ms_since_activity = elapsed_ms(liveness_.last_activity, now);
        if (liveness_.last_heartbeat) {
            snap.ms_since_heartbeat = elapsed_ms(*liveness_.last_heartbeat, now);
        }
    }
    return snap;
}

void WorkerSupervisor::emit_line(const std::string& line) {
    if (output_log_) output_log_->info("{}", line);
    if (on_line) on_line(line);
}

void WorkerSupervisor::record_activity(const OutputMonitor::PollResult& result) {
    if (result.records == 0) return;

    records_ += result.records;
    heartbeats_ += result.heartbeats;

    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(liveness_mutex_);
    liveness_.last_activity = std::max(liveness_.last_activity, now);
    if (result.heartbeats > 0) {
        liveness_.last_heartbeat = now;
        Logging::get()->debug("{}: heartbeat matched", label_);
    }
}

bool WorkerSupervisor::start_process() {
    auto log = Logging::get();

    auto spawned = ManagedProcess::spawn(slot_.command);
    if (!spawned.process) {
        log->error("{}: failed to start command: {}", label_, spawned.error);
        return false;
    }

    process_ = std::move(spawned.process);
    monitor_ = std::make_unique<OutputMonitor>(
        process_->output_fd(),
        heartbeat_ ? &*heartbeat_ : nullptr,
        [this](const std::string& line) { emit_line(line); });

    {
        std::lock_guard<std::mutex> lock(liveness_mutex_);
        liveness_.reset(process_->started_at());
    }
    pid_.store(process_->pid());

    log->info("{}: Process {} started", label_, process_->pid());
    if (on_spawn) on_spawn(process_->pid());
    return true;
}

RestartReason WorkerSupervisor::supervise() {
    auto log = Logging::get();
    const milliseconds slice = poll_slice();
    const milliseconds idle_sleep = std::min(slice, milliseconds(100));

    int read_errors = 0;
    std::optional<Clock::time_point> eof_at;

    while (true) {
        if (shutdown_.requested()) return RestartReason::Shutdown;

        if (!monitor_->at_end()) {
            auto result = monitor_->poll(slice);
            record_activity(result);

            if (result.status == OutputMonitor::Status::Error) {
                log->warn("{}: read error: {}", label_, std::strerror(result.error));
                if (++read_errors >= MAX_READ_ERRORS) return RestartReason::ReadError;
                std::this_thread::sleep_for(idle_sleep);
            } else {
                read_errors = 0;
            }
            if (result.status == OutputMonitor::Status::EndOfStream) {
                eof_at = Clock::now();
            }
        } else {
            std::this_thread::sleep_for(idle_sleep);
        }

        if (process_->has_exited()) {
            record_activity(monitor_->finish());
            log->info("{}: Process {} exited ({})", label_, process_->pid(), process_->describe_exit());
            return RestartReason::Exited;
        }

        auto now = Clock::now();
        Clock::time_point last_activity;
        std::optional<Clock::time_point> last_heartbeat;
        {
            std::lock_guard<std::mutex> lock(liveness_mutex_);
            last_activity = liveness_.last_activity;
            last_heartbeat = liveness_.last_heartbeat;
        }

        if (now - last_activity > slot_.idle_timeout) {
            std::string heartbeat_note = "never";
            if (last_heartbeat) {
                heartbeat_note = std::to_string(elapsed_ms(*last_heartbeat, now) / 1000) + "s ago";
            }
            log->warn("{}: No output detected for {} (last heartbeat: {}). Restarting...",
                      label_, format_duration(slot_.idle_timeout), heartbeat_note);
            return RestartReason::IdleTimeout;
        }

        if (eof_at && now - *eof_at > options_.eof_grace) {
            log->warn("{}: output stream closed while process {} is still running",
                      label_, process_->pid());
            return RestartReason::ReadError;
        }
    }
}

milliseconds WorkerSupervisor::next_backoff(RestartReason reason, milliseconds uptime) {
    if (reason == RestartReason::IdleTimeout || reason == RestartReason::Shutdown) {
        quick_failures_ = 0;
        return milliseconds(0);
    }
    if (reason != RestartReason::SpawnFailure && uptime >= options_.stable_uptime) {
        quick_failures_ = 0;
        return milliseconds(0);
    }

    ++quick_failures_;
    milliseconds delay = options_.restart_backoff;
    for (int i = 1; i < quick_failures_ && delay < options_.max_restart_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.max_restart_backoff);
}

void WorkerSupervisor::restart(RestartReason reason) {
    auto log = Logging::get();
    log->info("{}: Restarting ({})", label_, to_string(reason));

    milliseconds uptime(0);
    if (process_) {
        uptime = process_->uptime();
        stop_process();
    }

    ++restarts_;
    if (on_restart) on_restart(reason);

    if (shutdown_.requested()) {
        set_state(WorkerState::Stopping);
        return;
    }

    milliseconds delay = next_backoff(reason, uptime);
    if (delay.count() > 0) {
        log->info("{}: waiting {} before restart", label_, format_duration(delay));
        if (shutdown_.wait_for(delay)) {
            set_state(WorkerState::Stopping);
            return;
        }
    }
    set_state(WorkerState::Starting);
}

void WorkerSupervisor::stop_process() {
    if (!process_) return;

    process_->terminate(terminator_);
    monitor_.reset();
    process_.reset();
    pid_.store(-1);
}

void WorkerSupervisor::run() {
    auto log = Logging::get();
    if (slot_.silent) {
        log->info("{}: Started", label_);
    } else {
        log->info("Starting {}", label_);
    }

    RestartReason reason = RestartReason::None;
    set_state(WorkerState::Starting);

    while (true) {
        switch (state_.load()) {
            case WorkerState::Starting:
                if (shutdown_.requested()) {
                    set_state(WorkerState::Stopping);
                } else if (start_process()) {
                    set_state(WorkerState::Running);
                } else {
                    reason = RestartReason::SpawnFailure;
                    set_state(WorkerState::Restarting);
                }
                break;

            case WorkerState::Running:
                try {
                    reason = supervise();
                } catch (const std::exception& e) {
                    log->error("{}: Error - {}. Restarting...", label_, e.what());
                    reason = RestartReason::ReadError;
                }
                set_state(reason == RestartReason::Shutdown ? WorkerState::Stopping
                                                            : WorkerState::Restarting);
                break;

            case WorkerState::Restarting:
                restart(reason);
                break;

            case WorkerState::Stopping:
                if (process_) log->info("{}: Stopping", label_);
                stop_process();
                set_state(WorkerState::Stopped);
                break;

            case WorkerState::Stopped:
                log->info("{}: Stopped", label_);
                return;
        }
    }
}
