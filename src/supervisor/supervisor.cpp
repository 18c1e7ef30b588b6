#include "supervisor/supervisor.hpp"
#include "daemon/status_server.hpp"
#include "core/logging.hpp"

#include <cmath>
#include <regex>
#include <stdexcept>
#include <thread>
#include <signal.h>

using std::chrono::milliseconds;

static ShutdownSignal* g_shutdown = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_shutdown) {
        g_shutdown->request();
    }
}

namespace {

/// Routes SIGINT/SIGTERM to a ShutdownSignal for the lifetime of the scope
class SignalScope {
public:
    explicit SignalScope(ShutdownSignal& shutdown) : previous_signal_(g_shutdown) {
        g_shutdown = &shutdown;

        struct sigaction sa;
        sa.sa_handler = signal_handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGINT, &sa, &old_int_);
        sigaction(SIGTERM, &sa, &old_term_);
    }

    ~SignalScope() {
        sigaction(SIGINT, &old_int_, nullptr);
        sigaction(SIGTERM, &old_term_, nullptr);
        g_shutdown = previous_signal_;
    }

    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;

private:
    ShutdownSignal* previous_signal_;
    struct sigaction old_int_;
    struct sigaction old_term_;
};

} // namespace

SupervisorOptions SupervisorOptions::from_config(const AppConfig& config) {
    SupervisorOptions options;
    options.instances = config.instances;
    options.command = config.command;
    options.heartbeat_pattern = config.heartbeat_pattern;
    options.idle_timeout = milliseconds(std::llround(config.no_output_timeout_minutes * 60000.0));
    options.silent = config.silent;
    options.stagger = milliseconds(config.stagger_ms);
    options.status_socket = config.status_socket;

    options.worker.poll_interval = milliseconds(config.poll_interval_ms);
    options.worker.grace_period = milliseconds(config.grace_period_ms);
    options.worker.restart_backoff = milliseconds(config.restart_backoff_ms);
    options.worker.max_restart_backoff = milliseconds(config.max_restart_backoff_ms);
    options.worker.stable_uptime = milliseconds(config.stable_uptime_ms);
    options.worker.log_dir = config.log_dir;
    return options;
}

Supervisor::Supervisor(SupervisorOptions options) : options_(std::move(options)) {
    if (options_.instances < 1) {
        throw std::invalid_argument("instance count must be at least 1");
    }
    if (options_.command.empty()) {
        throw std::invalid_argument("command must not be empty");
    }
    if (options_.idle_timeout.count() <= 0) {
        throw std::invalid_argument("idle timeout must be positive");
    }
    try {
        std::regex check(options_.heartbeat_pattern);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("invalid heartbeat pattern: " + std::string(e.what()));
    }

    for (int i = 0; i < options_.instances; ++i) {
        WorkerSlot slot;
        slot.id = i;
        slot.command = options_.command;
        slot.idle_timeout = options_.idle_timeout;
        slot.heartbeat_pattern = options_.heartbeat_pattern;
        slot.silent = options_.silent;
        workers_.push_back(std::make_unique<WorkerSupervisor>(slot, shutdown_, options_.worker));
    }
}

Supervisor::~Supervisor() = default;

void Supervisor::request_stop() {
    shutdown_.request();
}

std::vector<WorkerSnapshot> Supervisor::snapshot() const {
    std::vector<WorkerSnapshot> result;
    result.reserve(workers_.size());
    for (const auto& worker : workers_) {
        result.push_back(worker->snapshot());
    }
    return result;
}

bool Supervisor::all_stopped() const {
    for (const auto& worker : workers_) {
        if (worker->state() != WorkerState::Stopped) return false;
    }
    return true;
}

int Supervisor::run() {
    auto log = Logging::get();
    SignalScope signals(shutdown_);

    if (!options_.status_socket.empty()) {
        status_server_ = std::make_unique<StatusServer>(
            options_.status_socket,
            [this]() { return snapshot(); },
            [this]() { request_stop(); });
        if (!status_server_->start()) {
            log->warn("Continuing without status socket");
            status_server_.reset();
        }
    }

    log->info("Starting {} workers", workers_.size());

    std::vector<std::thread> threads;
    threads.reserve(workers_.size());
    for (std::size_t i = 0; i < workers_.size(); ++i) {
        WorkerSupervisor* worker = workers_[i].get();
        threads.emplace_back([worker]() { worker->run(); });

        // Once shutdown is requested the remaining workers start and stop at once
        if (i + 1 < workers_.size() && !shutdown_.requested()) {
            shutdown_.wait_for(options_.stagger);
        }
    }

    bool announced = false;
    while (!all_stopped()) {
        if (shutdown_.requested() && !announced) {
            log->info("Shutdown requested. Stopping all workers...");
            announced = true;
        }
        std::this_thread::sleep_for(milliseconds(100));
    }

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    if (status_server_) {
        status_server_->stop();
        status_server_.reset();
    }

    log->info("All workers have finished");
    return 0;
}
