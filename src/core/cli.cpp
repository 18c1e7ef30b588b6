#include "core/cli.hpp"
#include "core/config.hpp"
#include "daemon/status_client.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <vector>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

bool CLI::is_subcommand(int argc, char* argv[], const char* name) {
    // "status" alone or followed by options; "status 3 ok" is a command named status
    if (std::strcmp(argv[1], name) != 0) return false;
    return argc == 2 || std::strncmp(argv[2], "--", 2) == 0;
}

int CLI::run(int argc, char* argv[], Config& config) {
    if (argc >= 2) {
        const char* cmd = argv[1];

        if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
            return cmd_help();
        }
        if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
            return cmd_version();
        }
        if (is_subcommand(argc, argv, "status")) {
            return cmd_status(argc, argv);
        }
        if (is_subcommand(argc, argv, "stop")) {
            return cmd_stop(argc, argv);
        }
    }

    return parse_supervise(argc, argv, config);
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "restart-manager - keep N copies of a command running, restarting them\n"
        "when they exit or stop producing output\n"
        "\n"
        "Usage:\n"
        "  restart-manager <command> <instances> <pattern> [options]\n"
        "  restart-manager status [--socket PATH]   Show workers of a running supervisor\n"
        "  restart-manager stop [--socket PATH]     Stop a running supervisor\n"
        "  restart-manager version                  Show version\n"
        "  restart-manager help                     Show this help\n"
        "\n"
        "Arguments:\n"
        "  command      Shell command run by every worker (quote it)\n"
        "  instances    Number of workers to run in parallel\n"
        "  pattern      Regular expression marking a heartbeat line\n"
        "\n"
        "Options:\n"
        "  --silent                     Only log worker start/restart events, not output\n"
        "  --no-output-timeout MINUTES  Restart a worker silent for this long (default 5)\n"
        "  --config PATH                YAML config file\n"
        "                               (default ~/.config/restart-manager/config.yaml)\n"
        "  --log-dir DIR                Also write worker output to DIR/worker-<id>.log\n"
        "  --log-level LEVEL            trace, debug, info, warn, error (default info)\n"
        "  --status-socket PATH         Answer status/stop requests on this Unix socket\n"
        "  --                           End of options\n"
        "\n"
        "Ctrl+C (SIGINT) or SIGTERM stops every worker and its child processes.\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "restart-manager " << APP_VERSION << "\n";
    return 0;
}

// ── helpers ─────────────────────────────────────────────────

bool CLI::parse_int(const std::string& text, int& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < -2147483647L || value > 2147483647L) return false;
    out = static_cast<int>(value);
    return true;
}

bool CLI::parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(value)) return false;
    out = value;
    return true;
}

// ── run mode ────────────────────────────────────────────────

int CLI::parse_supervise(int argc, char* argv[], Config& config) {
    std::vector<std::string> positional;
    std::string config_path;
    bool silent = false;
    bool have_timeout = false;
    double timeout_minutes = 0;
    bool have_log_dir = false, have_log_level = false, have_socket = false;
    std::string log_dir, log_level, status_socket;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg.size() < 2 || arg.compare(0, 2, "--") != 0) {
            positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        std::string name = arg;
        std::string value;
        bool has_value = false;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            has_value = true;
        }

        if (name == "--silent") {
            silent = true;
            continue;
        }

        if (name != "--no-output-timeout" && name != "--config" && name != "--log-dir" &&
            name != "--log-level" && name != "--status-socket") {
            std::cerr << "Unknown option: " << name << "\n";
            std::cerr << "Run 'restart-manager help' for usage.\n";
            return 1;
        }

        if (!has_value) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return 1;
            }
            value = argv[++i];
        }

        if (name == "--no-output-timeout") {
            if (!parse_double(value, timeout_minutes) || timeout_minutes <= 0) {
                std::cerr << "Invalid --no-output-timeout: " << value << " (expected minutes > 0)\n";
                return 1;
            }
            have_timeout = true;
        } else if (name == "--config") {
            config_path = value;
        } else if (name == "--log-dir") {
            log_dir = value;
            have_log_dir = true;
        } else if (name == "--log-level") {
            log_level = value;
            have_log_level = true;
        } else {
            status_socket = value;
            have_socket = true;
        }
    }

    if (positional.size() > 3) {
        std::cerr << "Too many arguments (did you forget to quote the command?)\n";
        std::cerr << "Usage: restart-manager <command> <instances> <pattern> [options]\n";
        return 1;
    }

    // Defaults < config file < command line
    if (!config_path.empty()) {
        if (!config.load_file(config_path)) {
            if (config.last_error().empty()) {
                std::cerr << "Config file not found: " << config_path << "\n";
            } else {
                std::cerr << "Invalid config file " << config_path << ": " << config.last_error() << "\n";
            }
            return 1;
        }
    } else if (!config.load() && !config.last_error().empty()) {
        std::cerr << "Warning: ignoring invalid config file " << Config::config_path()
                  << ": " << config.last_error() << "\n";
    }

    auto& d = config.data();
    if (positional.size() >= 1) d.command = positional[0];
    if (positional.size() >= 2) {
        if (!parse_int(positional[1], d.instances)) {
            std::cerr << "Invalid instance count: " << positional[1] << "\n";
            return 1;
        }
    }
    if (positional.size() >= 3) d.heartbeat_pattern = positional[2];

    if (silent) d.silent = true;
    if (have_timeout) d.no_output_timeout_minutes = timeout_minutes;
    if (have_log_dir) d.log_dir = Config::expand_home(log_dir);
    if (have_log_level) d.log_level = log_level;
    if (have_socket) d.status_socket = Config::expand_home(status_socket);

    std::string problem = config.validate();
    if (!problem.empty()) {
        std::cerr << "Error: " << problem << "\n";
        std::cerr << "Usage: restart-manager <command> <instances> <pattern> [options]\n";
        std::cerr << "Run 'restart-manager help' for details.\n";
        return 1;
    }

    return -1;
}

// ── status / stop ───────────────────────────────────────────

std::string CLI::resolve_socket(int argc, char* argv[], std::string& err) {
    std::string socket_path;
    std::string config_path;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        std::string name = arg;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        } else if ((arg == "--socket" || arg == "--config") && i + 1 < argc) {
            value = argv[++i];
        }

        if (name == "--socket" && !value.empty()) {
            socket_path = value;
        } else if (name == "--config" && !value.empty()) {
            config_path = value;
        } else {
            err = "Unknown or incomplete option: " + arg;
            return "";
        }
    }

    if (socket_path.empty()) {
        Config config;
        bool loaded = config_path.empty() ? config.load() : config.load_file(config_path);
        if (loaded) socket_path = config.data().status_socket;
    }

    if (socket_path.empty()) {
        err = "No status socket configured (use --socket PATH or status.socket_path in the config file)";
        return "";
    }
    return Config::expand_home(socket_path);
}

static std::string format_age(long long ms) {
    if (ms < 0) return "never";
    if (ms < 1000) return std::to_string(ms) + "ms ago";
    return std::to_string(ms / 1000) + "s ago";
}

int CLI::cmd_status(int argc, char* argv[]) {
    std::string err;
    std::string socket_path = resolve_socket(argc, argv, err);
    if (socket_path.empty()) {
        std::cerr << err << "\n";
        return 1;
    }

    StatusClient client(socket_path);
    std::vector<StatusClient::WorkerStatus> workers;
    if (!client.get_status(workers, err)) {
        std::cerr << err << "\n";
        return 1;
    }

    std::cout << std::left
              << std::setw(8) << "WORKER"
              << std::setw(12) << "STATE"
              << std::setw(9) << "PID"
              << std::setw(10) << "RESTARTS"
              << std::setw(10) << "LINES"
              << std::setw(14) << "LAST OUTPUT"
              << "LAST HEARTBEAT\n";

    for (const auto& w : workers) {
        std::string pid = w.pid > 0 ? std::to_string(w.pid) : "-";
        std::string last_output = w.pid > 0 ? format_age(w.ms_since_activity) : "-";
        std::string last_heartbeat = w.pid > 0 ? format_age(w.ms_since_heartbeat) : "-";
        std::cout << std::left
                  << std::setw(8) << w.id
                  << std::setw(12) << w.state
                  << std::setw(9) << pid
                  << std::setw(10) << w.restarts
                  << std::setw(10) << w.records
                  << std::setw(14) << last_output
                  << last_heartbeat << "\n";
    }
    return 0;
}

int CLI::cmd_stop(int argc, char* argv[]) {
    std::string err;
    std::string socket_path = resolve_socket(argc, argv, err);
    if (socket_path.empty()) {
        std::cerr << err << "\n";
        return 1;
    }

    StatusClient client(socket_path);
    if (!client.request_stop(err)) {
        std::cerr << "Failed to stop supervisor: " << err << "\n";
        return 1;
    }
    std::cout << "Stop requested.\n";
    return 0;
}
