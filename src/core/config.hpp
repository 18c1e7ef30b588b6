#pragma once

#include <string>

// Ten years; keeps the timeout representable in steady_clock nanoseconds
constexpr double MAX_NO_OUTPUT_TIMEOUT_MINUTES = 10.0 * 365 * 24 * 60;

struct AppConfig {
    // Workers
    std::string command;
    int instances = 1;
    std::string heartbeat_pattern;
    double no_output_timeout_minutes = 5;
    bool silent = false;

    // Timing
    int stagger_ms = 1000;
    int poll_interval_ms = 500;
    int grace_period_ms = 3000;
    int restart_backoff_ms = 1000;
    int max_restart_backoff_ms = 30000;
    int stable_uptime_ms = 10000;

    // Logging
    std::string log_level = "info";
    std::string log_dir;        // empty = no per-worker log files

    // Status channel
    std::string status_socket;  // empty = disabled
};

class Config {
public:
    Config();
    ~Config();

    /// Load the default config file. Returns false if it is missing or invalid.
    bool load();

    /// Load a specific file. Values not present keep their current value.
    bool load_file(const std::string& path);

    /// Parse error of the last load, empty if none
    const std::string& last_error() const { return last_error_; }

    /// Empty if the configuration describes a runnable pool, otherwise the first problem
    std::string validate() const;

    AppConfig& data();
    const AppConfig& data() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
    std::string last_error_;
};
