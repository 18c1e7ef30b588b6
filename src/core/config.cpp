#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/restart-manager";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/restart-manager";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

bool Config::load() {
    return load_file(config_path());
}

bool Config::load_file(const std::string& path) {
    last_error_.clear();
    std::string expanded = expand_home(path);
    std::error_code ec;
    if (expanded.empty() || !fs::exists(expanded, ec)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded);

        // Workers section
        if (auto workers = root["workers"]) {
            config_.command = workers["command"].as<std::string>(config_.command);
            config_.instances = workers["instances"].as<int>(config_.instances);
            config_.heartbeat_pattern = workers["heartbeat_pattern"].as<std::string>(config_.heartbeat_pattern);
            config_.no_output_timeout_minutes =
                workers["no_output_timeout_minutes"].as<double>(config_.no_output_timeout_minutes);
            config_.silent = workers["silent"].as<bool>(config_.silent);
        }

        // Timing section
        if (auto timing = root["timing"]) {
            config_.stagger_ms = timing["stagger_ms"].as<int>(config_.stagger_ms);
            config_.poll_interval_ms = timing["poll_interval_ms"].as<int>(config_.poll_interval_ms);
            config_.grace_period_ms = timing["grace_period_ms"].as<int>(config_.grace_period_ms);
            config_.restart_backoff_ms = timing["restart_backoff_ms"].as<int>(config_.restart_backoff_ms);
            config_.max_restart_backoff_ms =
                timing["max_restart_backoff_ms"].as<int>(config_.max_restart_backoff_ms);
            config_.stable_uptime_ms = timing["stable_uptime_ms"].as<int>(config_.stable_uptime_ms);
        }

        // Logging section
        if (auto logging = root["logging"]) {
            config_.log_level = logging["level"].as<std::string>(config_.log_level);
            config_.log_dir = expand_home(logging["log_dir"].as<std::string>(config_.log_dir));
        }

        // Status section
        if (auto status = root["status"]) {
            config_.status_socket = expand_home(status["socket_path"].as<std::string>(config_.status_socket));
        }

        return true;
    } catch (const YAML::Exception& e) {
        // Parse failed, keep what we had
        last_error_ = e.what();
        return false;
    }
}

std::string Config::validate() const {
    if (config_.command.empty()) return "no command given";
    if (config_.instances < 1) return "instance count must be at least 1";
    if (!std::isfinite(config_.no_output_timeout_minutes) || config_.no_output_timeout_minutes <= 0) {
        return "no-output timeout must be a positive number of minutes";
    }
    if (config_.no_output_timeout_minutes > MAX_NO_OUTPUT_TIMEOUT_MINUTES) {
        return "no-output timeout must not exceed " +
               std::to_string(static_cast<long long>(MAX_NO_OUTPUT_TIMEOUT_MINUTES)) + " minutes";
    }
    if (config_.poll_interval_ms <= 0) return "poll interval must be positive";
    if (config_.grace_period_ms < 0) return "grace period must not be negative";
    if (config_.stagger_ms < 0) return "stagger must not be negative";
    if (config_.restart_backoff_ms < 0 || config_.max_restart_backoff_ms < config_.restart_backoff_ms) {
        return "restart backoff must satisfy 0 <= restart_backoff_ms <= max_restart_backoff_ms";
    }

    try {
        std::regex pattern(config_.heartbeat_pattern);
    } catch (const std::regex_error& e) {
        return "invalid heartbeat pattern '" + config_.heartbeat_pattern + "': " + e.what();
    }
    return "";
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
