#include "core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

static const char* LOGGER_NAME = "restart-manager";
static const char* SUPERVISOR_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
static const char* OUTPUT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] %v";

static std::mutex g_logger_mutex;
static std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> Logging::create_default() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    logger->set_pattern(SUPERVISOR_PATTERN);
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

void Logging::init(const std::string& level) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = create_default();
    }

    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    g_logger->set_level(lvl);
}

std::shared_ptr<spdlog::logger> Logging::get() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        g_logger = create_default();
    }
    return g_logger;
}

std::shared_ptr<spdlog::logger> Logging::worker_output(int worker_id, bool to_console,
                                                       const std::string& log_dir) {
    std::vector<spdlog::sink_ptr> sinks;
    if (to_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (!log_dir.empty()) {
        try {
            fs::create_directories(log_dir);
            std::string path = (fs::path(log_dir) / ("worker-" + std::to_string(worker_id) + ".log")).string();
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path));
        } catch (const std::exception& e) {
            get()->error("Worker {}: cannot open log file in {}: {}", worker_id, log_dir, e.what());
        }
    }

    if (sinks.empty()) return nullptr;

    auto logger = std::make_shared<spdlog::logger>(
        "worker-" + std::to_string(worker_id), sinks.begin(), sinks.end());
    logger->set_pattern(OUTPUT_PATTERN);
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::info);
    return logger;
}

void Logging::flush() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
    }
}
