#include <gtest/gtest.h>
#include "core/config.hpp"

#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <limits>
#include <unistd.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string original_home;
    bool had_home = false;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("restart-manager-test-config-" + std::to_string(::getpid()));
        fs::create_directories(test_dir);

        // Save and override HOME
        const char* home = std::getenv("HOME");
        if (home) {
            had_home = true;
            original_home = home;
        }
        setenv("HOME", test_dir.c_str(), 1);
    }

    void TearDown() override {
        if (had_home) {
            setenv("HOME", original_home.c_str(), 1);
        }
        fs::remove_all(test_dir);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        std::string path = test_dir + "/" + name;
        std::ofstream out(path);
        out << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultValues) {
    Config cfg;
    EXPECT_EQ(cfg.data().command, "");
    EXPECT_EQ(cfg.data().instances, 1);
    EXPECT_EQ(cfg.data().heartbeat_pattern, "");
    EXPECT_DOUBLE_EQ(cfg.data().no_output_timeout_minutes, 5.0);
    EXPECT_FALSE(cfg.data().silent);
    EXPECT_EQ(cfg.data().stagger_ms, 1000);
    EXPECT_EQ(cfg.data().poll_interval_ms, 500);
    EXPECT_EQ(cfg.data().grace_period_ms, 3000);
    EXPECT_EQ(cfg.data().log_level, "info");
    EXPECT_EQ(cfg.data().log_dir, "");
    EXPECT_EQ(cfg.data().status_socket, "");
}

TEST_F(ConfigTest, ConfigDirPath) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    std::string dir = Config::config_dir();
    EXPECT_EQ(dir, test_dir + "/.config/restart-manager");
}

TEST_F(ConfigTest, ConfigFilePath) {
    std::string path = Config::config_path();
    EXPECT_FALSE(path.empty());
    EXPECT_NE(path.find("config.yaml"), std::string::npos);
}

TEST_F(ConfigTest, LoadNonExistentReturnsFalse) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    Config cfg;
    EXPECT_FALSE(cfg.load());
    EXPECT_TRUE(cfg.last_error().empty());
}

TEST_F(ConfigTest, LoadDefaultLocation) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    fs::create_directories(Config::config_dir());
    std::ofstream(Config::config_path()) << "workers:\n  command: \"python worker.py\"\n  instances: 2\n";

    Config cfg;
    ASSERT_TRUE(cfg.load());
    EXPECT_EQ(cfg.data().command, "python worker.py");
    EXPECT_EQ(cfg.data().instances, 2);
}

TEST_F(ConfigTest, LoadAllSections) {
    std::string path = write_file("full.yaml",
        "workers:\n"
        "  command: \"./crawl.sh --fast\"\n"
        "  instances: 4\n"
        "  heartbeat_pattern: \"Progress: \\\\d+\"\n"
        "  no_output_timeout_minutes: 2.5\n"
        "  silent: true\n"
        "timing:\n"
        "  stagger_ms: 200\n"
        "  poll_interval_ms: 100\n"
        "  grace_period_ms: 1500\n"
        "  restart_backoff_ms: 500\n"
        "  max_restart_backoff_ms: 8000\n"
        "  stable_uptime_ms: 5000\n"
        "logging:\n"
        "  level: debug\n"
        "  log_dir: ~/logs\n"
        "status:\n"
        "  socket_path: ~/rm.sock\n");

    Config cfg;
    ASSERT_TRUE(cfg.load_file(path)) << cfg.last_error();
    const auto& d = cfg.data();
    EXPECT_EQ(d.command, "./crawl.sh --fast");
    EXPECT_EQ(d.instances, 4);
    EXPECT_EQ(d.heartbeat_pattern, "Progress: \\d+");
    EXPECT_DOUBLE_EQ(d.no_output_timeout_minutes, 2.5);
    EXPECT_TRUE(d.silent);
    EXPECT_EQ(d.stagger_ms, 200);
    EXPECT_EQ(d.poll_interval_ms, 100);
    EXPECT_EQ(d.grace_period_ms, 1500);
    EXPECT_EQ(d.restart_backoff_ms, 500);
    EXPECT_EQ(d.max_restart_backoff_ms, 8000);
    EXPECT_EQ(d.stable_uptime_ms, 5000);
    EXPECT_EQ(d.log_level, "debug");
    EXPECT_EQ(d.log_dir, test_dir + "/logs");
    EXPECT_EQ(d.status_socket, test_dir + "/rm.sock");
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    std::string path = write_file("partial.yaml", "timing:\n  grace_period_ms: 100\n");

    Config cfg;
    ASSERT_TRUE(cfg.load_file(path));
    EXPECT_EQ(cfg.data().grace_period_ms, 100);
    EXPECT_EQ(cfg.data().instances, 1);
    EXPECT_EQ(cfg.data().stagger_ms, 1000);
}

TEST_F(ConfigTest, MalformedFileReportsError) {
    std::string path = write_file("bad.yaml", "workers:\n  instances: [unterminated\n");

    Config cfg;
    EXPECT_FALSE(cfg.load_file(path));
    EXPECT_FALSE(cfg.last_error().empty());
    EXPECT_EQ(cfg.data().instances, 1);
}

TEST_F(ConfigTest, ExpandHome) {
    EXPECT_EQ(Config::expand_home("~/x"), test_dir + "/x");
    EXPECT_EQ(Config::expand_home("/abs/path"), "/abs/path");
    EXPECT_EQ(Config::expand_home(""), "");
}

// ── Validation ──────────────────────────────────────────────

TEST_F(ConfigTest, ValidateRequiresCommand) {
    Config cfg;
    EXPECT_NE(cfg.validate().find("command"), std::string::npos);
}

TEST_F(ConfigTest, ValidateAcceptsMinimalPool) {
    Config cfg;
    cfg.data().command = "sleep 1";
    EXPECT_EQ(cfg.validate(), "");
}

TEST_F(ConfigTest, ValidateRejectsZeroInstances) {
    Config cfg;
    cfg.data().command = "sleep 1";
    cfg.data().instances = 0;
    EXPECT_NE(cfg.validate().find("instance"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRejectsNonPositiveTimeout) {
    Config cfg;
    cfg.data().command = "sleep 1";
    cfg.data().no_output_timeout_minutes = 0;
    EXPECT_FALSE(cfg.validate().empty());
}

TEST_F(ConfigTest, ValidateRejectsBadPattern) {
    Config cfg;
    cfg.data().command = "sleep 1";
    cfg.data().heartbeat_pattern = "(open";
    EXPECT_NE(cfg.validate().find("heartbeat pattern"), std::string::npos);
}

TEST_F(ConfigTest, ValidateRejectsInvertedBackoff) {
    Config cfg;
    cfg.data().command = "sleep 1";
    cfg.data().restart_backoff_ms = 5000;
    cfg.data().max_restart_backoff_ms = 1000;
    EXPECT_FALSE(cfg.validate().empty());
}

TEST_F(ConfigTest, ValidateRejectsNonFiniteTimeout) {
    Config cfg;
    cfg.data().command = "sleep 1";
    cfg.data().no_output_timeout_minutes = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(cfg.validate().empty());
    cfg.data().no_output_timeout_minutes = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(cfg.validate().empty());
}

TEST_F(ConfigTest, ValidateRejectsOversizedTimeout) {
    Config cfg;
    cfg.data().command = "sleep 1";
    cfg.data().no_output_timeout_minutes = 1e14;
    EXPECT_NE(cfg.validate().find("must not exceed"), std::string::npos);

    cfg.data().no_output_timeout_minutes = MAX_NO_OUTPUT_TIMEOUT_MINUTES;
    EXPECT_EQ(cfg.validate(), "");
}

TEST_F(ConfigTest, NonFiniteTimeoutFromFileIsRejected) {
    std::string path = write_file("inf.yaml", "workers:\n  command: \"sleep 1\"\n  no_output_timeout_minutes: .inf\n");

    Config cfg;
    ASSERT_TRUE(cfg.load_file(path)) << cfg.last_error();
    EXPECT_FALSE(cfg.validate().empty());
}
