#pragma once

#include <string>

class Config;

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -1 if `config` now describes a pool to run.
    static int run(int argc, char* argv[], Config& config);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status(int argc, char* argv[]);
    static int cmd_stop(int argc, char* argv[]);
    static int parse_supervise(int argc, char* argv[], Config& config);

    /// Parse `--socket PATH` / `--config PATH` for status and stop.
    /// Returns the socket path, or empty with `err` set.
    static std::string resolve_socket(int argc, char* argv[], std::string& err);

    static bool parse_int(const std::string& text, int& out);
    static bool parse_double(const std::string& text, double& out);
    static bool is_subcommand(int argc, char* argv[], const char* name);
};
