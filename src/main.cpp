#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "supervisor/supervisor.hpp"

#include <exception>

int main(int argc, char* argv[]) {
    Config config;
    int cli_result = CLI::run(argc, argv, config);
    if (cli_result != -1) {
        // handled by CLI (help, version, status, stop, or usage error)
        return cli_result;
    }

    Logging::init(config.data().log_level);

    try {
        Supervisor supervisor(SupervisorOptions::from_config(config.data()));
        int ret = supervisor.run();
        Logging::flush();
        return ret;
    } catch (const std::exception& e) {
        Logging::get()->critical("{}", e.what());
        Logging::flush();
        return 1;
    }
}
