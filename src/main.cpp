#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "app.hpp"

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);
    if (cli_result != -1) {
        // handled by CLI (help, version, list, check, run, or error)
        return cli_result;
    }

    // No subcommand → launch TUI
    Config config;
    bool loaded = config.load();

    LogOptions log_opts;
    log_opts.level = config.data().log_level;
    log_opts.file = config.data().log_file.empty()
        ? Config::default_log_path()
        : Config::expand_home(config.data().log_file);
    init_logging(log_opts);

    if (!loaded) {
        spdlog::warn("config not loaded from {}, starting with no jobs", Config::config_path());
    }

    App app(config);
    app.run();
    spdlog::shutdown();
    return 0;
}
