#include "watchdog/killer.hpp"
#include "watchdog/process.hpp"

#include <spdlog/spdlog.h>

CommandKiller::CommandKiller(std::string cmd, Environment env)
    : cmd_(std::move(cmd)), env_(std::move(env)) {}

void CommandKiller::kill() {
    auto code = run_command_quiet(cmd_, env_);
    if (code) {
        spdlog::info("[external] kill command '{}' exited {}", cmd_, *code);
    } else {
        spdlog::warn("[external] kill command '{}' did not run to completion", cmd_);
    }
}
