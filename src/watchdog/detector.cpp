#include "watchdog/detector.hpp"
#include "watchdog/process.hpp"

CommandDetector::CommandDetector(std::string cmd, Environment env)
    : cmd_(std::move(cmd)), env_(std::move(env)) {}

bool CommandDetector::is_running() {
    auto code = run_command_quiet(cmd_, env_);
    return code && *code == 0;
}
