#include "watchdog/spawner.hpp"
#include "watchdog/process.hpp"
#include "core/cmdline.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

LocalSpawner::LocalSpawner(Environment env) : env_(std::move(env)) {}

bool LocalSpawner::run_with_retries(RingBufferLog& log,
                                    const std::string& cmdline,
                                    const WatchdogConfig& cfg,
                                    const std::atomic<bool>& stop) {
    unsigned attempt = 0;
    while (true) {
        if (stop.load()) {
            // Aborted before start
            log.push_line("[stopped]");
            return false;
        }

        std::optional<int> code = run_once(log, cmdline, stop);
        if (code && cfg.exit_code_allowed(*code)) {
            log.push_line("[done]");
            return true;
        }

        // Failure path
        if (stop.load()) {
            log.push_line("[stopped]");
            return false;
        }

        if (cfg.auto_restart && attempt < cfg.max_retries) {
            unsigned next = attempt + 1;
            log.push_line("[retry " + std::to_string(next) + "/" + std::to_string(cfg.max_retries) +
                          " in " + std::to_string(cfg.restart_delay_ms) + "ms]");
            spdlog::debug("[watchdog] retry {}/{} for '{}'", next, cfg.max_retries, cmdline);

            if (!backoff(cfg.restart_delay_ms, stop)) {
                log.push_line("[stopped]");
                return false;
            }
            attempt = next;
            continue;
        }

        log.push_line("[panic: retries exhausted]");
        spdlog::warn("[watchdog] retries exhausted for '{}'", cmdline);
        if (cfg.panic_exit_cmd) {
            log.push_line("[panic hook] running: " + *cfg.panic_exit_cmd);
            // Best effort, result intentionally unused
            (void)run_command_quiet(*cfg.panic_exit_cmd, env_);
        }
        return false;
    }
}

std::optional<int> LocalSpawner::run_once(RingBufferLog& log, const std::string& cmdline,
                                          const std::atomic<bool>& stop) {
    auto argv = split_command_line(env_.expand(cmdline));
    if (!argv || argv->empty()) {
        log.push_line("[error] empty command");
        return std::nullopt;
    }

    std::string error;
    auto child = ChildProcess::spawn(*argv, error);
    if (!child) {
        log.push_line("[spawn error] " + error);
        return std::nullopt;
    }

    // Concurrently drain stdout and stderr. On stop the readers give up once
    // the pipes go idle, so a grandchild holding them open cannot stall us.
    std::thread out_reader([&log, &stop, fd = child->stdout_fd()]() {
        read_lines(fd, [&log](std::string line) { log.push_line(std::move(line)); }, &stop);
    });
    std::thread err_reader([&log, &stop, fd = child->stderr_fd()]() {
        read_lines(fd, [&log](std::string line) { log.push_line("[stderr] " + line); }, &stop);
    });

    // Wait for the child but stay responsive to stop
    ExitStatus status;
    while (true) {
        if (stop.load()) {
            child->kill();
        }
        if (auto done = child->try_wait()) {
            status = *done;
            break;
        }
        std::this_thread::sleep_for(TICK);
    }

    out_reader.join();
    err_reader.join();

    if (status.code) {
        log.push_line("[exit " + std::to_string(*status.code) + "]");
    } else if (status.signal != 0) {
        log.push_line("[killed by signal " + std::to_string(status.signal) + "]");
    }
    return status.code;
}

bool LocalSpawner::backoff(std::uint64_t delay_ms, const std::atomic<bool>& stop) {
    std::uint64_t waited = 0;
    const std::uint64_t tick = static_cast<std::uint64_t>(TICK.count());
    while (waited < delay_ms) {
        if (stop.load()) return false;
        std::uint64_t step = std::min(tick, delay_ms - waited);
        std::this_thread::sleep_for(std::chrono::milliseconds(step));
        waited += step;
    }
    return !stop.load();
}
