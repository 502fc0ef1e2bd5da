#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "watchdog/supervisor.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <thread>
#include <vector>
#include <signal.h>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

using json = nlohmann::json;

namespace {

std::atomic<bool> g_run_stop{false};

void run_signal_handler(int /*sig*/) {
    g_run_stop.store(true);
}

// Print lines appended to each log since the last call, prefixed by pane index
void drain_logs(const std::vector<CommandLog>& cmds, std::vector<std::uint64_t>& seen) {
    for (std::size_t i = 0; i < cmds.size(); ++i) {
        auto tail = cmds[i].log->tail_since(seen[i]);
        if (tail.pushed < seen[i]) {
            // Log was cleared under us; print everything it holds now
            tail = cmds[i].log->tail_since(0);
        }
        for (const auto& line : tail.lines) {
            std::cout << "[" << i << "] " << line << "\n";
        }
        seen[i] = tail.pushed;
    }
    std::cout.flush();
}

} // namespace

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return -1;  // no subcommand → launch TUI

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "list") == 0) {
        return cmd_list(argc, argv);
    }
    if (std::strcmp(cmd, "check") == 0) {
        return cmd_check();
    }
    if (std::strcmp(cmd, "run") == 0) {
        return cmd_run(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'chi-watchdog help' for usage.\n";
    return 1;
}

void CLI::request_stop() {
    g_run_stop.store(true);
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "chi-watchdog - terminal supervisor for command-line jobs\n"
        "\n"
        "Usage:\n"
        "  chi-watchdog                Launch TUI (default)\n"
        "  chi-watchdog list [--json]  List configured jobs\n"
        "  chi-watchdog check          Validate the config file\n"
        "  chi-watchdog run <job-id>   Supervise a job headless, streaming its output\n"
        "  chi-watchdog version        Show version\n"
        "  chi-watchdog help           Show this help\n"
        "\n"
        "Config: " << Config::config_path() << "\n"
        "        (override with CHI_WATCHDOG_CONFIG)\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "chi-watchdog " << APP_VERSION << "\n";
    return 0;
}

// ── config helpers ──────────────────────────────────────────

bool CLI::load_config(Config& config) {
    std::string path = Config::config_path();
    if (!config.load_from(path)) {
        std::cerr << "Cannot load config: " << (path.empty() ? "(no path)" : path) << "\n";
        return false;
    }
    return true;
}

// ── list ────────────────────────────────────────────────────

int CLI::cmd_list(int argc, char* argv[]) {
    bool as_json = argc >= 3 && std::strcmp(argv[2], "--json") == 0;

    Config config;
    if (!load_config(config)) return 1;

    const auto& jobs = config.data().jobs;

    if (as_json) {
        json out = json::array();
        for (const auto& job : jobs) {
            const WatchdogConfig& wd = job.watchdog;
            json j;
            j["id"] = job.id;
            j["title"] = job.title;
            j["commands"] = job.commands;
            j["mode"] = wd.is_external() ? "external" : (wd.sequential ? "sequential" : "parallel");
            j["auto_restart"] = wd.auto_restart;
            j["max_retries"] = wd.max_retries;
            j["restart_delay_ms"] = wd.restart_delay_ms;
            j["allowed_exit_codes"] = wd.allowed_exit_codes;
            j["stop_on_failure"] = wd.stop_on_failure;
            if (wd.external_check_cmd) j["external_check_cmd"] = *wd.external_check_cmd;
            if (wd.external_kill_cmd) j["external_kill_cmd"] = *wd.external_kill_cmd;
            if (wd.panic_exit_cmd) j["on_panic_exit_cmd"] = *wd.panic_exit_cmd;
            json stats = json::array();
            for (const auto& p : wd.stat_patterns) {
                stats.push_back({{"label", p.label}, {"regexp", p.regexp}});
            }
            j["stats"] = stats;
            out.push_back(j);
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (jobs.empty()) {
        std::cout << "No jobs configured.\n";
        return 0;
    }
    for (const auto& job : jobs) {
        const WatchdogConfig& wd = job.watchdog;
        const char* mode = wd.is_external() ? "external" : (wd.sequential ? "sequential" : "parallel");
        std::cout << job.id << "  " << job.title << "  [" << mode << ", "
                  << job.commands.size() << " command(s)]\n";
    }
    return 0;
}

// ── check ───────────────────────────────────────────────────

int CLI::cmd_check() {
    Config config;
    if (!load_config(config)) return 1;

    auto result = config.validate();
    if (!result.ok) {
        for (const auto& err : result.errors) {
            std::cerr << "error: " << err << "\n";
        }
        return 1;
    }
    std::cout << "OK: " << config.data().jobs.size() << " job(s) in " << Config::config_path() << "\n";
    return 0;
}

// ── run ─────────────────────────────────────────────────────

int CLI::cmd_run(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: chi-watchdog run <job-id>\n";
        return 1;
    }
    std::string id = argv[2];

    Config config;
    if (!load_config(config)) return 1;

    auto validation = config.validate();
    if (!validation.ok) {
        for (const auto& err : validation.errors) {
            std::cerr << "error: " << err << "\n";
        }
        return 1;
    }

    const JobSpec* job = config.find_job(id);
    if (!job) {
        std::cerr << "Unknown job: " << id << "\n";
        return 1;
    }

    LogOptions log_opts;
    log_opts.level = config.data().log_level;
    log_opts.file = config.data().log_file;
    log_opts.to_stderr = true;
    init_logging(log_opts);

    g_run_stop.store(false);
    struct sigaction sa;
    struct sigaction old_int;
    struct sigaction old_term;
    sa.sa_handler = run_signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &old_int);
    sigaction(SIGTERM, &sa, &old_term);

    spdlog::info("[run] job={} commands={}", job->id, job->supervised_commands().size());
    auto session = Supervisor::create(job->supervised_commands(), job->watchdog);

    const auto& cmds = session->commands();
    std::vector<std::uint64_t> seen(cmds.size(), 0);

    // External jobs poll until interrupted; spawned jobs end with their workers
    while (!g_run_stop.load()) {
        drain_logs(cmds, seen);
        if (!session->is_external() && session->active_workers() == 0) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    bool interrupted = g_run_stop.load();
    if (interrupted) {
        session->note("[stop requested]");
    }
    session->stop_all();
    drain_logs(cmds, seen);

    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGTERM, &old_term, nullptr);

    if (interrupted) return 130;
    if (session->is_external()) return 0;
    for (Outcome o : session->outcomes()) {
        if (o != Outcome::Succeeded) return 1;
    }
    return 0;
}
