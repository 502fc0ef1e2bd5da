#pragma once

#include "core/environment.hpp"
#include "watchdog/detector.hpp"
#include "watchdog/killer.hpp"
#include "watchdog/ring_buffer_log.hpp"
#include "watchdog/spawner.hpp"
#include "watchdog/watchdog_config.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/// Outcome of a control request that external mode may refuse
enum class ControlResult { Ok, Unsupported };

/// Result of the latest run of one command
enum class Outcome { Pending, Succeeded, Failed };

struct CommandLog {
    std::string cmdline;  // unexpanded template
    RingBufferLogRef log;
};

/// Owns one job's commands, logs and worker threads, and is the single
/// control surface for them. Shared between the panel rendering it and the
/// SessionRegistry; every public method is safe to call from any thread.
///
/// Control requests (start/stop/restart/kill/clear) are serialized by an
/// internal mutex that background threads never take, so status reads and
/// log reads from the render thread never wait on a backoff sleep.
class Supervisor {
public:
    struct Collaborators {
        Environment env;
        std::shared_ptr<Spawner> spawner;    // default: LocalSpawner(env)
        std::shared_ptr<Detector> detector;  // default: CommandDetector(check cmd)
        std::shared_ptr<Killer> killer;      // default: CommandKiller(kill cmd) if configured
        std::chrono::milliseconds poll_interval{1000};
    };

    static std::shared_ptr<Supervisor> create(std::vector<std::string> cmdlines, WatchdogConfig cfg);
    static std::shared_ptr<Supervisor> create(std::vector<std::string> cmdlines, WatchdogConfig cfg,
                                              Collaborators collab);

    ~Supervisor();
    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// Start workers (or the external poller); no-op while started
    void start();

    /// Stop and join every thread. Latency is bounded by the spawner tick.
    void stop_all();

    void clear_outputs();

    /// Stop, optionally clear, re-seed and start again.
    /// Refused in external mode: the process is not ours to restart.
    ControlResult restart_all(bool clear);

    /// Run the external kill command. False outside external mode or when no
    /// kill command is configured.
    bool kill_external();

    /// Append a line to every command log
    void note(const std::string& line);

    const std::vector<CommandLog>& commands() const { return commands_; }
    std::vector<RingBufferLogRef> logs() const;
    const WatchdogConfig& config() const { return cfg_; }

    bool is_started() const { return started_.load(); }
    bool is_external() const { return external_; }
    bool is_external_running() const { return external_running_.load(); }

    /// Worker or orchestrator threads still running a command
    int active_workers() const { return active_workers_.load(); }

    /// Per-command result of the current run; commands never reached stay Pending
    std::vector<Outcome> outcomes() const;

private:
    Supervisor(std::vector<std::string> cmdlines, WatchdogConfig cfg, Collaborators collab);

    struct Worker {
        std::atomic<bool> stop{false};
        std::atomic<Outcome> outcome{Outcome::Pending};
        std::thread handle;
    };

    const WatchdogConfig cfg_;
    std::vector<CommandLog> commands_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::thread seq_handle_;

    std::shared_ptr<Spawner> spawner_;
    std::shared_ptr<Detector> detector_;
    std::shared_ptr<Killer> killer_;
    std::chrono::milliseconds poll_interval_;

    const bool external_;
    std::atomic<bool> external_running_{false};
    std::atomic<bool> external_stop_{false};
    std::thread external_handle_;

    std::mutex control_mutex_;
    std::atomic<bool> started_{false};
    std::atomic<int> active_workers_{0};

    void seed_logs();
    void start_locked();
    void stop_locked();
    void spawn_parallel();
    void spawn_sequential();
    void start_external_poller();
    void poll_external();

    /// Run one command under the spawner, logging anything it throws
    bool run_command(std::size_t idx);
};

using SupervisorRef = std::shared_ptr<Supervisor>;
