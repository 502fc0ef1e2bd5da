#include "watchdog/supervisor.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

std::shared_ptr<Supervisor> Supervisor::create(std::vector<std::string> cmdlines, WatchdogConfig cfg) {
    return create(std::move(cmdlines), std::move(cfg), Collaborators{});
}

std::shared_ptr<Supervisor> Supervisor::create(std::vector<std::string> cmdlines, WatchdogConfig cfg,
                                               Collaborators collab) {
    std::shared_ptr<Supervisor> sup(new Supervisor(std::move(cmdlines), std::move(cfg), std::move(collab)));

    std::lock_guard<std::mutex> lock(sup->control_mutex_);
    sup->seed_logs();
    sup->start_locked();
    return sup;
}

Supervisor::Supervisor(std::vector<std::string> cmdlines, WatchdogConfig cfg, Collaborators collab)
    : cfg_(std::move(cfg)),
      spawner_(std::move(collab.spawner)),
      detector_(std::move(collab.detector)),
      killer_(std::move(collab.killer)),
      poll_interval_(collab.poll_interval),
      external_(cfg_.is_external()) {
    for (auto& cmd : cmdlines) {
        commands_.push_back(CommandLog{std::move(cmd), std::make_shared<RingBufferLog>()});
        workers_.push_back(std::make_unique<Worker>());
    }

    if (!spawner_) {
        spawner_ = std::make_shared<LocalSpawner>(collab.env);
    }
    if (external_) {
        if (!detector_) {
            detector_ = std::make_shared<CommandDetector>(*cfg_.external_check_cmd, collab.env);
        }
        if (!killer_ && cfg_.external_kill_cmd) {
            killer_ = std::make_shared<CommandKiller>(*cfg_.external_kill_cmd, collab.env);
        }
    }
}

Supervisor::~Supervisor() {
    stop_all();
}

void Supervisor::seed_logs() {
    if (external_) {
        // Nothing is spawned, so no command gets a [start] line
        note("[external mode] will not spawn commands");
        return;
    }
    // A sequential command has not started until the orchestrator reaches it,
    // and a command skipped by stop_on_failure must never show [start].
    // spawn_sequential() writes the [start] line when it gets there.
    const char* tag = cfg_.sequential ? "[queued] " : "[start] ";
    for (auto& c : commands_) {
        c.log->push_line(tag + c.cmdline);
    }
}

void Supervisor::start() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (started_.load()) return;
    start_locked();
}

void Supervisor::start_locked() {
    started_.store(true);
    if (external_) {
        start_external_poller();
        return;
    }

    // Reset stop flags
    for (auto& w : workers_) {
        w->stop.store(false);
        w->outcome.store(Outcome::Pending);
    }
    if (cfg_.sequential) {
        spawn_sequential();
    } else {
        spawn_parallel();
    }
    spdlog::info("[watchdog] started {} command(s), {}", commands_.size(),
                 cfg_.sequential ? "sequential" : "parallel");
}

void Supervisor::stop_all() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    stop_locked();
}

void Supervisor::stop_locked() {
    // Request stop; running children are killed by their spawner loop
    for (auto& w : workers_) {
        w->stop.store(true);
    }

    if (seq_handle_.joinable()) {
        seq_handle_.join();
    }
    for (auto& w : workers_) {
        if (w->handle.joinable()) {
            w->handle.join();
        }
    }

    // Stop the external detector, if any
    external_stop_.store(true);
    if (external_handle_.joinable()) {
        external_handle_.join();
    }

    if (started_.exchange(false)) {
        spdlog::info("[watchdog] stopped");
    }
}

void Supervisor::clear_outputs() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    for (auto& c : commands_) {
        c.log->clear();
    }
}

ControlResult Supervisor::restart_all(bool clear) {
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (external_) {
        // Not spawned by us, nothing to restart
        if (clear) {
            for (auto& c : commands_) c.log->clear();
        }
        note("[external mode] restart not supported");
        return ControlResult::Unsupported;
    }

    stop_locked();
    if (clear) {
        for (auto& c : commands_) c.log->clear();
    }
    // Seed after clear for visibility
    seed_logs();
    start_locked();
    return ControlResult::Ok;
}

bool Supervisor::kill_external() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!external_ || !killer_) {
        return false;
    }
    killer_->kill();
    note("[external] kill invoked");
    return true;
}

void Supervisor::note(const std::string& line) {
    for (auto& c : commands_) {
        c.log->push_line(line);
    }
}

std::vector<Outcome> Supervisor::outcomes() const {
    std::vector<Outcome> out;
    out.reserve(workers_.size());
    for (const auto& w : workers_) out.push_back(w->outcome.load());
    return out;
}

std::vector<RingBufferLogRef> Supervisor::logs() const {
    std::vector<RingBufferLogRef> out;
    out.reserve(commands_.size());
    for (const auto& c : commands_) out.push_back(c.log);
    return out;
}

bool Supervisor::run_command(std::size_t idx) {
    CommandLog& cmd = commands_[idx];
    bool ok = false;
    try {
        ok = spawner_->run_with_retries(*cmd.log, cmd.cmdline, cfg_, workers_[idx]->stop);
    } catch (const std::exception& e) {
        cmd.log->push_line(std::string("[error] ") + e.what());
        spdlog::error("[watchdog] '{}' failed: {}", cmd.cmdline, e.what());
    }
    workers_[idx]->outcome.store(ok ? Outcome::Succeeded : Outcome::Failed);
    return ok;
}

void Supervisor::spawn_parallel() {
    // One thread per command, each with its own retries
    for (std::size_t idx = 0; idx < commands_.size(); ++idx) {
        active_workers_.fetch_add(1);
        workers_[idx]->handle = std::thread([this, idx]() {
            run_command(idx);
            active_workers_.fetch_sub(1);
        });
    }
}

void Supervisor::spawn_sequential() {
    active_workers_.fetch_add(1);
    seq_handle_ = std::thread([this]() {
        for (std::size_t idx = 0; idx < commands_.size(); ++idx) {
            if (workers_[idx]->stop.load()) {
                // Stop requested before this command was reached
                for (std::size_t rest = idx; rest < commands_.size(); ++rest) {
                    commands_[rest].log->push_line("[stopped]");
                }
                break;
            }

            commands_[idx].log->push_line("[start] " + commands_[idx].cmdline);
            bool ok = run_command(idx);

            if (workers_[idx]->stop.load()) {
                // Abort remaining
                for (std::size_t rest = idx + 1; rest < commands_.size(); ++rest) {
                    commands_[rest].log->push_line("[stopped]");
                }
                break;
            }
            if (!ok && cfg_.stop_on_failure) {
                for (std::size_t rest = idx + 1; rest < commands_.size(); ++rest) {
                    commands_[rest].log->push_line("[aborted by stop_on_failure]");
                }
                spdlog::warn("[watchdog] '{}' failed, aborting sequence", commands_[idx].cmdline);
                break;
            }
        }
        active_workers_.fetch_sub(1);
    });
}

void Supervisor::start_external_poller() {
    if (external_handle_.joinable()) return;
    external_stop_.store(false);
    active_workers_.fetch_add(1);
    external_handle_ = std::thread([this]() {
        poll_external();
        active_workers_.fetch_sub(1);
    });
}

void Supervisor::poll_external() {
    // First observation is always reported, later polls only on transitions
    bool have_last = false;
    bool last = false;

    while (!external_stop_.load()) {
        bool running = false;
        try {
            running = detector_->is_running();
        } catch (const std::exception& e) {
            spdlog::error("[external] check failed: {}", e.what());
        }
        external_running_.store(running);

        if (!have_last || last != running) {
            note(running ? "[external] running (detected)" : "[external] not running");
            spdlog::info("[external] {}", running ? "running" : "not running");
            last = running;
            have_last = true;
        }

        auto waited = std::chrono::milliseconds(0);
        while (waited < poll_interval_ && !external_stop_.load()) {
            auto step = std::min(LocalSpawner::TICK, poll_interval_ - waited);
            std::this_thread::sleep_for(step);
            waited += step;
        }
    }
}
