#include <gtest/gtest.h>
#include "watchdog/supervisor.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

std::size_t count_lines(const RingBufferLogRef& log, const std::string& line) {
    auto lines = log->snapshot();
    return static_cast<std::size_t>(std::count(lines.begin(), lines.end(), line));
}

bool has_line(const RingBufferLogRef& log, const std::string& line) {
    return count_lines(log, line) > 0;
}

/// Detector returning a scripted sequence, repeating the last value
class ScriptedDetector : public Detector {
public:
    explicit ScriptedDetector(std::deque<bool> script) : script_(std::move(script)) {}

    bool is_running() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        bool value = script_.front();
        if (script_.size() > 1) script_.pop_front();
        return value;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<bool> script_;
    int calls_ = 0;
};

class CountingKiller : public Killer {
public:
    void kill() override { ++kills; }
    std::atomic<int> kills{0};
};

WatchdogConfig external_config() {
    WatchdogConfig cfg;
    cfg.external_check_cmd = "check-app";
    return cfg;
}

} // namespace

// ── Spawn modes ─────────────────────────────────────────────

TEST(SupervisorTest, SeedsStartLinesAndRunsParallel) {
    auto sup = Supervisor::create({"sh -c \"echo one\"", "sh -c \"echo two\""}, WatchdogConfig{});
    ASSERT_EQ(sup->commands().size(), 2u);
    EXPECT_EQ(sup->commands()[0].log->snapshot().front(), "[start] sh -c \"echo one\"");
    EXPECT_TRUE(sup->is_started());

    ASSERT_TRUE(wait_until([&] { return sup->active_workers() == 0; }));
    EXPECT_TRUE(has_line(sup->commands()[0].log, "one"));
    EXPECT_TRUE(has_line(sup->commands()[1].log, "two"));
    EXPECT_EQ(sup->outcomes(), (std::vector<Outcome>{Outcome::Succeeded, Outcome::Succeeded}));
}

TEST(SupervisorTest, ParallelCommandsRunConcurrently) {
    auto start = std::chrono::steady_clock::now();
    auto sup = Supervisor::create({"sleep 0.5", "sleep 0.5", "sleep 0.5"}, WatchdogConfig{});
    ASSERT_TRUE(wait_until([&] { return sup->active_workers() == 0; }));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1400ms);
}

TEST(SupervisorTest, SequentialRunsInOrder) {
    WatchdogConfig cfg;
    cfg.sequential = true;
    auto sup = Supervisor::create({"echo first", "echo second"}, cfg);

    // Not started until reached
    EXPECT_EQ(sup->commands()[1].log->snapshot().front(), "[queued] echo second");

    ASSERT_TRUE(wait_until([&] { return sup->active_workers() == 0; }));
    EXPECT_TRUE(has_line(sup->commands()[0].log, "first"));
    EXPECT_TRUE(has_line(sup->commands()[1].log, "[start] echo second"));
    EXPECT_TRUE(has_line(sup->commands()[1].log, "second"));
}

TEST(SupervisorTest, SequentialStopOnFailureAborts) {
    WatchdogConfig cfg;
    cfg.sequential = true;
    cfg.stop_on_failure = true;
    auto sup = Supervisor::create({"true", "false", "echo third"}, cfg);
    ASSERT_TRUE(wait_until([&] { return sup->active_workers() == 0; }));

    const auto& cmds = sup->commands();
    EXPECT_TRUE(has_line(cmds[1].log, "[panic: retries exhausted]"));
    EXPECT_FALSE(has_line(cmds[2].log, "[start] echo third"));
    EXPECT_FALSE(has_line(cmds[2].log, "third"));
    EXPECT_TRUE(has_line(cmds[2].log, "[aborted by stop_on_failure]"));
    EXPECT_EQ(sup->outcomes(),
              (std::vector<Outcome>{Outcome::Succeeded, Outcome::Failed, Outcome::Pending}));
}

TEST(SupervisorTest, SequentialContinuesWithoutStopOnFailure) {
    WatchdogConfig cfg;
    cfg.sequential = true;
    auto sup = Supervisor::create({"false", "echo after"}, cfg);
    ASSERT_TRUE(wait_until([&] { return sup->active_workers() == 0; }));
    EXPECT_TRUE(has_line(sup->commands()[1].log, "after"));
}

// ── Control surface ─────────────────────────────────────────

TEST(SupervisorTest, StartIsIdempotent) {
    auto sup = Supervisor::create({"sleep 5"}, WatchdogConfig{});
    sup->start();
    sup->start();
    EXPECT_EQ(count_lines(sup->commands()[0].log, "[start] sleep 5"), 1u);
    EXPECT_EQ(sup->active_workers(), 1);
    sup->stop_all();
}

TEST(SupervisorTest, StopAllIsPrompt) {
    WatchdogConfig cfg;
    cfg.auto_restart = true;
    cfg.max_retries = 100;
    cfg.restart_delay_ms = 10000;
    auto sup = Supervisor::create({"sleep 10", "false"}, cfg);
    std::this_thread::sleep_for(300ms);

    auto start = std::chrono::steady_clock::now();
    sup->stop_all();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    EXPECT_FALSE(sup->is_started());
    EXPECT_EQ(sup->active_workers(), 0);
    EXPECT_TRUE(has_line(sup->commands()[0].log, "[stopped]"));
    EXPECT_TRUE(has_line(sup->commands()[1].log, "[stopped]"));
}

TEST(SupervisorTest, StopThenStartAgain) {
    auto sup = Supervisor::create({"sleep 5"}, WatchdogConfig{});
    sup->stop_all();
    EXPECT_FALSE(sup->is_started());
    sup->stop_all();  // second stop is a no-op

    sup->start();
    EXPECT_TRUE(sup->is_started());
    EXPECT_EQ(sup->active_workers(), 1);
    sup->stop_all();
}

TEST(SupervisorTest, SequentialStopMarksRemaining) {
    WatchdogConfig cfg;
    cfg.sequential = true;
    auto sup = Supervisor::create({"sleep 10", "echo later"}, cfg);
    ASSERT_TRUE(wait_until([&] { return has_line(sup->commands()[0].log, "[start] sleep 10"); }));
    sup->stop_all();
    EXPECT_TRUE(has_line(sup->commands()[1].log, "[stopped]"));
    EXPECT_FALSE(has_line(sup->commands()[1].log, "later"));
}

TEST(SupervisorTest, RestartClearsAndReseeds) {
    auto sup = Supervisor::create({"echo hi"}, WatchdogConfig{});
    ASSERT_TRUE(wait_until([&] { return sup->active_workers() == 0; }));
    sup->note("extra");

    EXPECT_EQ(sup->restart_all(true), ControlResult::Ok);
    auto lines = sup->commands()[0].log->snapshot();
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.front(), "[start] echo hi");
    EXPECT_FALSE(has_line(sup->commands()[0].log, "extra"));

    ASSERT_TRUE(wait_until([&] { return sup->active_workers() == 0; }));
    EXPECT_EQ(count_lines(sup->commands()[0].log, "hi"), 1u);
}

TEST(SupervisorTest, RestartWithoutClearKeepsHistory) {
    auto sup = Supervisor::create({"echo hi"}, WatchdogConfig{});
    ASSERT_TRUE(wait_until([&] { return sup->active_workers() == 0; }));
    EXPECT_EQ(sup->restart_all(false), ControlResult::Ok);
    ASSERT_TRUE(wait_until([&] { return sup->active_workers() == 0; }));
    EXPECT_EQ(count_lines(sup->commands()[0].log, "hi"), 2u);
    EXPECT_EQ(count_lines(sup->commands()[0].log, "[start] echo hi"), 2u);
}

TEST(SupervisorTest, ClearOutputs) {
    auto sup = Supervisor::create({"echo hi"}, WatchdogConfig{});
    ASSERT_TRUE(wait_until([&] { return sup->active_workers() == 0; }));
    sup->clear_outputs();
    EXPECT_EQ(sup->commands()[0].log->len(), 0u);
}

TEST(SupervisorTest, NoteReachesEveryLog) {
    auto sup = Supervisor::create({"true", "true"}, WatchdogConfig{});
    sup->note("[hello]");
    for (const auto& log : sup->logs()) EXPECT_TRUE(has_line(log, "[hello]"));
    sup->stop_all();
}

TEST(SupervisorTest, DestructorStopsWorkers) {
    RingBufferLogRef log;
    auto start = std::chrono::steady_clock::now();
    {
        auto sup = Supervisor::create({"sleep 10"}, WatchdogConfig{});
        log = sup->commands()[0].log;
        std::this_thread::sleep_for(100ms);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_TRUE(has_line(log, "[stopped]"));
}

// ── External mode ───────────────────────────────────────────

TEST(SupervisorTest, ExternalReportsTransitions) {
    auto detector = std::make_shared<ScriptedDetector>(std::deque<bool>{true, false, true});
    Supervisor::Collaborators collab;
    collab.detector = detector;
    collab.poll_interval = 20ms;

    auto sup = Supervisor::create({"check-app"}, external_config(), collab);
    EXPECT_TRUE(sup->is_external());
    ASSERT_TRUE(wait_until([&] { return detector->calls() >= 6; }));
    sup->stop_all();

    auto log = sup->commands()[0].log;
    EXPECT_TRUE(has_line(log, "[external mode] will not spawn commands"));
    EXPECT_FALSE(has_line(log, "[start] check-app"));
    // One initial status, then two transitions
    EXPECT_EQ(count_lines(log, "[external] running (detected)"), 2u);
    EXPECT_EQ(count_lines(log, "[external] not running"), 1u);
}

TEST(SupervisorTest, ExternalSeedIsNoteOnly) {
    auto detector = std::make_shared<ScriptedDetector>(std::deque<bool>{true});
    Supervisor::Collaborators collab;
    collab.detector = detector;
    collab.poll_interval = 20ms;

    auto sup = Supervisor::create({"check-app"}, external_config(), collab);
    sup->stop_all();

    auto lines = sup->commands()[0].log->snapshot();
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.front(), "[external mode] will not spawn commands");
    EXPECT_EQ(std::count_if(lines.begin(), lines.end(),
                            [](const std::string& l) { return l.rfind("[start]", 0) == 0; }), 0);
}

TEST(SupervisorTest, ExternalSteadyStateLogsOnce) {
    auto detector = std::make_shared<ScriptedDetector>(std::deque<bool>{false});
    Supervisor::Collaborators collab;
    collab.detector = detector;
    collab.poll_interval = 20ms;

    auto sup = Supervisor::create({"check-app"}, external_config(), collab);
    ASSERT_TRUE(wait_until([&] { return detector->calls() >= 5; }));
    EXPECT_FALSE(sup->is_external_running());
    sup->stop_all();
    EXPECT_EQ(count_lines(sup->commands()[0].log, "[external] not running"), 1u);
}

TEST(SupervisorTest, ExternalRunningFlag) {
    auto detector = std::make_shared<ScriptedDetector>(std::deque<bool>{true});
    Supervisor::Collaborators collab;
    collab.detector = detector;
    collab.poll_interval = 20ms;

    auto sup = Supervisor::create({"check-app"}, external_config(), collab);
    EXPECT_TRUE(wait_until([&] { return sup->is_external_running(); }));
    sup->stop_all();
}

TEST(SupervisorTest, ExternalRestartUnsupported) {
    auto detector = std::make_shared<ScriptedDetector>(std::deque<bool>{true});
    Supervisor::Collaborators collab;
    collab.detector = detector;
    collab.poll_interval = 20ms;

    auto sup = Supervisor::create({"check-app"}, external_config(), collab);
    EXPECT_EQ(sup->restart_all(false), ControlResult::Unsupported);
    EXPECT_TRUE(has_line(sup->commands()[0].log, "[external mode] restart not supported"));
    sup->stop_all();
}

TEST(SupervisorTest, ExternalKillInvokesKiller) {
    auto detector = std::make_shared<ScriptedDetector>(std::deque<bool>{true});
    auto killer = std::make_shared<CountingKiller>();
    Supervisor::Collaborators collab;
    collab.detector = detector;
    collab.killer = killer;
    collab.poll_interval = 20ms;

    auto sup = Supervisor::create({"check-app"}, external_config(), collab);
    EXPECT_TRUE(sup->kill_external());
    EXPECT_EQ(killer->kills.load(), 1);
    EXPECT_TRUE(has_line(sup->commands()[0].log, "[external] kill invoked"));
    sup->stop_all();
}

TEST(SupervisorTest, ExternalKillWithoutCommand) {
    auto detector = std::make_shared<ScriptedDetector>(std::deque<bool>{true});
    Supervisor::Collaborators collab;
    collab.detector = detector;
    collab.poll_interval = 20ms;

    auto sup = Supervisor::create({"check-app"}, external_config(), collab);
    EXPECT_FALSE(sup->kill_external());
    EXPECT_FALSE(has_line(sup->commands()[0].log, "[external] kill invoked"));
    sup->stop_all();
}

TEST(SupervisorTest, KillExternalOutsideExternalMode) {
    auto sup = Supervisor::create({"sleep 5"}, WatchdogConfig{});
    EXPECT_FALSE(sup->kill_external());
    sup->stop_all();
}

TEST(SupervisorTest, ExternalWithCommandDetector) {
    WatchdogConfig cfg;
    cfg.external_check_cmd = "true";
    Supervisor::Collaborators collab;
    collab.poll_interval = 50ms;

    auto sup = Supervisor::create({"true"}, cfg, collab);
    EXPECT_TRUE(wait_until([&] { return sup->is_external_running(); }));
    sup->stop_all();
    EXPECT_TRUE(has_line(sup->commands()[0].log, "[external] running (detected)"));
}

// ── Pluggable spawner ───────────────────────────────────────

namespace {

class ThrowingSpawner : public Spawner {
public:
    bool run_with_retries(RingBufferLog&, const std::string&, const WatchdogConfig&,
                          const std::atomic<bool>&) override {
        throw std::runtime_error("boom");
    }
};

} // namespace

TEST(SupervisorTest, SpawnerExceptionIsLogged) {
    Supervisor::Collaborators collab;
    collab.spawner = std::make_shared<ThrowingSpawner>();
    auto sup = Supervisor::create({"anything"}, WatchdogConfig{}, collab);
    ASSERT_TRUE(wait_until([&] { return sup->active_workers() == 0; }));
    EXPECT_TRUE(has_line(sup->commands()[0].log, "[error] boom"));
    EXPECT_EQ(sup->outcomes(), std::vector<Outcome>{Outcome::Failed});
}
