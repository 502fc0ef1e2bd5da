#pragma once

#include "core/environment.hpp"
#include "watchdog/ring_buffer_log.hpp"
#include "watchdog/watchdog_config.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

/// Runs one command line to completion under the retry policy of a
/// WatchdogConfig, writing its output and status notes into a log.
class Spawner {
public:
    virtual ~Spawner() = default;

    /// Returns true once an attempt exits with an allowed code.
    /// Returns false when retries are exhausted or `stop` was observed.
    virtual bool run_with_retries(RingBufferLog& log,
                                  const std::string& cmdline,
                                  const WatchdogConfig& cfg,
                                  const std::atomic<bool>& stop) = 0;
};

/// Spawner backed by local child processes
class LocalSpawner : public Spawner {
public:
    /// Granularity of exit polling and backoff sleeps
    static constexpr std::chrono::milliseconds TICK{50};

    explicit LocalSpawner(Environment env = Environment());

    bool run_with_retries(RingBufferLog& log,
                          const std::string& cmdline,
                          const WatchdogConfig& cfg,
                          const std::atomic<bool>& stop) override;

private:
    Environment env_;

    /// One attempt. Returns the exit code, nullopt if the command could not
    /// be started or died from a signal.
    std::optional<int> run_once(RingBufferLog& log, const std::string& cmdline,
                                const std::atomic<bool>& stop);

    /// Sleep `delay_ms` in TICK steps; false if `stop` was set meanwhile
    static bool backoff(std::uint64_t delay_ms, const std::atomic<bool>& stop);
};
