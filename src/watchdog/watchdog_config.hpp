#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

/// Lines kept per command before the oldest are evicted
static constexpr std::size_t MAX_LINES_PER_CMD = 5000;

/// Longest output line kept; the rest of a longer line is dropped
static constexpr std::size_t MAX_LINE_BYTES = 4096;

/// Appended to a line cut at MAX_LINE_BYTES
static constexpr const char* TRUNCATION_MARKER = "\xE2\x80\xA6";  // U+2026

struct StatPattern {
    std::string label;
    std::string regexp;
};

/// Supervision policy for one job. Immutable once handed to a Supervisor.
struct WatchdogConfig {
    bool sequential = false;
    bool auto_restart = false;
    unsigned max_retries = 0;
    std::uint64_t restart_delay_ms = 1000;
    std::set<int> allowed_exit_codes{0};  // empty = any exit code is success
    bool stop_on_failure = false;         // sequential only
    std::optional<std::string> panic_exit_cmd;
    std::vector<StatPattern> stat_patterns;

    // External mode: nothing is spawned, the check command reports liveness
    // of a process started elsewhere (exit 0 = running).
    std::optional<std::string> external_check_cmd;
    std::optional<std::string> external_kill_cmd;

    bool is_external() const { return external_check_cmd.has_value(); }

    bool exit_code_allowed(int code) const {
        return allowed_exit_codes.empty() || allowed_exit_codes.count(code) > 0;
    }
};
