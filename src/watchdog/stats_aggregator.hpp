#pragma once

#include "watchdog/ring_buffer_log.hpp"
#include "watchdog/watchdog_config.hpp"

#include <cstdint>
#include <regex>
#include <string>
#include <vector>

/// Counts regex matches across one or more logs. Only lines appended since
/// the previous update are scanned; a cleared log triggers a full recount.
/// Not thread-safe: owned and driven by the render thread.
class StatsAggregator {
public:
    /// Malformed patterns are dropped
    StatsAggregator(const std::vector<StatPattern>& patterns, std::size_t log_count);

    void update_from_buffers(const std::vector<RingBufferLogRef>& logs);

    std::vector<std::string> labels() const;
    const std::vector<std::size_t>& counts() const { return counts_; }
    std::size_t size() const { return patterns_.size(); }

private:
    struct Pattern {
        std::string label;
        std::regex re;
    };

    struct Cursor {
        std::uint64_t generation = 0;
        std::uint64_t pushed = 0;
        std::size_t len = 0;
    };

    std::vector<Pattern> patterns_;
    std::vector<std::size_t> counts_;
    std::vector<Cursor> cursors_;

    void recompute(const std::vector<RingBufferLogRef>& logs);
    void count_line(const std::string& line);
};
