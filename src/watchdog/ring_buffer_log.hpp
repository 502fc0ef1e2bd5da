#pragma once

#include "watchdog/watchdog_config.hpp"

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/// Bounded line store shared between output reader threads and the renderer.
/// Oldest lines are evicted first; input is never rejected.
class RingBufferLog {
public:
    explicit RingBufferLog(std::size_t capacity = MAX_LINES_PER_CMD);

    void push_line(std::string line);
    void clear();
    std::size_t len() const;
    std::size_t capacity() const { return capacity_; }

    std::vector<std::string> snapshot() const;
    /// Copy at most `count` lines starting at index `start`
    std::vector<std::string> slice(std::size_t start, std::size_t count) const;

    /// Lines appended after a reader last saw `pushed` total pushes.
    /// `generation` changes on every clear(); a reader holding an older
    /// generation must rescan from scratch.
    struct Tail {
        std::uint64_t generation = 0;
        std::uint64_t pushed = 0;
        std::size_t len = 0;
        std::vector<std::string> lines;
    };
    Tail tail_since(std::uint64_t seen_pushed) const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<std::string> lines_;
    std::uint64_t pushed_ = 0;      // pushes since the last clear
    std::uint64_t generation_ = 0;
};

using RingBufferLogRef = std::shared_ptr<RingBufferLog>;
