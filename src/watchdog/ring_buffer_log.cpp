#include "watchdog/ring_buffer_log.hpp"

#include <algorithm>

RingBufferLog::RingBufferLog(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void RingBufferLog::push_line(std::string line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
    ++pushed_;
    while (lines_.size() > capacity_) {
        lines_.pop_front();
    }
}

void RingBufferLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
    pushed_ = 0;
    ++generation_;
}

std::size_t RingBufferLog::len() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

std::vector<std::string> RingBufferLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(lines_.begin(), lines_.end());
}

std::vector<std::string> RingBufferLog::slice(std::size_t start, std::size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (start >= lines_.size()) return {};
    std::size_t end = std::min(lines_.size(), start + count);
    return std::vector<std::string>(lines_.begin() + start, lines_.begin() + end);
}

RingBufferLog::Tail RingBufferLog::tail_since(std::uint64_t seen_pushed) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Tail tail;
    tail.generation = generation_;
    tail.pushed = pushed_;
    tail.len = lines_.size();
    if (seen_pushed >= pushed_) return tail;

    // Lines evicted before the reader caught up are gone; take what is left
    std::uint64_t fresh = std::min<std::uint64_t>(pushed_ - seen_pushed, lines_.size());
    tail.lines.assign(lines_.end() - static_cast<std::ptrdiff_t>(fresh), lines_.end());
    return tail;
}
