#include "watchdog/stats_aggregator.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>

StatsAggregator::StatsAggregator(const std::vector<StatPattern>& patterns, std::size_t log_count)
    : cursors_(log_count) {
    for (const auto& p : patterns) {
        try {
            patterns_.push_back(Pattern{p.label, std::regex(p.regexp)});
        } catch (const std::regex_error& e) {
            spdlog::debug("[stats] dropping pattern '{}' ({}): {}", p.label, p.regexp, e.what());
        }
    }
    counts_.assign(patterns_.size(), 0);
}

std::vector<std::string> StatsAggregator::labels() const {
    std::vector<std::string> out;
    out.reserve(patterns_.size());
    for (const auto& p : patterns_) out.push_back(p.label);
    return out;
}

void StatsAggregator::count_line(const std::string& line) {
    // std::regex recurses per character; never scan past the output line cap
    auto last = line.begin() + static_cast<std::ptrdiff_t>(std::min(line.size(), MAX_LINE_BYTES));
    for (std::size_t i = 0; i < patterns_.size(); ++i) {
        auto begin = std::sregex_iterator(line.begin(), last, patterns_[i].re);
        counts_[i] += static_cast<std::size_t>(std::distance(begin, std::sregex_iterator()));
    }
}

void StatsAggregator::update_from_buffers(const std::vector<RingBufferLogRef>& logs) {
    if (cursors_.size() < logs.size()) cursors_.resize(logs.size());

    // Grab every tail first so the shrink check and the scan see the same state
    std::vector<RingBufferLog::Tail> tails;
    tails.reserve(logs.size());
    bool need_full = false;
    for (std::size_t i = 0; i < logs.size(); ++i) {
        tails.push_back(logs[i]->tail_since(cursors_[i].pushed));
        const auto& t = tails.back();
        if (t.generation != cursors_[i].generation || t.len < cursors_[i].len) {
            need_full = true;
        }
    }

    if (need_full) {
        recompute(logs);
        return;
    }

    for (std::size_t i = 0; i < logs.size(); ++i) {
        for (const auto& line : tails[i].lines) count_line(line);
        cursors_[i].pushed = tails[i].pushed;
        cursors_[i].len = tails[i].len;
    }
}

void StatsAggregator::recompute(const std::vector<RingBufferLogRef>& logs) {
    std::fill(counts_.begin(), counts_.end(), 0);
    for (std::size_t i = 0; i < logs.size(); ++i) {
        // A zero cursor returns every line still held, with a consistent
        // generation/pushed pair for the next incremental pass
        auto all = logs[i]->tail_since(0);
        for (const auto& line : all.lines) count_line(line);
        cursors_[i] = Cursor{all.generation, all.pushed, all.len};
    }
}
