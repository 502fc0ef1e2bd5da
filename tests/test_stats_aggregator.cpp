#include <gtest/gtest.h>
#include "watchdog/stats_aggregator.hpp"

#include <memory>

namespace {

std::vector<StatPattern> level_patterns() {
    return {{"errors", "ERROR"}, {"warnings", "WARN(ING)?"}};
}

std::vector<RingBufferLogRef> make_logs(std::size_t n, std::size_t capacity = MAX_LINES_PER_CMD) {
    std::vector<RingBufferLogRef> logs;
    for (std::size_t i = 0; i < n; ++i) logs.push_back(std::make_shared<RingBufferLog>(capacity));
    return logs;
}

} // namespace

TEST(StatsAggregatorTest, CountsAcrossLogs) {
    auto logs = make_logs(2);
    logs[0]->push_line("ERROR one");
    logs[0]->push_line("WARN two");
    logs[1]->push_line("ERROR three ERROR four");

    StatsAggregator stats(level_patterns(), logs.size());
    stats.update_from_buffers(logs);

    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats.labels(), (std::vector<std::string>{"errors", "warnings"}));
    EXPECT_EQ(stats.counts()[0], 3u);  // every match in a line counts
    EXPECT_EQ(stats.counts()[1], 1u);
}

TEST(StatsAggregatorTest, IncrementalMatchesFullRecount) {
    auto logs = make_logs(2);
    StatsAggregator incremental(level_patterns(), logs.size());

    for (int round = 0; round < 5; ++round) {
        logs[0]->push_line("ERROR r" + std::to_string(round));
        logs[1]->push_line("WARNING r" + std::to_string(round));
        logs[1]->push_line("plain");
        incremental.update_from_buffers(logs);
    }

    StatsAggregator fresh(level_patterns(), logs.size());
    fresh.update_from_buffers(logs);

    EXPECT_EQ(incremental.counts(), fresh.counts());
    EXPECT_EQ(incremental.counts()[0], 5u);
    EXPECT_EQ(incremental.counts()[1], 5u);
}

TEST(StatsAggregatorTest, NoNewLinesNoChange) {
    auto logs = make_logs(1);
    logs[0]->push_line("ERROR");
    StatsAggregator stats(level_patterns(), logs.size());
    stats.update_from_buffers(logs);
    stats.update_from_buffers(logs);
    stats.update_from_buffers(logs);
    EXPECT_EQ(stats.counts()[0], 1u);
}

TEST(StatsAggregatorTest, ClearTriggersRecount) {
    auto logs = make_logs(2);
    logs[0]->push_line("ERROR a");
    logs[0]->push_line("ERROR b");
    logs[1]->push_line("ERROR c");

    StatsAggregator stats(level_patterns(), logs.size());
    stats.update_from_buffers(logs);
    EXPECT_EQ(stats.counts()[0], 3u);

    logs[0]->clear();
    logs[0]->push_line("ERROR d");
    stats.update_from_buffers(logs);
    EXPECT_EQ(stats.counts()[0], 2u);

    StatsAggregator fresh(level_patterns(), logs.size());
    fresh.update_from_buffers(logs);
    EXPECT_EQ(stats.counts(), fresh.counts());
}

TEST(StatsAggregatorTest, ClearThenRefillToSameLength) {
    auto logs = make_logs(1);
    logs[0]->push_line("ERROR");
    StatsAggregator stats(level_patterns(), logs.size());
    stats.update_from_buffers(logs);

    // Same length as before, different content
    logs[0]->clear();
    logs[0]->push_line("fine");
    stats.update_from_buffers(logs);
    EXPECT_EQ(stats.counts()[0], 0u);
}

TEST(StatsAggregatorTest, KeepsCountingAtCapacity) {
    auto logs = make_logs(1, 4);
    for (int i = 0; i < 4; ++i) logs[0]->push_line("info");
    StatsAggregator stats(level_patterns(), logs.size());
    stats.update_from_buffers(logs);

    // Buffer is full; length stays at 4 while new lines arrive
    logs[0]->push_line("ERROR late");
    stats.update_from_buffers(logs);
    EXPECT_EQ(stats.counts()[0], 1u);
}

TEST(StatsAggregatorTest, MalformedPatternDropped) {
    std::vector<StatPattern> patterns = {{"bad", "(unclosed"}, {"ok", "ok"}};
    StatsAggregator stats(patterns, 1);
    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats.labels()[0], "ok");

    auto logs = make_logs(1);
    logs[0]->push_line("ok ok");
    stats.update_from_buffers(logs);
    EXPECT_EQ(stats.counts()[0], 2u);
}

TEST(StatsAggregatorTest, NoPatterns) {
    StatsAggregator stats({}, 1);
    auto logs = make_logs(1);
    logs[0]->push_line("anything");
    stats.update_from_buffers(logs);
    EXPECT_EQ(stats.size(), 0u);
    EXPECT_TRUE(stats.counts().empty());
}

TEST(StatsAggregatorTest, VeryLongLineCountedWithoutCrash) {
    auto logs = make_logs(1);
    logs[0]->push_line("ERROR " + std::string(100000, 'x'));
    logs[0]->push_line("ERROR short");

    StatsAggregator stats({{"errors", "ERROR.*"}}, logs.size());
    stats.update_from_buffers(logs);
    EXPECT_EQ(stats.counts()[0], 2u);

    // Full recount after a clear walks the same lines
    logs[0]->clear();
    logs[0]->push_line("ERROR " + std::string(100000, 'y'));
    stats.update_from_buffers(logs);
    EXPECT_EQ(stats.counts()[0], 1u);
}
