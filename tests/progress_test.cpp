#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
#include "infra/monitoring/monitoring.hpp"

using namespace parcp::infra;
using namespace std::chrono_literals;

namespace {

struct RecordingSink {
    std::mutex mutex;
    std::vector<ProgressSnapshot> seen;

    auto sink() -> ProgressSink {
        return [this](const ProgressSnapshot& snap) {
            std::lock_guard lock(mutex);
            seen.push_back(snap);
        };
    }
    auto count() -> std::size_t {
        std::lock_guard lock(mutex);
        return seen.size();
    }
};

auto wait_until_stopped(const ProgressAggregator& aggregator) -> bool {
    for (int i = 0; i < 500 && aggregator.running(); ++i) {
        std::this_thread::sleep_for(2ms);
    }
    return !aggregator.running();
}

} // namespace

TEST(ProgressAggregatorTest, SnapshotFraction)
{
    ProgressCounter counter{250};
    ProgressAggregator aggregator(counter, 1000, 50ms, nullptr);
    auto snap = aggregator.snapshot();
    EXPECT_EQ(snap.processed_bytes, 250u);
    EXPECT_DOUBLE_EQ(snap.fraction, 0.25);
    EXPECT_FALSE(snap.final);
}

TEST(ProgressAggregatorTest, EmptyJobFinishesImmediately)
{
    ProgressCounter counter{0};
    RecordingSink rec;
    ProgressAggregator aggregator(counter, 0, 50ms, rec.sink());
    aggregator.start();
    ASSERT_TRUE(wait_until_stopped(aggregator));
    aggregator.stop();

    ASSERT_EQ(rec.count(), 1u);
    EXPECT_TRUE(rec.seen[0].final);
    EXPECT_DOUBLE_EQ(rec.seen[0].fraction, 1.0);
}

TEST(ProgressAggregatorTest, TerminatesWhenCounterReachesTotal)
{
    ProgressCounter counter{0};
    RecordingSink rec;
    ProgressAggregator aggregator(counter, 4096, 1ms, rec.sink());
    aggregator.start();

    std::thread worker([&] {
        for (int i = 0; i < 4; ++i) {
            counter.fetch_add(1024, std::memory_order_relaxed);
            std::this_thread::sleep_for(3ms);
        }
    });
    worker.join();

    ASSERT_TRUE(wait_until_stopped(aggregator));
    const auto samples = aggregator.samples();
    aggregator.stop();
    // stop() после самостоятельного завершения не добавляет отчётов
    EXPECT_EQ(aggregator.samples(), samples);

    std::lock_guard lock(rec.mutex);
    ASSERT_FALSE(rec.seen.empty());
    EXPECT_TRUE(rec.seen.back().final);
    EXPECT_EQ(rec.seen.back().processed_bytes, 4096u);
    for (std::size_t i = 0; i + 1 < rec.seen.size(); ++i) {
        EXPECT_FALSE(rec.seen[i].final);
    }
}

TEST(ProgressAggregatorTest, StopAtJoinBarrierEmitsFinalSnapshot)
{
    // Задание упало на полпути: счётчик не дойдёт до total
    ProgressCounter counter{512};
    RecordingSink rec;
    ProgressAggregator aggregator(counter, 1024, 1h, rec.sink());
    aggregator.start();
    std::this_thread::sleep_for(5ms);

    const auto started = std::chrono::steady_clock::now();
    aggregator.stop();
    // Интервал опроса не задерживает stop()
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_FALSE(aggregator.running());

    std::lock_guard lock(rec.mutex);
    ASSERT_GE(rec.seen.size(), 1u);
    EXPECT_TRUE(rec.seen.back().final);
    EXPECT_DOUBLE_EQ(rec.seen.back().fraction, 0.5);
}

TEST(ProgressAggregatorTest, NotStartedMeansNoReports)
{
    ProgressCounter counter{0};
    RecordingSink rec;
    {
        ProgressAggregator aggregator(counter, 100, 1ms, rec.sink());
    }
    EXPECT_EQ(rec.count(), 0u);
}
