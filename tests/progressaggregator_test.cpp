#include <gtest/gtest.h>

#include "http_test_server.h"

import emularr.core.progressaggregator;

using emularr::test::waitUntil;

TEST(ProgressAggregator, ComputesRateAndEta)
{
    const ProgressSample s = ProgressAggregator::compute(1000, 6000, 500, 26000);
    EXPECT_EQ(s.downloadedBytes, 6000);
    EXPECT_EQ(s.bytesPerSecond, 10000);
    EXPECT_EQ(s.etaSeconds, 2);
    EXPECT_DOUBLE_EQ(s.fraction, 6000.0 / 26000.0);
}

TEST(ProgressAggregator, UnknownTotalIsIndeterminate)
{
    const ProgressSample s = ProgressAggregator::compute(0, 4096, 1000, 0);
    EXPECT_EQ(s.bytesPerSecond, 4096);
    EXPECT_EQ(s.etaSeconds, -1);
    EXPECT_DOUBLE_EQ(s.fraction, -1.0);
}

TEST(ProgressAggregator, StalledTransferHasNoEta)
{
    const ProgressSample s = ProgressAggregator::compute(500, 500, 500, 1000);
    EXPECT_EQ(s.bytesPerSecond, 0);
    EXPECT_EQ(s.etaSeconds, -1);
    EXPECT_DOUBLE_EQ(s.fraction, 0.5);
}

TEST(ProgressAggregator, ZeroElapsedGivesNoRate)
{
    const ProgressSample s = ProgressAggregator::compute(0, 100, 0, 1000);
    EXPECT_EQ(s.bytesPerSecond, 0);
    EXPECT_EQ(s.etaSeconds, -1);
}

TEST(ProgressAggregator, FractionIsClamped)
{
    EXPECT_DOUBLE_EQ(ProgressAggregator::compute(0, 1200, 100, 1000).fraction, 1.0);
}

TEST(ProgressAggregator, SamplesOnTimer)
{
    ProgressAggregator aggregator;
    EXPECT_EQ(aggregator.intervalMs(), ProgressAggregator::kDefaultIntervalMs);
    aggregator.setIntervalMs(10);

    qint64 counter = 0;
    int samples = 0;
    QObject::connect(&aggregator, &ProgressAggregator::sampled, [&](const ProgressSample&) {
        ++samples;
        counter += 100;
    });

    aggregator.start([&] { return counter; }, 10000);
    EXPECT_TRUE(aggregator.isRunning());
    ASSERT_TRUE(waitUntil([&] { return samples >= 3; }, 5000));
    EXPECT_GT(aggregator.lastSample().downloadedBytes, 0);
    EXPECT_GT(aggregator.lastSample().fraction, 0.0);

    aggregator.stop();
    EXPECT_FALSE(aggregator.isRunning());
    EXPECT_EQ(aggregator.lastSample().bytesPerSecond, 0);
    EXPECT_EQ(aggregator.lastSample().etaSeconds, -1);
}

TEST(ProgressAggregator, IntervalHasLowerBound)
{
    ProgressAggregator aggregator;
    aggregator.setIntervalMs(0);
    EXPECT_EQ(aggregator.intervalMs(), 1);
}
