#include <gtest/gtest.h>
#include "driveprof/rate.hpp"

#include <limits>

using namespace driveprof;

TEST(RateTest, DividesCountByElapsedTime)
{
    const auto r = rate(int64_t(100), 4.0);
    ASSERT_TRUE(r);
    EXPECT_DOUBLE_EQ(*r, 25.0);
}

TEST(RateTest, NoRateBeforeAnyTimeElapsed)
{
    EXPECT_FALSE(rate(int64_t(100), 0.0));
    EXPECT_FALSE(rate(int64_t(100), -1.0));
    EXPECT_FALSE(rate(int64_t(100), std::numeric_limits<double>::quiet_NaN()));
}

TEST(RateTest, NoRateForUnavailableCount)
{
    EXPECT_FALSE(rate(std::nullopt, 10.0));
}

TEST(RateTest, ComputeRatesKeepsUnavailableCountersEmpty)
{
    metrics_snapshot s;
    s.transport.bytes_received = 3000;
    s.transport.bytes_transmitted = 600;
    s.transport.packets_received = 30;
    const auto r = compute_rates(s, 3.0);
    ASSERT_TRUE(r.bytes_received);
    EXPECT_DOUBLE_EQ(*r.bytes_received, 1000.0);
    ASSERT_TRUE(r.bytes_transmitted);
    EXPECT_DOUBLE_EQ(*r.bytes_transmitted, 200.0);
    ASSERT_TRUE(r.packets_received);
    EXPECT_DOUBLE_EQ(*r.packets_received, 10.0);
    EXPECT_FALSE(r.packets_transmitted);
    EXPECT_FALSE(r.packets_dropped);
}

TEST(HumanBytesTest, UsesThousandBasedUnits)
{
    EXPECT_EQ(human_bytes(1600000000), "1.60 GB");
    EXPECT_EQ(human_bytes(4200000), "4.20 MB");
    EXPECT_EQ(human_bytes(1000), "1.00 kB");
    EXPECT_EQ(human_bytes(1024), "1.02 kB");
}

TEST(HumanBytesTest, SmallValuesStayInBytes)
{
    EXPECT_EQ(human_bytes(0), "0.00 B");
    EXPECT_EQ(human_bytes(512), "512.00 B");
    EXPECT_EQ(human_bytes(999), "999.00 B");
}

TEST(HumanBytesTest, RoundingCarriesIntoNextUnit)
{
    EXPECT_EQ(human_bytes(999999), "1.00 MB");
    EXPECT_EQ(human_bytes(999990), "999.99 kB");
}

TEST(HumanBytesTest, FractionalRates)
{
    EXPECT_EQ(human_bytes(12.5), "12.50 B");
}

TEST(HumanBytesTest, RateIsScaledIndependentlyOfTotal)
{
    // Scaling the total first would give "0.80 MB" per second.
    const int64_t total = 1600000;
    const auto r = rate(total, 2.0);
    ASSERT_TRUE(r);
    EXPECT_EQ(human_bytes(double(total)), "1.60 MB");
    EXPECT_EQ(human_bytes(*r), "800.00 kB");
}

TEST(HumanBytesTest, LargestUnitIsCapped)
{
    EXPECT_EQ(human_bytes(2e21), "2000.00 EB");
}

TEST(RunningMaxTest, KeepsLargest)
{
    int64_t m = 0;
    m = running_max(m, int64_t(5));
    m = running_max(m, int64_t(3));
    EXPECT_EQ(m, 5);
}
