#include "statistics.hpp"

#include <gtest/gtest.h>

namespace warlens::gtest {

using namespace warlens::vision;

TEST(Statistics, MedianOfOddAndEvenSizes) {
	EXPECT_DOUBLE_EQ(median({3.0, 1.0, 2.0}), 2.0);
	EXPECT_DOUBLE_EQ(median({4.0, 1.0, 3.0, 2.0}), 2.5);
	EXPECT_DOUBLE_EQ(median({}), 0.0);
}

TEST(Statistics, TrimmedMedianDropsOutliers) {
	// Quarter at each end dropped: {10, 11, 12, 13} remain.
	EXPECT_DOUBLE_EQ(trimmedMedian({1.0, 10.0, 11.0, 12.0, 13.0, 100.0, 2.0, 200.0}), 11.5);

	// Fewer than 4 values: plain median.
	EXPECT_DOUBLE_EQ(trimmedMedian({5.0, 100.0, 6.0}), 6.0);
}

TEST(Statistics, ConsecutiveGaps) {
	const auto gaps = consecutiveGaps({1.0, 4.0, 10.0});
	ASSERT_EQ(gaps.size(), 2u);
	EXPECT_DOUBLE_EQ(gaps[0], 3.0);
	EXPECT_DOUBLE_EQ(gaps[1], 6.0);
	EXPECT_TRUE(consecutiveGaps({1.0}).empty());
}

} // namespace warlens::gtest
