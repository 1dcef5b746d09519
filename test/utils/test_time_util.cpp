/*
 * test_time_util.cpp
 *
 *  Created on: Sep 25, 2026
 */
#include <moxe/utils/time_util.hpp>

#include <gtest/gtest.h>

namespace moxe
{
	TEST(TestTimeUtil, format_time)
	{
		EXPECT_EQ(formatTime(3600 + 60 + 1.234), "01:01:01");
		EXPECT_EQ(formatTime(11 * 3600 + 12 * 60 + 50.4, 1), "11:12:50");
		EXPECT_EQ(formatTime(0.0123, 1), "12.3ms");
		EXPECT_EQ(formatTime(0.5), "500ms");
		EXPECT_EQ(formatTime(0.0), "0ms");
	}
	TEST(TestTimeUtil, get_time)
	{
		const double start = getTime();
		EXPECT_GE(getTime(), start);
	}

} /* namespace moxe */
