/*
 * test_launcher.cpp
 *
 *  Created on: Sep 22, 2026
 */
#include <moxe/core/Context.hpp>

#include <gtest/gtest.h>

int main(int argc, char *argv[])
{
	moxe::Context::setNumberOfThreads(1);
	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
