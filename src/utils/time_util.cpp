/*
 * time_util.cpp
 *
 *  Created on: Sep 18, 2026
 */

#include <moxe/utils/time_util.hpp>

#include <chrono>
#include <cstdio>

double getTime()
{
	const auto current_time = std::chrono::steady_clock::now();
	return std::chrono::duration<double>(current_time.time_since_epoch()).count();
}
std::string formatTime(double seconds, int precision)
{
	if (seconds < 1.0)
	{
		char buffer[32];
		std::snprintf(buffer, sizeof(buffer), "%.*fms", precision, seconds * 1.0e3);
		return std::string(buffer);
	}

	const int s = static_cast<int>(seconds) % 60;
	const int m = (static_cast<int>(seconds) % 3600) / 60;
	const int h = static_cast<int>(seconds) / 3600;

	char buffer[64];
	std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d", h, m, s);
	return std::string(buffer);
}
