/*
 * random.cpp
 *
 *  Created on: Sep 18, 2026
 */

#include <moxe/utils/random.hpp>
#include <moxe/core/moxe_exceptions.hpp>

#include <random>
#include <chrono>

namespace
{
#ifdef NDEBUG
	thread_local std::mt19937 int32_generator(std::chrono::system_clock::now().time_since_epoch().count());
	thread_local std::mt19937_64 int64_generator(std::chrono::system_clock::now().time_since_epoch().count());
#else
	thread_local std::mt19937 int32_generator(0);
	thread_local std::mt19937_64 int64_generator(0);
#endif
}

namespace moxe
{
	double randDouble()
	{
		std::uniform_real_distribution<double> dist(0.0, 1.0);
		return dist(int64_generator);
	}
	float randGaussian(float mean, float stddev)
	{
		std::normal_distribution<float> dist(mean, stddev);
		return dist(int32_generator);
	}
	int32_t randInt(int r)
	{
		if (r <= 0)
			throw IllegalArgument(METHOD_NAME, "r", "must be positive", r);
		std::uniform_int_distribution<int32_t> dist(0, r - 1);
		return dist(int32_generator);
	}

} /* namespace moxe */
