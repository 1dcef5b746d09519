/*
 * random.hpp
 *
 *  Created on: Sep 18, 2026
 */

#ifndef MOXE_UTILS_RANDOM_HPP_
#define MOXE_UTILS_RANDOM_HPP_

#include <cstdint>

namespace moxe
{
	double randDouble();
	float randGaussian(float mean, float stddev);
	int32_t randInt(int r);
}

#endif /* MOXE_UTILS_RANDOM_HPP_ */
