/*
 * testing_util.hpp
 *
 *  Created on: Sep 18, 2026
 */

#ifndef MOXE_UTILS_TESTING_UTIL_HPP_
#define MOXE_UTILS_TESTING_UTIL_HPP_

#include <moxe/core/Tensor.hpp>

namespace moxe
{
	namespace testing
	{
		void initForTest(Tensor &t, double shift, double scale = 1.0);
		void initRandom(Tensor &t);
		/*
		 * Fills every row (last axis) with a random categorical distribution.
		 */
		void initRandomProbabilities(Tensor &t);
		double diffForTest(const Tensor &lhs, const Tensor &rhs);
		double maxAbsDiff(const Tensor &lhs, const Tensor &rhs);
		double sumForTest(const Tensor &tensor);
	}
}

#endif /* MOXE_UTILS_TESTING_UTIL_HPP_ */
