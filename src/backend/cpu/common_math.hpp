/*
 * common_math.hpp
 *
 *  Created on: Sep 15, 2026
 */

#ifndef BACKEND_CPU_COMMON_MATH_HPP_
#define BACKEND_CPU_COMMON_MATH_HPP_

#include <cmath>
#include <algorithm>

namespace moxe
{
	namespace cpu
	{
		template<typename T>
		T square(T x) noexcept
		{
			return x * x;
		}
		template<typename T>
		T clipped_log(T x, T eps) noexcept
		{
			return std::log(std::max(x, eps));
		}
		template<typename T>
		T log_sum_exp(const T *x, int length) noexcept
		{
			T max_value = x[0];
			for (int i = 1; i < length; i++)
				max_value = std::max(max_value, x[i]);
			T sum = static_cast<T>(0);
			for (int i = 0; i < length; i++)
				sum += std::exp(x[i] - max_value);
			return max_value + std::log(sum);
		}
	}
}

#endif /* BACKEND_CPU_COMMON_MATH_HPP_ */
