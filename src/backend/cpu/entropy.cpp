/*
 * entropy.cpp
 *
 *  Created on: Sep 16, 2026
 */

#include <moxe/backend/cpu_backend.h>
#include <moxe/backend/backend_utils.hpp>

#include "common_math.hpp"

#include <cmath>
#include <cassert>

namespace
{
	using namespace moxe::cpu;

	template<typename T>
	void normalized_entropy_kernel(T *dst, const T *src, int rows, int columns, T eps, bool normalize)
	{
		const T inv_max_entropy = normalize ? static_cast<T>(1) / std::log(static_cast<T>(columns)) : static_cast<T>(1);
#pragma omp parallel for
		for (int i = 0; i < rows; i++)
		{
			const T *row = src + static_cast<size_t>(i) * columns;
			T acc = static_cast<T>(0);
			for (int j = 0; j < columns; j++)
				acc -= row[j] * clipped_log(row[j], eps);
			dst[i] = acc * inv_max_entropy;
		}
	}
	template<typename T>
	double mean_kernel(const T *src, int elements)
	{
		double acc = 0.0;
#pragma omp parallel for reduction(+:acc)
		for (int i = 0; i < elements; i++)
			acc += static_cast<double>(src[i]);
		return acc / elements;
	}
}

namespace moxe
{
	void cpu_normalized_entropy(mxContext_t context, const mxTensor_t probs, mxTensor_t entropy, double eps, bool normalize)
	{
		assert(probs.dtype == entropy.dtype);
		assert(get_rows(probs) == volume(entropy));

		const int rows = get_rows(probs);
		const int columns = get_last_dim(probs);

		switch (probs.dtype)
		{
			case DTYPE_FLOAT32:
				normalized_entropy_kernel(data<float>(entropy), data<float>(probs), rows, columns, static_cast<float>(eps), normalize);
				break;
			case DTYPE_FLOAT64:
				normalized_entropy_kernel(data<double>(entropy), data<double>(probs), rows, columns, eps, normalize);
				break;
			default:
				break;
		}
	}
	double cpu_mean(mxContext_t context, const mxTensor_t input)
	{
		const int elements = volume(input);
		if (elements == 0)
			return 0.0;
		switch (input.dtype)
		{
			case DTYPE_FLOAT32:
				return mean_kernel(data<float>(input), elements);
			case DTYPE_FLOAT64:
				return mean_kernel(data<double>(input), elements);
			case DTYPE_INT32:
				return mean_kernel(data<int32_t>(input), elements);
			default:
				return 0.0;
		}
	}

} /* namespace moxe */
