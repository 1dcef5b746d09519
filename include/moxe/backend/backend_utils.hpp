/*
 * backend_utils.hpp
 *
 *  Created on: Sep 14, 2026
 */

#ifndef MOXE_BACKEND_BACKEND_UTILS_HPP_
#define MOXE_BACKEND_BACKEND_UTILS_HPP_

#include <moxe/backend/backend_types.h>

#include <cstddef>

namespace moxe
{
	/*
	 * mxTensor_t helpers
	 */
	template<typename T>
	T* data(mxTensor_t &tensor) noexcept
	{
		return reinterpret_cast<T*>(tensor.data);
	}
	template<typename T>
	const T* data(const mxTensor_t &tensor) noexcept
	{
		return reinterpret_cast<const T*>(tensor.data);
	}
	[[maybe_unused]] static bool is_empty(const mxTensor_t &tensor) noexcept
	{
		return tensor.data == nullptr or tensor.rank == 0;
	}
	[[maybe_unused]] static int volume(const mxTensor_t &tensor) noexcept
	{
		if (tensor.rank == 0)
			return 0;
		int result = 1;
		for (int i = 0; i < tensor.rank; i++)
			result *= tensor.dim[i];
		return result;
	}
	[[maybe_unused]] static int get_last_dim(const mxTensor_t &tensor) noexcept
	{
		return (tensor.rank == 0) ? 0 : tensor.dim[tensor.rank - 1];
	}
	/*
	 * Number of rows when the last dimension is the reduced one.
	 * A rank-1 tensor is a single row.
	 */
	[[maybe_unused]] static int get_rows(const mxTensor_t &tensor) noexcept
	{
		if (tensor.rank == 0)
			return 0;
		int result = 1;
		for (int i = 0; i < tensor.rank - 1; i++)
			result *= tensor.dim[i];
		return result;
	}

} /* namespace moxe */

#endif /* MOXE_BACKEND_BACKEND_UTILS_HPP_ */
