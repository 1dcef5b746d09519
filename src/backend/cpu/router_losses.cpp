/*
 * router_losses.cpp
 *
 *  Created on: Sep 17, 2026
 */

#include <moxe/backend/cpu_backend.h>
#include <moxe/backend/backend_utils.hpp>

#include "utils.hpp"
#include "common_math.hpp"

#include <algorithm>
#include <utility>
#include <cinttypes>
#include <cassert>
#include <omp.h>

namespace
{
	using namespace moxe;
	using namespace moxe::cpu;

	template<typename T>
	double router_z_loss_kernel(const T *logits, int rows, int columns)
	{
		double acc = 0.0;
#pragma omp parallel for reduction(+:acc)
		for (int i = 0; i < rows; i++)
		{
			const T lse = log_sum_exp(logits + static_cast<size_t>(i) * columns, columns);
			acc += square(static_cast<double>(lse));
		}
		return acc / rows;
	}

	template<typename T>
	void select_top_k_kernel(mxContext_t context, T *values, int32_t *indices, const T *input, int rows, int columns, int top_k)
	{
		typedef std::pair<T, int32_t> entry;
		const int max_threads = omp_get_max_threads();
		entry *workspace = cpu::Context::getWorkspace<entry>(context, static_cast<size_t>(max_threads) * columns);

#pragma omp parallel
		{
			entry *row_buffer = workspace + static_cast<size_t>(omp_get_thread_num()) * columns;
#pragma omp for
			for (int i = 0; i < rows; i++)
			{
				const T *src = input + static_cast<size_t>(i) * columns;
				for (int j = 0; j < columns; j++)
					row_buffer[j] = entry(src[j], j);

				// larger value first, lower index wins a tie
				std::partial_sort(row_buffer, row_buffer + top_k, row_buffer + columns, [](const entry &lhs, const entry &rhs)
				{
					return (lhs.first > rhs.first) or (lhs.first == rhs.first and lhs.second < rhs.second);
				});

				T *dst_values = values + static_cast<size_t>(i) * top_k;
				int32_t *dst_indices = indices + static_cast<size_t>(i) * top_k;
				for (int j = 0; j < top_k; j++)
				{
					dst_values[j] = row_buffer[j].first;
					dst_indices[j] = row_buffer[j].second;
				}
			}
		}
	}

	/*
	 * Indices outside of [0, elements) are dropped.
	 * Null 'values' means that every index contributes one.
	 */
	template<typename T>
	void scatter_add_kernel(T *output, int output_elements, const int32_t *indices, const T *values, int elements)
	{
#pragma omp parallel for
		for (int i = 0; i < elements; i++)
		{
			const int idx = indices[i];
			if (0 <= idx and idx < output_elements)
			{
				const T value = (values == nullptr) ? static_cast<T>(1) : values[i];
#pragma omp atomic
				output[idx] += value;
			}
		}
	}

	template<typename T>
	double load_balancing_loss_kernel(const T *expert_load, T *expert_usage, int num_experts, int total_tokens, int top_k)
	{
		const double scale = 1.0 / (static_cast<double>(total_tokens) * top_k);
		const double ideal_usage = 1.0 / num_experts;

		double acc = 0.0;
		for (int i = 0; i < num_experts; i++)
		{
			expert_usage[i] = static_cast<T>(expert_load[i] * scale);
			acc += square(static_cast<double>(expert_usage[i]) - ideal_usage);
		}
		const double mean_squared_deviation = acc / num_experts;
		return mean_squared_deviation * num_experts;
	}
}

namespace moxe
{
	double cpu_router_z_loss(mxContext_t context, const mxTensor_t logits)
	{
		const int rows = get_rows(logits);
		const int columns = get_last_dim(logits);
		if (rows == 0 or columns == 0)
			return 0.0;

		switch (logits.dtype)
		{
			case DTYPE_FLOAT32:
				return router_z_loss_kernel(data<float>(logits), rows, columns);
			case DTYPE_FLOAT64:
				return router_z_loss_kernel(data<double>(logits), rows, columns);
			default:
				return 0.0;
		}
	}
	void cpu_select_top_k(mxContext_t context, const mxTensor_t input, mxTensor_t values, mxTensor_t indices)
	{
		assert(input.dtype == values.dtype);
		assert(indices.dtype == DTYPE_INT32);
		assert(get_last_dim(values) == get_last_dim(indices));
		assert(get_last_dim(values) <= get_last_dim(input));

		const int rows = get_rows(input);
		const int columns = get_last_dim(input);
		const int top_k = get_last_dim(values);
		if (rows == 0 or top_k == 0)
			return;

		switch (input.dtype)
		{
			case DTYPE_FLOAT32:
				select_top_k_kernel(context, data<float>(values), data<int32_t>(indices), data<float>(input), rows, columns, top_k);
				break;
			case DTYPE_FLOAT64:
				select_top_k_kernel(context, data<double>(values), data<int32_t>(indices), data<double>(input), rows, columns, top_k);
				break;
			default:
				break;
		}
	}
	void cpu_scatter_add(mxContext_t context, const mxTensor_t indices, const mxTensor_t values, mxTensor_t output)
	{
		assert(indices.dtype == DTYPE_INT32);
		assert(is_empty(values) || values.dtype == output.dtype);
		assert(is_empty(values) || volume(values) == volume(indices));

		const int elements = volume(indices);
		const int output_elements = volume(output);
		const bool count_only = is_empty(values);

		switch (output.dtype)
		{
			case DTYPE_FLOAT32:
				scatter_add_kernel(data<float>(output), output_elements, data<int32_t>(indices), count_only ? nullptr : data<float>(values), elements);
				break;
			case DTYPE_FLOAT64:
				scatter_add_kernel(data<double>(output), output_elements, data<int32_t>(indices), count_only ? nullptr : data<double>(values),
						elements);
				break;
			case DTYPE_INT32:
				scatter_add_kernel(data<int32_t>(output), output_elements, data<int32_t>(indices), count_only ? nullptr : data<int32_t>(values),
						elements);
				break;
			default:
				break;
		}
	}
	double cpu_load_balancing_loss(mxContext_t context, const mxTensor_t expert_load, mxTensor_t expert_usage, int total_tokens, int top_k)
	{
		assert(expert_load.dtype == expert_usage.dtype);
		assert(volume(expert_load) == volume(expert_usage));
		assert(total_tokens > 0 && top_k > 0);

		const int num_experts = volume(expert_load);
		switch (expert_load.dtype)
		{
			case DTYPE_FLOAT32:
				return load_balancing_loss_kernel(data<float>(expert_load), data<float>(expert_usage), num_experts, total_tokens, top_k);
			case DTYPE_FLOAT64:
				return load_balancing_loss_kernel(data<double>(expert_load), data<double>(expert_usage), num_experts, total_tokens, top_k);
			default:
				return 0.0;
		}
	}

} /* namespace moxe */
