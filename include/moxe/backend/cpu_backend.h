/*
 * cpu_backend.h
 *
 *  Created on: Sep 14, 2026
 */

#ifndef MOXE_BACKEND_CPU_BACKEND_H_
#define MOXE_BACKEND_CPU_BACKEND_H_

#include <moxe/backend/backend_types.h>

namespace moxe
{

#ifdef __cplusplus
	extern "C"
	{
#endif

		// implemented in 'cpu_properties.cpp'
		void cpu_set_number_of_threads(int number);
		int cpu_get_number_of_threads();
		int cpu_get_number_of_cores();
		bool cpu_supports_type(mxDataType_t dtype);
		const char* cpu_get_device_info();

		// implemented in 'cpu_context.cpp'
		mxContext_t cpu_create_context();
		void cpu_destroy_context(mxContext_t context);

		// implemented in 'cpu_memory.cpp'
		void* cpu_malloc(int count);
		void cpu_free(void *ptr);
		void cpu_memset(mxContext_t context, void *dst, int dst_offset, int dst_count, const void *src, int src_count);
		void cpu_memcpy(mxContext_t context, void *dst, int dst_offset, const void *src, int src_offset, int count);

		// implemented in 'entropy.cpp'
		void cpu_normalized_entropy(mxContext_t context, const mxTensor_t probs, mxTensor_t entropy, double eps, bool normalize);
		double cpu_mean(mxContext_t context, const mxTensor_t input);

		// implemented in 'group_losses.cpp'
		void cpu_group_loss(mxContext_t context, mxGroupLossType_t type, const mxTensor_t pm, const mxTensor_t ps, mxTensor_t loss, double eps);

		// implemented in 'router_losses.cpp'
		double cpu_router_z_loss(mxContext_t context, const mxTensor_t logits);
		void cpu_select_top_k(mxContext_t context, const mxTensor_t input, mxTensor_t values, mxTensor_t indices);
		void cpu_scatter_add(mxContext_t context, const mxTensor_t indices, const mxTensor_t values, mxTensor_t output);
		double cpu_load_balancing_loss(mxContext_t context, const mxTensor_t expert_load, mxTensor_t expert_usage, int total_tokens, int top_k);

#ifdef __cplusplus
	}
#endif
} /* namespace moxe */

#endif /* MOXE_BACKEND_CPU_BACKEND_H_ */
