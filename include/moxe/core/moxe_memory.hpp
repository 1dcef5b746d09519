/*
 * moxe_memory.hpp
 *
 *  Created on: Sep 15, 2026
 */

#ifndef MOXE_CORE_MOXE_MEMORY_HPP_
#define MOXE_CORE_MOXE_MEMORY_HPP_

#include <cstddef>

namespace moxe
{
	void* malloc(size_t count);
	void free(void *ptr);

	void memzero(void *dst, size_t dst_offset, size_t dst_count);
	void memset(void *dst, size_t dst_offset, size_t dst_count, const void *src, size_t src_count);
	void memcpy(void *dst_ptr, size_t dst_offset, const void *src_ptr, size_t src_offset, size_t count);

} /* namespace moxe */

#endif /* MOXE_CORE_MOXE_MEMORY_HPP_ */
