/*
 * moxe_memory.cpp
 *
 *  Created on: Sep 15, 2026
 */

#include <moxe/core/moxe_memory.hpp>
#include <moxe/core/moxe_exceptions.hpp>

#include <moxe/backend/cpu_backend.h>

#include <limits>

namespace
{
	int checked_cast(const char *function, size_t count)
	{
		if (count > static_cast<size_t>(std::numeric_limits<int>::max()))
			throw moxe::IllegalArgument(function, "count", "must fit in 32-bit integer", std::to_string(count));
		return static_cast<int>(count);
	}
}

namespace moxe
{
	void* malloc(size_t count)
	{
		return cpu_malloc(checked_cast(METHOD_NAME, count));
	}
	void free(void *ptr)
	{
		cpu_free(ptr);
	}

	void memzero(void *dst, size_t dst_offset, size_t dst_count)
	{
		if (dst == nullptr or dst_count == 0)
			return;
		cpu_memset(nullptr, dst, checked_cast(METHOD_NAME, dst_offset), checked_cast(METHOD_NAME, dst_count), nullptr, 0);
	}
	void memset(void *dst, size_t dst_offset, size_t dst_count, const void *src, size_t src_count)
	{
		if (dst == nullptr or dst_count == 0)
			return;
		if (src_count == 0 or dst_count % src_count != 0)
			throw IllegalArgument(METHOD_NAME, "src_count", "must divide dst_count", static_cast<int>(src_count));
		cpu_memset(nullptr, dst, checked_cast(METHOD_NAME, dst_offset), checked_cast(METHOD_NAME, dst_count), src,
				checked_cast(METHOD_NAME, src_count));
	}
	void memcpy(void *dst_ptr, size_t dst_offset, const void *src_ptr, size_t src_offset, size_t count)
	{
		cpu_memcpy(nullptr, dst_ptr, checked_cast(METHOD_NAME, dst_offset), src_ptr, checked_cast(METHOD_NAME, src_offset),
				checked_cast(METHOD_NAME, count));
	}

} /* namespace moxe */
