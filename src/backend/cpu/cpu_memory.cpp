/*
 * cpu_memory.cpp
 *
 *  Created on: Sep 15, 2026
 */

#include <moxe/backend/cpu_backend.h>

#include <cinttypes>
#include <cstring>
#include <algorithm>
#include <new>
#include <cassert>

namespace moxe
{
	void* cpu_malloc(int count)
	{
		if (count <= 0)
			return nullptr;
		else
			return ::operator new[](count, std::align_val_t(64));
	}
	void cpu_free(void *ptr)
	{
		if (ptr != nullptr)
			::operator delete[](ptr, std::align_val_t(64));
	}

	void cpu_memset(mxContext_t context, void *dst, int dst_offset, int dst_count, const void *src, int src_count)
	{
		assert(dst != nullptr);
		uint8_t *dst_ptr = reinterpret_cast<uint8_t*>(dst) + dst_offset;
		if (src == nullptr)
			std::memset(dst_ptr, 0, dst_count);
		else
		{
			assert(src_count > 0 && dst_count % src_count == 0);
			for (int i = 0; i < dst_count; i += src_count)
				std::memcpy(dst_ptr + i, src, src_count);
		}
	}
	void cpu_memcpy(mxContext_t context, void *dst, int dst_offset, const void *src, int src_offset, int count)
	{
		if (count == 0)
			return;
		assert(dst != nullptr);
		assert(src != nullptr);
		std::memmove(reinterpret_cast<uint8_t*>(dst) + dst_offset, reinterpret_cast<const uint8_t*>(src) + src_offset, count);
	}
}
