/*
 * utils.hpp
 *
 *  Created on: Sep 15, 2026
 */

#ifndef BACKEND_CPU_UTILS_HPP_
#define BACKEND_CPU_UTILS_HPP_

#include <moxe/backend/backend_types.h>

#include <memory>
#include <cstdint>
#include <cstddef>

namespace moxe
{
	namespace cpu
	{
		class Context
		{
				static constexpr size_t default_workspace_size = 1024 * 1024; // 1MB

				std::unique_ptr<uint8_t[]> m_workspace;
				size_t m_workspace_size = 0;
			public:
				Context() = default;

				/*
				 * Returns scratch memory of at least 'size' bytes, growing the buffer if needed.
				 * The pointer is invalidated by the next call requesting a larger size.
				 */
				static void* getWorkspace(mxContext_t context, size_t size);
				template<typename T>
				static T* getWorkspace(mxContext_t context, size_t elements)
				{
					return reinterpret_cast<T*>(getWorkspace(context, sizeof(T) * elements));
				}
		};
	}
} /* namespace moxe */

#endif /* BACKEND_CPU_UTILS_HPP_ */
