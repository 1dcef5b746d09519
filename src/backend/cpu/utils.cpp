/*
 * utils.cpp
 *
 *  Created on: Sep 15, 2026
 */

#include "utils.hpp"

#include <algorithm>

namespace
{
	moxe::cpu::Context* get(moxe::mxContext_t context)
	{
		return reinterpret_cast<moxe::cpu::Context*>(context);
	}
}

namespace moxe
{
	namespace cpu
	{
		void* Context::getWorkspace(mxContext_t context, size_t size)
		{
			if (context == nullptr)
				return nullptr;
			Context *ctx = get(context);
			if (ctx->m_workspace == nullptr or ctx->m_workspace_size < size)
			{
				ctx->m_workspace_size = std::max(default_workspace_size, size);
				ctx->m_workspace = std::make_unique<uint8_t[]>(ctx->m_workspace_size);
			}
			return ctx->m_workspace.get();
		}

	} /* namespace cpu */
} /* namespace moxe */
