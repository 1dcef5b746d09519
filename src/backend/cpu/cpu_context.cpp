/*
 * cpu_context.cpp
 *
 *  Created on: Sep 15, 2026
 */

#include <moxe/backend/cpu_backend.h>

#include "utils.hpp"

#include <new>

namespace moxe
{
	mxContext_t cpu_create_context()
	{
		return reinterpret_cast<mxContext_t>(new (std::nothrow) cpu::Context());
	}
	void cpu_destroy_context(mxContext_t context)
	{
		if (context != nullptr)
			delete reinterpret_cast<cpu::Context*>(context);
	}

} /* namespace moxe */
