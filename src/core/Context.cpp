/*
 * Context.cpp
 *
 *  Created on: Sep 15, 2026
 */

#include <moxe/core/Context.hpp>
#include <moxe/core/moxe_exceptions.hpp>

#include <moxe/backend/cpu_backend.h>

#include <algorithm>

namespace moxe
{
	Context::Context() :
			m_data(cpu_create_context())
	{
		if (m_data == nullptr)
			throw ContextError(METHOD_NAME, "failed to create CPU context");
	}
	Context::Context(Context &&other) noexcept :
			m_data(other.m_data)
	{
		other.m_data = nullptr;
	}
	Context& Context::operator=(Context &&other) noexcept
	{
		std::swap(this->m_data, other.m_data);
		return *this;
	}
	Context::~Context()
	{
		cpu_destroy_context(m_data);
	}
	void* Context::backend() const noexcept
	{
		return m_data;
	}

	void Context::setNumberOfThreads(int t)
	{
		if (t <= 0)
			throw IllegalArgument(METHOD_NAME, "t", "must be positive", t);
		cpu_set_number_of_threads(t);
	}
	int Context::numberOfThreads()
	{
		return cpu_get_number_of_threads();
	}
	int Context::numberOfCores()
	{
		return cpu_get_number_of_cores();
	}
	std::string Context::hardwareInfo()
	{
		return std::string(cpu_get_device_info());
	}

	ContextError::ContextError(const char *function) :
			std::logic_error(function)
	{
	}
	ContextError::ContextError(const char *function, const std::string &comment) :
			std::logic_error(std::string(function) + " : " + comment)
	{
	}

} /* namespace moxe */
