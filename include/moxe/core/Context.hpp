/*
 * Context.hpp
 *
 *  Created on: Sep 15, 2026
 */

#ifndef MOXE_CORE_CONTEXT_HPP_
#define MOXE_CORE_CONTEXT_HPP_

#include <stdexcept>
#include <string>

namespace moxe
{
	/*
	 * Owns a CPU backend context with its scratch workspace.
	 * A context may be used by one thread at a time.
	 */
	class Context
	{
			void *m_data = nullptr;
		public:
			Context();
			Context(const Context &other) = delete;
			Context(Context &&other) noexcept;
			Context& operator=(const Context &other) = delete;
			Context& operator=(Context &&other) noexcept;
			~Context();

			void* backend() const noexcept;

			static void setNumberOfThreads(int t);
			static int numberOfThreads();
			static int numberOfCores();
			static std::string hardwareInfo();
	};

	class ContextError: public std::logic_error
	{
		public:
			ContextError(const char *function);
			ContextError(const char *function, const std::string &comment);
	};

} /* namespace moxe */

#endif /* MOXE_CORE_CONTEXT_HPP_ */
