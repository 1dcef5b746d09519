/*
 * moxe_exceptions.hpp
 *
 *  Created on: Sep 14, 2026
 */

#ifndef MOXE_CORE_MOXE_EXCEPTIONS_HPP_
#define MOXE_CORE_MOXE_EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>
#include <cassert>

namespace moxe
{
#ifdef __GNUC__
#  define METHOD_NAME __PRETTY_FUNCTION__
#else
#  define METHOD_NAME __FUNCTION__
#endif

	//range errors
	class IndexOutOfBounds: public std::out_of_range
	{
		public:
			IndexOutOfBounds(const char *function, const std::string &index_name, int index_value, int range);
	};

	//illegal argument
	class IllegalArgument: public std::invalid_argument
	{
		public:
			IllegalArgument(const char *function, const std::string &comment);
			IllegalArgument(const char *function, const char *arg_name, const std::string &comment, int arg_value);
			IllegalArgument(const char *function, const char *arg_name, const std::string &comment, double arg_value);
			IllegalArgument(const char *function, const char *arg_name, const std::string &comment, const std::string &arg_value);
	};

} /* namespace moxe */

#endif /* MOXE_CORE_MOXE_EXCEPTIONS_HPP_ */
