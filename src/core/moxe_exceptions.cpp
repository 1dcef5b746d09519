/*
 * moxe_exceptions.cpp
 *
 *  Created on: Sep 14, 2026
 */

#include <moxe/core/moxe_exceptions.hpp>

#include <sstream>

namespace
{
	std::string format_double(double x)
	{
		std::ostringstream ss;
		ss << x;
		return ss.str();
	}
}

namespace moxe
{
	//range errors
	IndexOutOfBounds::IndexOutOfBounds(const char *function, const std::string &index_name, int index_value, int range) :
			out_of_range(std::string(function) + " : '" + index_name + "' = " + std::to_string(index_value) + " out of range [0, " + std::to_string(range) + ")")
	{
	}

	//illegal argument
	IllegalArgument::IllegalArgument(const char *function, const std::string &comment) :
			invalid_argument(std::string(function) + " : " + comment)
	{
	}
	IllegalArgument::IllegalArgument(const char *function, const char *arg_name, const std::string &comment, int arg_value) :
			IllegalArgument(function, arg_name, comment, std::to_string(arg_value))
	{
	}
	IllegalArgument::IllegalArgument(const char *function, const char *arg_name, const std::string &comment, double arg_value) :
			IllegalArgument(function, arg_name, comment, format_double(arg_value))
	{
	}
	IllegalArgument::IllegalArgument(const char *function, const char *arg_name, const std::string &comment, const std::string &arg_value) :
			invalid_argument(std::string(function) + " : '" + arg_name + "' " + comment + ", got " + arg_value)
	{
	}

} /* namespace moxe */
