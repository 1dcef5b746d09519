/*
 * DataType.cpp
 *
 *  Created on: Sep 14, 2026
 */

#include <moxe/core/DataType.hpp>
#include <moxe/core/moxe_exceptions.hpp>

#include <iostream>

namespace moxe
{
	size_t sizeOf(DataType t) noexcept
	{
		switch (t)
		{
			case DataType::FLOAT32:
			case DataType::INT32:
				return 4;
			case DataType::FLOAT64:
				return 8;
			default:
				return 0;
		}
	}
	bool isFloatingPoint(DataType t) noexcept
	{
		return t == DataType::FLOAT32 or t == DataType::FLOAT64;
	}

	DataType typeFromString(const std::string &str)
	{
		if (str == "fp32" or str == "float32" or str == "FLOAT32")
			return DataType::FLOAT32;
		if (str == "fp64" or str == "float64" or str == "FLOAT64")
			return DataType::FLOAT64;
		if (str == "int32" or str == "INT32")
			return DataType::INT32;
		throw DataTypeNotSupported(METHOD_NAME, "unknown data type '" + str + "'");
	}
	std::string toString(DataType t)
	{
		switch (t)
		{
			case DataType::FLOAT32:
				return std::string("FLOAT32");
			case DataType::FLOAT64:
				return std::string("FLOAT64");
			case DataType::INT32:
				return std::string("INT32");
			default:
				return std::string("UNKNOWN");
		}
	}

	std::ostream& operator<<(std::ostream &stream, DataType t)
	{
		stream << toString(t);
		return stream;
	}
	std::string operator+(const std::string &lhs, DataType rhs)
	{
		return lhs + toString(rhs);
	}
	std::string operator+(DataType lhs, const std::string &rhs)
	{
		return toString(lhs) + rhs;
	}

	DataTypeNotSupported::DataTypeNotSupported(const char *function, const std::string &comment) :
			std::logic_error(std::string(function) + " : " + comment)
	{
	}
	DataTypeNotSupported::DataTypeNotSupported(const char *function, DataType dtype) :
			std::logic_error(std::string(function) + " : " + dtype + " is not supported")
	{
	}

	DataTypeMismatch::DataTypeMismatch(const char *function, const std::string &comment) :
			logic_error(std::string(function) + " : " + comment)
	{
	}
	DataTypeMismatch::DataTypeMismatch(const char *function, DataType d1, DataType d2) :
			std::logic_error(std::string(function) + " : expected type " + d1 + ", got " + d2)
	{
	}

} /* namespace moxe */
