/*
 * DataType.hpp
 *
 *  Created on: Sep 14, 2026
 */

#ifndef MOXE_CORE_DATATYPE_HPP_
#define MOXE_CORE_DATATYPE_HPP_

#include <string>
#include <stdexcept>

namespace moxe
{
	enum class DataType
	{
		UNKNOWN,
		FLOAT32,
		FLOAT64,
		INT32
	};

	size_t sizeOf(DataType t) noexcept;
	bool isFloatingPoint(DataType t) noexcept;

	DataType typeFromString(const std::string &str);
	std::string toString(DataType t);

	std::ostream& operator<<(std::ostream &stream, DataType dtype);
	std::string operator+(const std::string &lhs, DataType rhs);
	std::string operator+(DataType lhs, const std::string &rhs);

	class DataTypeNotSupported: public std::logic_error
	{
		public:
			DataTypeNotSupported(const char *function, const std::string &comment);
			DataTypeNotSupported(const char *function, DataType dtype);
	};

	class DataTypeMismatch: public std::logic_error
	{
		public:
			DataTypeMismatch(const char *function, const std::string &comment);
			DataTypeMismatch(const char *function, DataType d1, DataType d2);
	};

} /* namespace moxe */

#endif /* MOXE_CORE_DATATYPE_HPP_ */
