/*
 * Shape.hpp
 *
 *  Created on: Sep 14, 2026
 */

#ifndef MOXE_CORE_SHAPE_HPP_
#define MOXE_CORE_SHAPE_HPP_

#include <cstddef>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

class Json;

namespace moxe
{
	class Shape
	{
		public:
			static const int max_dimension = 6;
		private:
			int m_dim[max_dimension];
			int m_rank = 0;
		public:
			Shape();
			Shape(const Json &json);
			Shape(std::initializer_list<int> dims);
			Shape(const std::vector<int> &dims);

			std::string toString() const;

			int rank() const noexcept;
			int dim(int index) const;
			int& dim(int index);
			int operator[](int index) const;
			int& operator[](int index);
			const int* data() const noexcept;

			int firstDim() const noexcept;
			int lastDim() const noexcept;
			int volume() const noexcept;
			int volumeWithoutLastDim() const noexcept;

			/*
			 * Number of rows when the last axis is treated as the feature axis.
			 * A rank-1 shape is a single row.
			 */
			int rows() const noexcept;

			friend bool operator==(const Shape &lhs, const Shape &rhs) noexcept;
			friend bool operator!=(const Shape &lhs, const Shape &rhs) noexcept;

			Json serialize() const;
	};

	std::ostream& operator<<(std::ostream &stream, const Shape &s);
	std::string operator+(const std::string &lhs, const Shape &rhs);
	std::string operator+(const Shape &lhs, const std::string &rhs);

	class ShapeMismatch: public std::logic_error
	{
		public:
			ShapeMismatch(const char *function, const std::string &what_arg);
			ShapeMismatch(const char *function, int expected_rank, int actual_rank);
			ShapeMismatch(const char *function, const Shape &expected, const Shape &got);
	};

} /* namespace moxe */

#endif /* MOXE_CORE_SHAPE_HPP_ */
