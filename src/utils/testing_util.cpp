/*
 * testing_util.cpp
 *
 *  Created on: Sep 18, 2026
 */

#include <moxe/utils/testing_util.hpp>
#include <moxe/utils/random.hpp>
#include <moxe/core/Tensor.hpp>
#include <moxe/core/DataType.hpp>
#include <moxe/core/moxe_exceptions.hpp>

#include <algorithm>
#include <cmath>

namespace
{
	using namespace moxe;

	template<typename T>
	void init_for_test(T *ptr, size_t length, double shift, double scale)
	{
		for (size_t i = 0; i < length; i++)
			ptr[i] = static_cast<T>(std::sin(i / 10.0 + shift) * scale);
	}
	template<typename T>
	void init_random(T *ptr, size_t length)
	{
		for (size_t i = 0; i < length; i++)
			ptr[i] = static_cast<T>(2 * randDouble() - 1);
	}
	template<typename T>
	void init_random_probabilities(T *ptr, int rows, int columns)
	{
		for (int i = 0; i < rows; i++)
		{
			T *row = ptr + static_cast<size_t>(i) * columns;
			T sum = static_cast<T>(0);
			for (int j = 0; j < columns; j++)
			{
				row[j] = static_cast<T>(std::exp(randGaussian(0.0f, 1.0f)));
				sum += row[j];
			}
			for (int j = 0; j < columns; j++)
				row[j] /= sum;
		}
	}

	void check_same(const char *function, const Tensor &lhs, const Tensor &rhs)
	{
		if (lhs.shape() != rhs.shape())
			throw ShapeMismatch(function, lhs.shape(), rhs.shape());
		if (lhs.dtype() != rhs.dtype())
			throw DataTypeMismatch(function, lhs.dtype(), rhs.dtype());
	}
}

namespace moxe
{
	namespace testing
	{
		void initForTest(Tensor &t, double shift, double scale)
		{
			switch (t.dtype())
			{
				case DataType::FLOAT32:
					init_for_test(reinterpret_cast<float*>(t.data()), t.volume(), shift, scale);
					break;
				case DataType::FLOAT64:
					init_for_test(reinterpret_cast<double*>(t.data()), t.volume(), shift, scale);
					break;
				case DataType::INT32:
					init_for_test(reinterpret_cast<int32_t*>(t.data()), t.volume(), shift, scale);
					break;
				default:
					throw DataTypeNotSupported(METHOD_NAME, t.dtype());
			}
		}
		void initRandom(Tensor &t)
		{
			switch (t.dtype())
			{
				case DataType::FLOAT32:
					init_random(reinterpret_cast<float*>(t.data()), t.volume());
					break;
				case DataType::FLOAT64:
					init_random(reinterpret_cast<double*>(t.data()), t.volume());
					break;
				default:
					throw DataTypeNotSupported(METHOD_NAME, t.dtype());
			}
		}
		void initRandomProbabilities(Tensor &t)
		{
			switch (t.dtype())
			{
				case DataType::FLOAT32:
					init_random_probabilities(reinterpret_cast<float*>(t.data()), t.shape().rows(), t.lastDim());
					break;
				case DataType::FLOAT64:
					init_random_probabilities(reinterpret_cast<double*>(t.data()), t.shape().rows(), t.lastDim());
					break;
				default:
					throw DataTypeNotSupported(METHOD_NAME, t.dtype());
			}
		}
		double diffForTest(const Tensor &lhs, const Tensor &rhs)
		{
			check_same(METHOD_NAME, lhs, rhs);
			if (lhs.volume() == 0)
				return 0.0;
			const std::vector<double> a = lhs.toVector();
			const std::vector<double> b = rhs.toVector();
			double result = 0.0;
			for (size_t i = 0; i < a.size(); i++)
				result += std::fabs(a[i] - b[i]);
			return result / a.size();
		}
		double maxAbsDiff(const Tensor &lhs, const Tensor &rhs)
		{
			check_same(METHOD_NAME, lhs, rhs);
			const std::vector<double> a = lhs.toVector();
			const std::vector<double> b = rhs.toVector();
			double result = 0.0;
			for (size_t i = 0; i < a.size(); i++)
				result = std::max(result, std::fabs(a[i] - b[i]));
			return result;
		}
		double sumForTest(const Tensor &tensor)
		{
			const std::vector<double> a = tensor.toVector();
			double result = 0.0;
			for (size_t i = 0; i < a.size(); i++)
				result += a[i];
			return result;
		}
	}
}
