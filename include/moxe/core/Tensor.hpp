/*
 * Tensor.hpp
 *
 *  Created on: Sep 15, 2026
 */

#ifndef MOXE_CORE_TENSOR_HPP_
#define MOXE_CORE_TENSOR_HPP_

#include <moxe/core/Shape.hpp>
#include <moxe/core/DataType.hpp>

#include <cstring>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace moxe
{

	class Tensor
	{
		private:
			void *m_data = nullptr;
			Shape m_shape;
			DataType m_dtype = DataType::UNKNOWN;
			bool m_is_owning = false;

			uint32_t m_stride[Shape::max_dimension];
		public:
			class const_reference
			{
					friend class Tensor;
					uint64_t m_data = 0u;
					DataType m_dtype = DataType::UNKNOWN;
					const_reference(const void *ptr, size_t offset, DataType dtype);
				public:
					operator float() const;
					operator double() const;
					operator int32_t() const;
			};
			class reference
			{
					friend class Tensor;
					void *m_ptr = nullptr;
					DataType m_dtype = DataType::UNKNOWN;
					reference(void *ptr, size_t offset, DataType dtype);
				public:
					reference& operator=(float x);
					reference& operator=(double x);
					reference& operator=(int32_t x);
					operator float() const;
					operator double() const;
					operator int32_t() const;
			};

			Tensor() noexcept;
			Tensor(const Shape &shape);
			Tensor(const Shape &shape, DataType dtype);
			Tensor(const Shape &shape, const std::string &dtype);

			Tensor(const Tensor &other);
			Tensor(Tensor &&other) noexcept;

			~Tensor() noexcept;

			Tensor& operator=(const Tensor &other);
			Tensor& operator=(Tensor &&other) noexcept;

			std::string info(bool full = false) const;

			DataType dtype() const noexcept;
			size_t sizeInBytes() const noexcept;

			bool isOwning() const noexcept;
			bool isView() const noexcept;
			bool isEmpty() const noexcept;

			int rank() const noexcept;
			int dim(int idx) const;
			int firstDim() const noexcept;
			int lastDim() const noexcept;
			int volume() const noexcept;
			const Shape& shape() const noexcept;

			void reshape(const Shape &newShape);

			void zeroall();
			void setall(double value);

			Tensor view(const Shape &shape) const;
			Tensor view(const Shape &shape, size_t offsetInElements) const;

			const void* data() const noexcept;
			void* data() noexcept;

			double get(std::initializer_list<int> idx) const;
			void set(double value, std::initializer_list<int> idx);

			const_reference at(std::initializer_list<int> idx) const;
			reference at(std::initializer_list<int> idx);

			std::vector<double> toVector() const;
		private:
			size_t get_index(const int *ptr, size_t size) const;
			void create_stride() noexcept;
			void deallocate_if_owning();
	};

	Tensor toTensor(std::initializer_list<float> data, DataType dtype = DataType::FLOAT32);
	Tensor toTensor(std::initializer_list<std::initializer_list<float>> data, DataType dtype = DataType::FLOAT32);

	template<class T, class U>
	bool same_type(const T &lhs, const U &rhs)
	{
		return lhs.dtype() == rhs.dtype();
	}
	template<class T, class U, class ... ARGS>
	bool same_type(const T &lhs, const U &rhs, const ARGS &... args)
	{
		if (lhs.dtype() == rhs.dtype())
			return same_type(lhs, args...);
		else
			return false;
	}

	template<class T, class U>
	bool same_shape(const T &lhs, const U &rhs)
	{
		return lhs.shape() == rhs.shape();
	}
	template<class T, class U, class ... ARGS>
	bool same_shape(const T &lhs, const U &rhs, const ARGS &... args)
	{
		if (lhs.shape() == rhs.shape())
			return same_shape(lhs, args...);
		else
			return false;
	}

} /* namespace moxe */

#endif /* MOXE_CORE_TENSOR_HPP_ */
