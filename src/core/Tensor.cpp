/*
 * Tensor.cpp
 *
 *  Created on: Sep 15, 2026
 */

#include <moxe/core/Tensor.hpp>
#include <moxe/core/moxe_memory.hpp>
#include <moxe/core/moxe_exceptions.hpp>

#include <cassert>
#include <algorithm>

namespace
{
	using namespace moxe;

	template<typename T>
	T load(const void *ptr, DataType dtype)
	{
		switch (dtype)
		{
			case DataType::FLOAT32:
			{
				float x;
				std::memcpy(&x, ptr, sizeof(float));
				return static_cast<T>(x);
			}
			case DataType::FLOAT64:
			{
				double x;
				std::memcpy(&x, ptr, sizeof(double));
				return static_cast<T>(x);
			}
			case DataType::INT32:
			{
				int32_t x;
				std::memcpy(&x, ptr, sizeof(int32_t));
				return static_cast<T>(x);
			}
			default:
				throw DataTypeMismatch(METHOD_NAME, "unknown data type");
		}
	}
	template<typename T>
	void store(T x, void *ptr, DataType dtype)
	{
		switch (dtype)
		{
			case DataType::FLOAT32:
			{
				const float value = static_cast<float>(x);
				std::memcpy(ptr, &value, sizeof(float));
				break;
			}
			case DataType::FLOAT64:
			{
				const double value = static_cast<double>(x);
				std::memcpy(ptr, &value, sizeof(double));
				break;
			}
			case DataType::INT32:
			{
				const int32_t value = static_cast<int32_t>(x);
				std::memcpy(ptr, &value, sizeof(int32_t));
				break;
			}
			default:
				throw DataTypeMismatch(METHOD_NAME, "unknown data type");
		}
	}
}

namespace moxe
{
	Tensor::reference::reference(void *ptr, size_t offset, DataType dtype) :
			m_ptr(reinterpret_cast<uint8_t*>(ptr) + offset * sizeOf(dtype)),
			m_dtype(dtype)
	{
	}
	Tensor::reference& Tensor::reference::operator=(float x)
	{
		store(x, m_ptr, m_dtype);
		return *this;
	}
	Tensor::reference& Tensor::reference::operator=(double x)
	{
		store(x, m_ptr, m_dtype);
		return *this;
	}
	Tensor::reference& Tensor::reference::operator=(int32_t x)
	{
		store(x, m_ptr, m_dtype);
		return *this;
	}
	Tensor::reference::operator float() const
	{
		return load<float>(m_ptr, m_dtype);
	}
	Tensor::reference::operator double() const
	{
		return load<double>(m_ptr, m_dtype);
	}
	Tensor::reference::operator int32_t() const
	{
		return load<int32_t>(m_ptr, m_dtype);
	}

	Tensor::const_reference::const_reference(const void *ptr, size_t offset, DataType dtype) :
			m_dtype(dtype)
	{
		std::memcpy(&m_data, reinterpret_cast<const uint8_t*>(ptr) + offset * sizeOf(dtype), sizeOf(dtype));
	}
	Tensor::const_reference::operator float() const
	{
		return load<float>(&m_data, m_dtype);
	}
	Tensor::const_reference::operator double() const
	{
		return load<double>(&m_data, m_dtype);
	}
	Tensor::const_reference::operator int32_t() const
	{
		return load<int32_t>(&m_data, m_dtype);
	}

	Tensor::Tensor() noexcept
	{
		std::memset(m_stride, 0, sizeof(m_stride));
	}
	Tensor::Tensor(const Shape &shape) :
			Tensor(shape, DataType::FLOAT32)
	{
	}
	Tensor::Tensor(const Shape &shape, DataType dtype) :
			m_shape(shape),
			m_dtype(dtype),
			m_is_owning(true)
	{
		if (dtype == DataType::UNKNOWN)
			throw DataTypeNotSupported(METHOD_NAME, dtype);
		m_data = moxe::malloc(sizeInBytes());
		zeroall();
		create_stride();
	}
	Tensor::Tensor(const Shape &shape, const std::string &dtype) :
			Tensor(shape, typeFromString(dtype))
	{
	}

	Tensor::Tensor(const Tensor &other) :
			m_shape(other.m_shape),
			m_dtype(other.m_dtype),
			m_is_owning(other.m_is_owning)
	{
		create_stride();
		if (other.isOwning())
		{
			m_data = moxe::malloc(sizeInBytes());
			moxe::memcpy(this->data(), 0, other.data(), 0, sizeInBytes());
		}
		else
			this->m_data = other.m_data;
	}
	Tensor::Tensor(Tensor &&other) noexcept :
			m_data(other.m_data),
			m_shape(other.m_shape),
			m_dtype(other.m_dtype),
			m_is_owning(other.m_is_owning)
	{
		create_stride();
		other.m_data = nullptr;
		other.m_shape = Shape();
		other.m_dtype = DataType::UNKNOWN;
		other.m_is_owning = false;
		other.create_stride();
	}
	Tensor::~Tensor() noexcept
	{
		deallocate_if_owning();
	}
	Tensor& Tensor::operator=(const Tensor &other)
	{
		if (this != &other)
		{
			if (other.isOwning()) // make a full copy
			{
				if (not this->isOwning() or this->sizeInBytes() != other.sizeInBytes())
				{
					deallocate_if_owning();
					m_data = moxe::malloc(other.sizeInBytes());
				}
				moxe::memcpy(this->m_data, 0, other.data(), 0, other.sizeInBytes());
			}
			else
			{
				deallocate_if_owning(); // assigning a view produces a view
				this->m_data = other.m_data;
			}
			this->m_shape = other.shape();
			this->m_dtype = other.dtype();
			this->m_is_owning = other.m_is_owning;
			create_stride();
		}
		return *this;
	}
	Tensor& Tensor::operator=(Tensor &&other) noexcept
	{
		if (this != &other)
		{
			std::swap(this->m_data, other.m_data);
			std::swap(this->m_shape, other.m_shape);
			std::swap(this->m_dtype, other.m_dtype);
			std::swap(this->m_is_owning, other.m_is_owning);
			create_stride();
			other.create_stride();
		}
		return *this;
	}

	std::string Tensor::info(bool full) const
	{
		if (full)
		{
			std::string result;
			result += std::string("data type : ") + dtype() + '\n';
			result += std::string("shape     : ") + shape().toString() + '\n';
			result += std::string("volume    : ") + std::to_string(volume()) + '\n';
			result += std::string("bytes     : ") + std::to_string(sizeInBytes()) + '\n';
			result += std::string("is owning : ") + std::to_string(isOwning()) + '\n';
			result += std::string("is view   : ") + std::to_string(isView()) + '\n';
			return result;
		}
		else
		{
			if (isOwning())
				return std::string("Tensor<") + dtype() + ">" + m_shape.toString();
			else
				return std::string("TensorView<") + dtype() + ">" + m_shape.toString();
		}
	}

	DataType Tensor::dtype() const noexcept
	{
		return m_dtype;
	}
	size_t Tensor::sizeInBytes() const noexcept
	{
		return sizeOf(dtype()) * volume();
	}

	bool Tensor::isOwning() const noexcept
	{
		return m_is_owning;
	}
	bool Tensor::isView() const noexcept
	{
		return not isOwning() and not isEmpty();
	}
	bool Tensor::isEmpty() const noexcept
	{
		return rank() == 0;
	}

	int Tensor::rank() const noexcept
	{
		return m_shape.rank();
	}
	int Tensor::dim(int idx) const
	{
		return m_shape.dim(idx);
	}
	int Tensor::firstDim() const noexcept
	{
		return m_shape.firstDim();
	}
	int Tensor::lastDim() const noexcept
	{
		return m_shape.lastDim();
	}
	int Tensor::volume() const noexcept
	{
		return m_shape.volume();
	}
	const Shape& Tensor::shape() const noexcept
	{
		return m_shape;
	}

	void Tensor::reshape(const Shape &newShape)
	{
		if (this->m_shape.volume() != newShape.volume())
			throw ShapeMismatch(METHOD_NAME, "trying to reshape " + shape().toString() + " into " + newShape.toString());

		this->m_shape = newShape;
		create_stride();
	}

	void Tensor::zeroall()
	{
		moxe::memzero(data(), 0, sizeInBytes());
	}
	void Tensor::setall(double value)
	{
		if (isEmpty())
			return;
		uint64_t tmp = 0u;
		store(value, &tmp, dtype());
		moxe::memset(data(), 0, sizeInBytes(), &tmp, sizeOf(dtype()));
	}

	Tensor Tensor::view(const Shape &shape) const
	{
		return view(shape, 0);
	}
	Tensor Tensor::view(const Shape &shape, size_t offsetInElements) const
	{
		if (offsetInElements + shape.volume() > static_cast<size_t>(this->volume()))
			throw ShapeMismatch(METHOD_NAME, "view would extend beyond the original tensor");

		Tensor result;
		result.m_data = const_cast<uint8_t*>(reinterpret_cast<const uint8_t*>(data())) + sizeOf(dtype()) * offsetInElements;
		result.m_shape = shape;
		result.m_dtype = dtype();
		result.m_is_owning = false;
		result.create_stride();
		return result;
	}

	const void* Tensor::data() const noexcept
	{
		return m_data;
	}
	void* Tensor::data() noexcept
	{
		return m_data;
	}
	double Tensor::get(std::initializer_list<int> idx) const
	{
		return at(idx);
	}
	void Tensor::set(double value, std::initializer_list<int> idx)
	{
		at(idx) = value;
	}

	Tensor::const_reference Tensor::at(std::initializer_list<int> idx) const
	{
		return const_reference(m_data, get_index(idx.begin(), idx.size()), dtype());
	}
	Tensor::reference Tensor::at(std::initializer_list<int> idx)
	{
		return reference(m_data, get_index(idx.begin(), idx.size()), dtype());
	}

	std::vector<double> Tensor::toVector() const
	{
		std::vector<double> result(volume());
		const uint8_t *ptr = reinterpret_cast<const uint8_t*>(data());
		for (int i = 0; i < volume(); i++)
			result[i] = load<double>(ptr + sizeOf(dtype()) * i, dtype());
		return result;
	}

	/*
	 * private
	 */
	size_t Tensor::get_index(const int *ptr, size_t size) const
	{
		if (static_cast<int>(size) != rank())
			throw ShapeMismatch(METHOD_NAME, rank(), static_cast<int>(size));

		assert(ptr != nullptr);
		size_t result = 0;
		for (int i = 0; i < rank(); i++)
		{
			if (ptr[i] < 0 or ptr[i] >= m_shape[i])
				throw IndexOutOfBounds(METHOD_NAME, std::string("index:") + std::to_string(i), ptr[i], m_shape[i]);
			result += m_stride[i] * static_cast<uint32_t>(ptr[i]);
		}
		return result;
	}
	void Tensor::create_stride() noexcept
	{
		uint32_t tmp = 1;
		for (int i = Shape::max_dimension - 1; i >= m_shape.rank(); i--)
			m_stride[i] = 0;
		for (int i = m_shape.rank() - 1; i >= 0; i--)
		{
			m_stride[i] = tmp;
			tmp *= static_cast<uint32_t>(m_shape.data()[i]);
		}
	}
	void Tensor::deallocate_if_owning()
	{
		if (isOwning())
			moxe::free(m_data);
		m_data = nullptr;
	}

	Tensor toTensor(std::initializer_list<float> data, DataType dtype)
	{
		Tensor result(Shape( { static_cast<int>(data.size()) }), dtype);
		for (int i = 0; i < result.volume(); i++)
			result.at( { i }) = data.begin()[i];
		return result;
	}
	Tensor toTensor(std::initializer_list<std::initializer_list<float>> data, DataType dtype)
	{
		const int rows = data.size();
		const int columns = (rows == 0) ? 0 : data.begin()[0].size();
		Tensor result(Shape( { rows, columns }), dtype);
		for (int i = 0; i < rows; i++)
		{
			if (static_cast<int>(data.begin()[i].size()) != columns)
				throw ShapeMismatch(METHOD_NAME, "all rows must have the same length");
			for (int j = 0; j < columns; j++)
				result.at( { i, j }) = data.begin()[i].begin()[j];
		}
		return result;
	}

} /* namespace moxe */
