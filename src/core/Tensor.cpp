/*
 * Tensor.cpp
 *
 *  Created on: Mar 4, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/core/Tensor.hpp>
#include <minloss/core/ml_exceptions.hpp>
#include <minloss/utils/json.hpp>

#include <algorithm>
#include <cstring>

namespace
{
	std::vector<int> shape_of_json_array(const Json &json)
	{
		if (not json.isArray())
			throw JsonTypeError(METHOD_NAME, json.storedType());
		if (json.size() == 0)
			return std::vector<int>( { 0 });
		if (json[0].isArray())
			return std::vector<int>( { json.size(), json[0].size() });
		else
			return std::vector<int>( { json.size() });
	}
}

namespace mls
{
	Tensor::Tensor() noexcept
	{
		std::memset(m_stride, 0, sizeof(m_stride));
	}
	Tensor::Tensor(const Shape &shape) :
			m_data(shape.volume(), 0.0f),
			m_shape(shape)
	{
		create_stride();
	}
	Tensor::Tensor(const Json &json) :
			Tensor(Shape(shape_of_json_array(json)))
	{
		if (rank() == 1)
		{
			for (int i = 0; i < dim(0); i++)
				m_data[i] = json[i].getDouble();
		}
		else
		{
			for (int i = 0; i < dim(0); i++)
			{
				if (json[i].size() != dim(1))
					throw ShapeMismatch(METHOD_NAME, "row " + std::to_string(i) + " has " + std::to_string(json[i].size()) + " elements, expected "
							+ std::to_string(dim(1)));
				for (int j = 0; j < dim(1); j++)
					m_data[i * dim(1) + j] = json[i][j].getDouble();
			}
		}
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

	const float* Tensor::data() const noexcept
	{
		return m_data.data();
	}
	float* Tensor::data() noexcept
	{
		return m_data.data();
	}

	float Tensor::get(std::initializer_list<int> idx) const
	{
		return m_data[get_index(idx.begin(), idx.size())];
	}
	void Tensor::set(float value, std::initializer_list<int> idx)
	{
		m_data[get_index(idx.begin(), idx.size())] = value;
	}

	Json Tensor::serialize() const
	{
		Json result(JsonType::Array);
		if (rank() == 1)
		{
			for (int i = 0; i < dim(0); i++)
				result[i] = m_data[i];
		}
		if (rank() == 2)
		{
			for (int i = 0; i < dim(0); i++)
			{
				Json row(JsonType::Array);
				for (int j = 0; j < dim(1); j++)
					row[j] = m_data[i * dim(1) + j];
				result[i] = row;
			}
		}
		return result;
	}

	/*
	 * private
	 */
	size_t Tensor::get_index(const int *ptr, size_t size) const
	{
		if (static_cast<int>(size) != rank())
			throw ShapeMismatch(METHOD_NAME, rank(), static_cast<int>(size));
		size_t result = 0;
		for (int i = 0; i < rank(); i++)
		{
			if (ptr[i] < 0 or ptr[i] >= m_shape[i])
				throw IndexOutOfBounds(METHOD_NAME, std::string("index:") + std::to_string(i), ptr[i], m_shape[i]);
			result += m_stride[i] * static_cast<size_t>(ptr[i]);
		}
		return result;
	}
	void Tensor::create_stride() noexcept
	{
		int tmp = 1;
		for (int i = Shape::max_dimension - 1; i >= m_shape.rank(); i--)
			m_stride[i] = 0;
		for (int i = m_shape.rank() - 1; i >= 0; i--)
		{
			m_stride[i] = tmp;
			tmp *= m_shape[i];
		}
	}

	Tensor toTensor(std::initializer_list<float> data)
	{
		Tensor result(Shape( { static_cast<int>(data.size()) }));
		std::copy(data.begin(), data.end(), result.data());
		return result;
	}
	Tensor toTensor(std::initializer_list<std::initializer_list<float>> data)
	{
		const int rows = static_cast<int>(data.size());
		const int columns = (rows == 0) ? 0 : static_cast<int>(data.begin()[0].size());
		Tensor result(Shape( { rows, columns }));
		for (int i = 0; i < rows; i++)
		{
			const std::initializer_list<float> &row = data.begin()[i];
			if (static_cast<int>(row.size()) != columns)
				throw ShapeMismatch(METHOD_NAME, "row " + std::to_string(i) + " has " + std::to_string(row.size()) + " elements, expected "
						+ std::to_string(columns));
			std::copy(row.begin(), row.end(), result.data() + i * columns);
		}
		return result;
	}
} /* namespace mls */
