/*
 * Labels.cpp
 *
 *  Created on: Mar 6, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/core/Labels.hpp>
#include <minloss/core/ml_exceptions.hpp>
#include <minloss/utils/json.hpp>

#include <cmath>
#include <limits>
#include <utility>

namespace
{
	using namespace mls;

	std::vector<int32_t> load_sparse(const Json &json)
	{
		std::vector<int32_t> result(json.size());
		for (int i = 0; i < json.size(); i++)
		{
			const double value = json[i].getDouble();
			if (value != std::floor(value) or value < std::numeric_limits<int32_t>::min() or value > std::numeric_limits<int32_t>::max())
				throw InvalidConfiguration(METHOD_NAME, "sparse label[" + std::to_string(i) + "] must be an integer class index, got " + json[i].dump());
			result[i] = static_cast<int32_t>(value);
		}
		return result;
	}
	bool is_dense(const Json &json)
	{
		if (not json.isArray())
			throw JsonTypeError(METHOD_NAME, json.storedType());
		return json.size() > 0 and json[0].isArray();
	}
}

namespace mls
{
	Labels::Labels(const Tensor &dense) :
			m_data(dense)
	{
	}
	Labels::Labels(Tensor &&dense) noexcept :
			m_data(std::move(dense))
	{
	}
	Labels::Labels(const std::vector<int32_t> &sparse) :
			m_data(sparse)
	{
	}
	Labels::Labels(std::initializer_list<int32_t> sparse) :
			m_data(std::vector<int32_t>(sparse))
	{
	}
	Labels::Labels(const Json &json)
	{
		if (is_dense(json))
			m_data = Tensor(json);
		else
			m_data = load_sparse(json);
	}

	bool Labels::isSparse() const noexcept
	{
		return std::holds_alternative<std::vector<int32_t>>(m_data);
	}
	bool Labels::isDense() const noexcept
	{
		return std::holds_alternative<Tensor>(m_data);
	}
	const std::vector<int32_t>& Labels::sparse() const
	{
		if (not isSparse())
			throw LogicError(METHOD_NAME, "labels are stored in dense form");
		return std::get<std::vector<int32_t>>(m_data);
	}
	const Tensor& Labels::dense() const
	{
		if (not isDense())
			throw LogicError(METHOD_NAME, "labels are stored in sparse form");
		return std::get<Tensor>(m_data);
	}

	Tensor Labels::toDense(const Shape &guessShape) const
	{
		if (isDense())
		{
			if (dense().shape() != guessShape)
				throw ShapeMismatch(METHOD_NAME, guessShape, dense().shape());
			return dense();
		}

		if (guessShape.rank() != 2)
			throw ShapeMismatch(METHOD_NAME, 2, guessShape.rank());
		const std::vector<int32_t> &indices = sparse();
		const int rows = guessShape.firstDim();
		const int classes = guessShape.lastDim();
		if (static_cast<int>(indices.size()) != rows)
			throw ShapeMismatch(METHOD_NAME, "got " + std::to_string(indices.size()) + " sparse labels for " + std::to_string(rows) + " rows");

		Tensor result(guessShape);
		for (int i = 0; i < rows; i++)
		{
			if (indices[i] < 0 or indices[i] >= classes)
				throw IndexOutOfBounds(METHOD_NAME, "label[" + std::to_string(i) + "]", indices[i], classes);
			result.data()[i * classes + indices[i]] = 1.0f;
		}
		return result;
	}

} /* namespace mls */
