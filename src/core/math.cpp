/*
 * math.cpp
 *
 *  Created on: Mar 6, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/core/math.hpp>
#include <minloss/core/Tensor.hpp>
#include <minloss/core/ml_exceptions.hpp>

#include <cmath>

namespace
{
	using namespace mls;

	template<typename T>
	T square(T x) noexcept
	{
		return x * x;
	}

	const float* get_row(const Tensor &tensor, int row)
	{
		if (tensor.rank() != 2)
			throw ShapeMismatch(METHOD_NAME, 2, tensor.rank());
		if (row < 0 or row >= tensor.firstDim())
			throw IndexOutOfBounds(METHOD_NAME, "row", row, tensor.firstDim());
		return tensor.data() + row * tensor.lastDim();
	}
}

namespace mls
{
	void subtractTensors(Tensor &dst, const Tensor &lhs, const Tensor &rhs)
	{
		if (not same_shape(lhs, rhs))
			throw ShapeMismatch(METHOD_NAME, lhs.shape(), rhs.shape());
		if (not same_shape(dst, lhs))
			throw ShapeMismatch(METHOD_NAME, lhs.shape(), dst.shape());

		const int elements = lhs.volume();
		float *dst_ptr = dst.data();
		const float *lhs_ptr = lhs.data();
		const float *rhs_ptr = rhs.data();
		for (int i = 0; i < elements; i++)
			dst_ptr[i] = lhs_ptr[i] - rhs_ptr[i];
	}
	void scaleTensor(Tensor &tensor, float scale) noexcept
	{
		const int elements = tensor.volume();
		float *ptr = tensor.data();
		for (int i = 0; i < elements; i++)
			ptr[i] *= scale;
	}
	double sumOfSquares(const Tensor &tensor) noexcept
	{
		const int elements = tensor.volume();
		const float *ptr = tensor.data();
		double result = 0.0;
		for (int i = 0; i < elements; i++)
			result += square(static_cast<double>(ptr[i]));
		return result;
	}

	bool isZeroRow(const Tensor &tensor, int row)
	{
		const float *ptr = get_row(tensor, row);
		for (int i = 0; i < tensor.lastDim(); i++)
			if (ptr[i] != 0.0f)
				return false;
		return true;
	}

	double rowDotProduct(const Tensor &lhs, const Tensor &rhs, int row, double offset)
	{
		if (lhs.lastDim() != rhs.lastDim())
			throw ShapeMismatch(METHOD_NAME, lhs.shape(), rhs.shape());
		const float *lhs_ptr = get_row(lhs, row);
		const float *rhs_ptr = get_row(rhs, row);
		double result = 0.0;
		for (int i = 0; i < lhs.lastDim(); i++)
			result += (lhs_ptr[i] + offset) * (rhs_ptr[i] + offset);
		return result;
	}
	double rowNorm(const Tensor &tensor, int row, double offset)
	{
		const float *ptr = get_row(tensor, row);
		double result = 0.0;
		for (int i = 0; i < tensor.lastDim(); i++)
			result += square(ptr[i] + offset);
		return std::sqrt(result);
	}

} /* namespace mls */
