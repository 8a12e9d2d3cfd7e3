/*
 * math.hpp
 *
 *  Created on: Mar 6, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_CORE_MATH_HPP_
#define MINLOSS_CORE_MATH_HPP_

namespace mls /* forward declarations */
{
	class Tensor;
}

namespace mls
{
	/*
	 * dst = lhs - rhs, all three must have the same shape
	 */
	void subtractTensors(Tensor &dst, const Tensor &lhs, const Tensor &rhs);
	void scaleTensor(Tensor &tensor, float scale) noexcept;
	double sumOfSquares(const Tensor &tensor) noexcept;

	bool isZeroRow(const Tensor &tensor, int row);

	// row-wise kernels for 2D tensors, 'offset' is added to every element before use
	double rowDotProduct(const Tensor &lhs, const Tensor &rhs, int row, double offset);
	double rowNorm(const Tensor &tensor, int row, double offset);

} /* namespace mls */

#endif /* MINLOSS_CORE_MATH_HPP_ */
