/*
 * L2Distance.hpp
 *
 *  Created on: Mar 8, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_TRAINING_L2DISTANCE_HPP_
#define MINLOSS_TRAINING_L2DISTANCE_HPP_

#include <minloss/training/LossFunction.hpp>

namespace mls
{

	/*
	 * Squared euclidean distance. The gradient is the (optionally row-count normalized) difference of guesses and truths,
	 * the loss is the sum of its squares.
	 */
	class L2Distance: public Loss
	{
			bool m_normalize;
		public:
			explicit L2Distance(bool normalize = false) noexcept;

			bool isNormalized() const noexcept;

			std::string name() const;
			Json getConfig() const;
			std::unique_ptr<LossFunction> clone(const Json &config) const;

			Tensor getGradient(const Tensor &guesses, const Labels &truths) const;
			float getLoss(const Tensor &guesses, const Labels &truths) const;
			std::pair<float, Tensor> operator()(const Tensor &guesses, const Labels &truths) const;
	};

} /* namespace mls */

#endif /* MINLOSS_TRAINING_L2DISTANCE_HPP_ */
