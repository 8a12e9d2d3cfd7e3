/*
 * CategoricalCrossentropy.hpp
 *
 *  Created on: Mar 7, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_TRAINING_CATEGORICALCROSSENTROPY_HPP_
#define MINLOSS_TRAINING_CATEGORICALCROSSENTROPY_HPP_

#include <minloss/training/LossFunction.hpp>

namespace mls
{

	/*
	 * Crossentropy for guesses that are already softmax probabilities, so the gradient with respect to logits is (guess - target).
	 * With normalization the gradient is divided by the number of rows.
	 * The monitoring loss is the sum of squares of that gradient.
	 */
	class CategoricalCrossentropy: public Loss
	{
			bool m_normalize;
		public:
			static constexpr float epsilon = 1.0e-7f;

			explicit CategoricalCrossentropy(bool normalize = true) noexcept;

			bool isNormalized() const noexcept;

			std::string name() const;
			Json getConfig() const;
			std::unique_ptr<LossFunction> clone(const Json &config) const;

			Tensor getGradient(const Tensor &guesses, const Labels &truths) const;
			float getLoss(const Tensor &guesses, const Labels &truths) const;
			std::pair<float, Tensor> operator()(const Tensor &guesses, const Labels &truths) const;

			/*
			 * Negative log-likelihood of the targets, -sum(target * log(guess + epsilon)), divided by the number of rows if normalized.
			 */
			float getLogLoss(const Tensor &guesses, const Labels &truths) const;
	};

} /* namespace mls */

#endif /* MINLOSS_TRAINING_CATEGORICALCROSSENTROPY_HPP_ */
