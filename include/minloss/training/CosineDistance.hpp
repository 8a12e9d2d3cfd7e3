/*
 * CosineDistance.hpp
 *
 *  Created on: Mar 9, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_TRAINING_COSINEDISTANCE_HPP_
#define MINLOSS_TRAINING_COSINEDISTANCE_HPP_

#include <minloss/training/LossFunction.hpp>

namespace mls
{

	/*
	 * Row-wise (1 - cosine similarity), summed over the batch (averaged if normalized).
	 * A small constant is added to every element before computing norms and products.
	 * If 'ignore_zeros' is set, rows where either vector is all zeros do not contribute to the loss nor to the gradient.
	 * Otherwise the caller is responsible for avoiding such rows.
	 */
	class CosineDistance: public Loss
	{
			bool m_normalize;
			bool m_ignore_zeros;
		public:
			static constexpr double epsilon = 1.0e-8;

			explicit CosineDistance(bool normalize = false, bool ignoreZeros = false) noexcept;

			bool isNormalized() const noexcept;
			bool isIgnoringZeros() const noexcept;

			std::string name() const;
			Json getConfig() const;
			std::unique_ptr<LossFunction> clone(const Json &config) const;

			Tensor getGradient(const Tensor &guesses, const Labels &truths) const;
			float getLoss(const Tensor &guesses, const Labels &truths) const;
			std::pair<float, Tensor> operator()(const Tensor &guesses, const Labels &truths) const;
		private:
			double compute(const Tensor &guesses, const Tensor &truths, Tensor *gradient) const;
	};

} /* namespace mls */

#endif /* MINLOSS_TRAINING_COSINEDISTANCE_HPP_ */
