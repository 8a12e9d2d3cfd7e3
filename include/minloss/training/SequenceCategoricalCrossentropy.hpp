/*
 * SequenceCategoricalCrossentropy.hpp
 *
 *  Created on: Mar 8, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_TRAINING_SEQUENCECATEGORICALCROSSENTROPY_HPP_
#define MINLOSS_TRAINING_SEQUENCECATEGORICALCROSSENTROPY_HPP_

#include <minloss/training/LossFunction.hpp>
#include <minloss/training/CategoricalCrossentropy.hpp>

namespace mls
{

	/*
	 * Applies CategoricalCrossentropy to every position of a sequence of batches.
	 * Normalization divides by the number of sequence positions, not by the number of rows.
	 */
	class SequenceCategoricalCrossentropy: public SequenceLoss
	{
			CategoricalCrossentropy m_position_loss;
			bool m_normalize;
		public:
			explicit SequenceCategoricalCrossentropy(bool normalize = true) noexcept;

			bool isNormalized() const noexcept;

			std::string name() const;
			Json getConfig() const;
			std::unique_ptr<LossFunction> clone(const Json &config) const;

			std::vector<Tensor> getGradient(const std::vector<Tensor> &guesses, const std::vector<Labels> &truths) const;
			float getLoss(const std::vector<Tensor> &guesses, const std::vector<Labels> &truths) const;
			std::pair<float, std::vector<Tensor>> operator()(const std::vector<Tensor> &guesses, const std::vector<Labels> &truths) const;
	};

} /* namespace mls */

#endif /* MINLOSS_TRAINING_SEQUENCECATEGORICALCROSSENTROPY_HPP_ */
