/*
 * SequenceCategoricalCrossentropy.cpp
 *
 *  Created on: Mar 8, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/training/SequenceCategoricalCrossentropy.hpp>
#include <minloss/core/math.hpp>
#include <minloss/utils/json.hpp>

namespace mls
{
	SequenceCategoricalCrossentropy::SequenceCategoricalCrossentropy(bool normalize) noexcept :
			m_position_loss(false),
			m_normalize(normalize)
	{
	}

	bool SequenceCategoricalCrossentropy::isNormalized() const noexcept
	{
		return m_normalize;
	}

	std::string SequenceCategoricalCrossentropy::name() const
	{
		return "SequenceCategoricalCrossentropy";
	}
	Json SequenceCategoricalCrossentropy::getConfig() const
	{
		Json result = LossFunction::getConfig();
		result["normalize"] = m_normalize;
		return result;
	}
	std::unique_ptr<LossFunction> SequenceCategoricalCrossentropy::clone(const Json &config) const
	{
		check_config(config, { "normalize" });
		return std::make_unique<SequenceCategoricalCrossentropy>(get_option(config, "normalize", true));
	}

	std::vector<Tensor> SequenceCategoricalCrossentropy::getGradient(const std::vector<Tensor> &guesses, const std::vector<Labels> &truths) const
	{
		return this->operator()(guesses, truths).second;
	}
	float SequenceCategoricalCrossentropy::getLoss(const std::vector<Tensor> &guesses, const std::vector<Labels> &truths) const
	{
		return this->operator()(guesses, truths).first;
	}
	std::pair<float, std::vector<Tensor>> SequenceCategoricalCrossentropy::operator()(const std::vector<Tensor> &guesses,
			const std::vector<Labels> &truths) const
	{
		if (guesses.size() != truths.size())
			throw ShapeMismatch(METHOD_NAME, "got " + std::to_string(guesses.size()) + " guesses but " + std::to_string(truths.size()) + " labels");

		const float scale = (m_normalize and not guesses.empty()) ? 1.0f / guesses.size() : 1.0f;
		std::vector<Tensor> gradients;
		gradients.reserve(guesses.size());
		double loss = 0.0;
		for (size_t i = 0; i < guesses.size(); i++)
		{
			Tensor gradient = m_position_loss.getGradient(guesses[i], truths[i]);
			if (m_normalize)
				scaleTensor(gradient, scale);
			loss += sumOfSquares(gradient);
			gradients.push_back(std::move(gradient));
		}
		return std::pair<float, std::vector<Tensor>>(loss, std::move(gradients));
	}

} /* namespace mls */
