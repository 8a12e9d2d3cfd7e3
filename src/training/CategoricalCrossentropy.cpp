/*
 * CategoricalCrossentropy.cpp
 *
 *  Created on: Mar 7, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/training/CategoricalCrossentropy.hpp>
#include <minloss/core/math.hpp>
#include <minloss/utils/json.hpp>

#include <cmath>

namespace
{
	using namespace mls;

	void check_guesses(const char *function, const Tensor &guesses)
	{
		if (guesses.rank() != 2)
			throw ShapeMismatch(function, 2, guesses.rank());
	}
}

namespace mls
{
	CategoricalCrossentropy::CategoricalCrossentropy(bool normalize) noexcept :
			m_normalize(normalize)
	{
	}

	bool CategoricalCrossentropy::isNormalized() const noexcept
	{
		return m_normalize;
	}

	std::string CategoricalCrossentropy::name() const
	{
		return "CategoricalCrossentropy";
	}
	Json CategoricalCrossentropy::getConfig() const
	{
		Json result = LossFunction::getConfig();
		result["normalize"] = m_normalize;
		return result;
	}
	std::unique_ptr<LossFunction> CategoricalCrossentropy::clone(const Json &config) const
	{
		check_config(config, { "normalize" });
		return std::make_unique<CategoricalCrossentropy>(get_option(config, "normalize", true));
	}

	Tensor CategoricalCrossentropy::getGradient(const Tensor &guesses, const Labels &truths) const
	{
		check_guesses(METHOD_NAME, guesses);
		const Tensor target = truths.toDense(guesses.shape());

		Tensor result(guesses.shape());
		subtractTensors(result, guesses, target);
		if (m_normalize and guesses.firstDim() > 0)
			scaleTensor(result, 1.0f / guesses.firstDim());
		return result;
	}
	float CategoricalCrossentropy::getLoss(const Tensor &guesses, const Labels &truths) const
	{
		return sumOfSquares(getGradient(guesses, truths));
	}
	std::pair<float, Tensor> CategoricalCrossentropy::operator()(const Tensor &guesses, const Labels &truths) const
	{
		Tensor gradient = getGradient(guesses, truths);
		const float loss = sumOfSquares(gradient);
		return std::pair<float, Tensor>(loss, std::move(gradient));
	}

	float CategoricalCrossentropy::getLogLoss(const Tensor &guesses, const Labels &truths) const
	{
		check_guesses(METHOD_NAME, guesses);
		const Tensor target = truths.toDense(guesses.shape());

		const int elements = guesses.volume();
		const float *guess_ptr = guesses.data();
		const float *target_ptr = target.data();

		double result = 0.0;
		for (int i = 0; i < elements; i++)
			if (target_ptr[i] != 0.0f)
				result -= target_ptr[i] * std::log(guess_ptr[i] + static_cast<double>(epsilon));
		if (m_normalize and guesses.firstDim() > 0)
			result /= guesses.firstDim();
		return result;
	}

} /* namespace mls */
