/*
 * L2Distance.cpp
 *
 *  Created on: Mar 8, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/training/L2Distance.hpp>
#include <minloss/core/math.hpp>
#include <minloss/utils/json.hpp>

namespace mls
{
	L2Distance::L2Distance(bool normalize) noexcept :
			m_normalize(normalize)
	{
	}

	bool L2Distance::isNormalized() const noexcept
	{
		return m_normalize;
	}

	std::string L2Distance::name() const
	{
		return "L2Distance";
	}
	Json L2Distance::getConfig() const
	{
		Json result = LossFunction::getConfig();
		result["normalize"] = m_normalize;
		return result;
	}
	std::unique_ptr<LossFunction> L2Distance::clone(const Json &config) const
	{
		check_config(config, { "normalize" });
		return std::make_unique<L2Distance>(get_option(config, "normalize", false));
	}

	Tensor L2Distance::getGradient(const Tensor &guesses, const Labels &truths) const
	{
		if (guesses.rank() != 2)
			throw ShapeMismatch(METHOD_NAME, 2, guesses.rank());
		const Tensor target = truths.toDense(guesses.shape());

		Tensor result(guesses.shape());
		subtractTensors(result, guesses, target);
		if (m_normalize and guesses.firstDim() > 0)
			scaleTensor(result, 1.0f / guesses.firstDim());
		return result;
	}
	float L2Distance::getLoss(const Tensor &guesses, const Labels &truths) const
	{
		return sumOfSquares(getGradient(guesses, truths));
	}
	std::pair<float, Tensor> L2Distance::operator()(const Tensor &guesses, const Labels &truths) const
	{
		Tensor gradient = getGradient(guesses, truths);
		const float loss = sumOfSquares(gradient);
		return std::pair<float, Tensor>(loss, std::move(gradient));
	}

} /* namespace mls */
