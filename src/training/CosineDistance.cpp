/*
 * CosineDistance.cpp
 *
 *  Created on: Mar 9, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/training/CosineDistance.hpp>
#include <minloss/core/math.hpp>
#include <minloss/utils/json.hpp>

namespace mls
{
	CosineDistance::CosineDistance(bool normalize, bool ignoreZeros) noexcept :
			m_normalize(normalize),
			m_ignore_zeros(ignoreZeros)
	{
	}

	bool CosineDistance::isNormalized() const noexcept
	{
		return m_normalize;
	}
	bool CosineDistance::isIgnoringZeros() const noexcept
	{
		return m_ignore_zeros;
	}

	std::string CosineDistance::name() const
	{
		return "CosineDistance";
	}
	Json CosineDistance::getConfig() const
	{
		Json result = LossFunction::getConfig();
		result["normalize"] = m_normalize;
		result["ignore_zeros"] = m_ignore_zeros;
		return result;
	}
	std::unique_ptr<LossFunction> CosineDistance::clone(const Json &config) const
	{
		check_config(config, { "normalize", "ignore_zeros" });
		return std::make_unique<CosineDistance>(get_option(config, "normalize", false), get_option(config, "ignore_zeros", false));
	}

	Tensor CosineDistance::getGradient(const Tensor &guesses, const Labels &truths) const
	{
		return this->operator()(guesses, truths).second;
	}
	float CosineDistance::getLoss(const Tensor &guesses, const Labels &truths) const
	{
		if (guesses.rank() != 2)
			throw ShapeMismatch(METHOD_NAME, 2, guesses.rank());
		return compute(guesses, truths.toDense(guesses.shape()), nullptr);
	}
	std::pair<float, Tensor> CosineDistance::operator()(const Tensor &guesses, const Labels &truths) const
	{
		if (guesses.rank() != 2)
			throw ShapeMismatch(METHOD_NAME, 2, guesses.rank());
		Tensor gradient(guesses.shape());
		const float loss = compute(guesses, truths.toDense(guesses.shape()), &gradient);
		return std::pair<float, Tensor>(loss, std::move(gradient));
	}
	/*
	 * private
	 */
	double CosineDistance::compute(const Tensor &guesses, const Tensor &truths, Tensor *gradient) const
	{
		const int rows = guesses.firstDim();
		const int columns = guesses.lastDim();

		double loss = 0.0;
		for (int i = 0; i < rows; i++)
		{
			if (m_ignore_zeros and (isZeroRow(guesses, i) or isZeroRow(truths, i)))
				continue; // gradient row stays zero
			const double norm_guess = rowNorm(guesses, i, epsilon);
			const double norm_truth = rowNorm(truths, i, epsilon);
			const double mul_norms = norm_guess * norm_truth;
			const double cosine = rowDotProduct(guesses, truths, i, epsilon) / mul_norms;
			loss += 1.0 - cosine;

			if (gradient != nullptr)
			{
				const float *guess_ptr = guesses.data() + i * columns;
				const float *truth_ptr = truths.data() + i * columns;
				float *gradient_ptr = gradient->data() + i * columns;
				for (int j = 0; j < columns; j++)
					gradient_ptr[j] = (guess_ptr[j] + epsilon) * cosine / (norm_guess * norm_guess) - (truth_ptr[j] + epsilon) / mul_norms;
			}
		}
		if (m_normalize and rows > 0)
			loss /= rows;
		return loss;
	}

} /* namespace mls */
