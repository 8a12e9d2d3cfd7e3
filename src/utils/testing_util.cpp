/*
 * testing_util.cpp
 *
 *  Created on: Mar 11, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/utils/testing_util.hpp>
#include <minloss/core/Labels.hpp>
#include <minloss/core/ml_exceptions.hpp>
#include <minloss/training/LossFunction.hpp>

#include <algorithm>
#include <cmath>

namespace mls
{
	namespace testing
	{
		void initForTest(Tensor &t, double shift, double scale)
		{
			float *ptr = t.data();
			for (int i = 0; i < t.volume(); i++)
				ptr[i] = std::sin(i / 10.0 + shift) * scale;
		}
		double maxAbsDiff(const Tensor &lhs, const Tensor &rhs)
		{
			if (not same_shape(lhs, rhs))
				throw ShapeMismatch(METHOD_NAME, lhs.shape(), rhs.shape());
			double result = 0.0;
			for (int i = 0; i < lhs.volume(); i++)
				result = std::max(result, (double) std::abs(lhs.data()[i] - rhs.data()[i]));
			return result;
		}

		Tensor numericalGradient(const Loss &loss, const Tensor &guesses, const Labels &truths, double epsilon)
		{
			Tensor tmp = guesses;
			Tensor result(guesses.shape());
			for (int i = 0; i < guesses.volume(); i++)
			{
				const float original = tmp.data()[i];
				tmp.data()[i] = original + epsilon;
				const double loss_plus = loss.getLoss(tmp, truths);
				tmp.data()[i] = original - epsilon;
				const double loss_minus = loss.getLoss(tmp, truths);
				tmp.data()[i] = original;
				result.data()[i] = (loss_plus - loss_minus) / (2.0 * epsilon);
			}
			return result;
		}
	}
}
