/*
 * testing_util.hpp
 *
 *  Created on: Mar 11, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_UTILS_TESTING_UTIL_HPP_
#define MINLOSS_UTILS_TESTING_UTIL_HPP_

#include <minloss/core/Tensor.hpp>

namespace mls /* forward declarations */
{
	class Labels;
	class Loss;
}

namespace mls
{
	namespace testing
	{
		void initForTest(Tensor &t, double shift, double scale = 1.0);
		double maxAbsDiff(const Tensor &lhs, const Tensor &rhs);

		/*
		 * Central finite-difference estimate of d(loss)/d(guesses).
		 */
		Tensor numericalGradient(const Loss &loss, const Tensor &guesses, const Labels &truths, double epsilon);
	}
}

#endif /* MINLOSS_UTILS_TESTING_UTIL_HPP_ */
