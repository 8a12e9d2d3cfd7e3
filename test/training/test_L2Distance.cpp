/*
 * test_L2Distance.cpp
 *
 *  Created on: Mar 11, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/training/L2Distance.hpp>
#include <minloss/utils/testing_util.hpp>

#include <gtest/gtest.h>

namespace mls
{
	TEST(TestL2Distance, default_config)
	{
		L2Distance loss;
		EXPECT_FALSE(loss.isNormalized());
		EXPECT_EQ(loss.name(), "L2Distance");
	}
	TEST(TestL2Distance, gradient)
	{
		const Tensor a = toTensor( { { 1.0f, 2.0f }, { 8.0f, 9.0f } });
		const Tensor b = toTensor( { { 1.0f, 2.0f }, { 10.0f, 5.0f } });

		const Tensor gradient = L2Distance().getGradient(a, b);
		ASSERT_EQ(gradient.shape(), a.shape());
		EXPECT_NEAR(gradient.get( { 0, 0 }), 0.0f, 1.0e-4f);
		EXPECT_NEAR(gradient.get( { 0, 1 }), 0.0f, 1.0e-4f);
		EXPECT_NEAR(gradient.get( { 1, 0 }), -2.0f, 1.0e-4f);
		EXPECT_NEAR(gradient.get( { 1, 1 }), 4.0f, 1.0e-4f);

		const Tensor normalized = L2Distance(true).getGradient(a, b);
		EXPECT_NEAR(normalized.get( { 1, 0 }), -1.0f, 1.0e-4f);
		EXPECT_NEAR(normalized.get( { 1, 1 }), 2.0f, 1.0e-4f);
	}
	TEST(TestL2Distance, loss)
	{
		const Tensor a = toTensor( { { 1.0f, 2.0f }, { 8.0f, 9.0f } });
		const Tensor b = toTensor( { { 1.0f, 2.0f }, { 10.0f, 5.0f } });

		EXPECT_NEAR(L2Distance(false).getLoss(a, b), 20.0f, 1.0e-4f);
		EXPECT_NEAR(L2Distance(true).getLoss(a, b), 5.0f, 1.0e-4f);
	}
	TEST(TestL2Distance, identity)
	{
		Tensor x(Shape( { 6, 5 }));
		testing::initForTest(x, 0.3);

		for (bool normalize : { false, true })
		{
			const L2Distance loss(normalize);
			EXPECT_EQ(testing::maxAbsDiff(loss.getGradient(x, x), Tensor(x.shape())), 0.0);
			EXPECT_EQ(loss.getLoss(x, x), 0.0f);
		}
	}
	TEST(TestL2Distance, sparse_labels)
	{
		const Tensor guesses = toTensor( { { 0.2f, 0.8f }, { 0.6f, 0.4f } });
		const Tensor dense = toTensor( { { 0.0f, 1.0f }, { 1.0f, 0.0f } });

		const L2Distance loss;
		EXPECT_EQ(testing::maxAbsDiff(loss.getGradient(guesses, Labels( { 1, 0 })), loss.getGradient(guesses, dense)), 0.0);
	}
	TEST(TestL2Distance, combined_call)
	{
		Tensor a(Shape( { 4, 3 }));
		Tensor b(Shape( { 4, 3 }));
		testing::initForTest(a, 0.0);
		testing::initForTest(b, 1.0);

		const L2Distance loss(true);
		const std::pair<float, Tensor> result = loss(a, b);
		EXPECT_EQ(result.first, loss.getLoss(a, b));
		EXPECT_EQ(testing::maxAbsDiff(result.second, loss.getGradient(a, b)), 0.0);
	}
	TEST(TestL2Distance, shape_mismatch)
	{
		const Tensor a = toTensor( { { 1.0f, 2.0f, 3.0f } });
		const Tensor b = toTensor( { { 1.0f, 2.0f } });
		EXPECT_THROW(L2Distance().getGradient(a, b), ShapeMismatch);
		EXPECT_THROW(L2Distance().getLoss(a, b), ShapeMismatch);
	}

} /* namespace mls */
