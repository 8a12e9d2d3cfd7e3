/*
 * test_CosineDistance.cpp
 *
 *  Created on: Mar 11, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/training/CosineDistance.hpp>
#include <minloss/utils/testing_util.hpp>

#include <gtest/gtest.h>

#include <cmath>

namespace mls
{
	TEST(TestCosineDistance, default_config)
	{
		CosineDistance loss;
		EXPECT_FALSE(loss.isNormalized());
		EXPECT_FALSE(loss.isIgnoringZeros());
		EXPECT_EQ(loss.name(), "CosineDistance");
	}
	TEST(TestCosineDistance, orthogonal)
	{
		const Tensor a = toTensor( { { 0.0f, 2.0f }, { 0.0f, 5.0f } });
		const Tensor b = toTensor( { { 8.0f, 0.0f }, { 7.0f, 0.0f } });

		const Tensor gradient = CosineDistance(true).getGradient(a, b);
		ASSERT_EQ(gradient.shape(), a.shape());
		EXPECT_LT(gradient.get( { 0, 0 }), 0.0f);
		EXPECT_GT(gradient.get( { 0, 1 }), 0.0f);
		EXPECT_LT(gradient.get( { 1, 0 }), 0.0f);
		EXPECT_GT(gradient.get( { 1, 1 }), 0.0f);

		EXPECT_NEAR(CosineDistance(false).getLoss(a, b), 2.0f, 1.0e-4f);
		EXPECT_NEAR(CosineDistance(true).getLoss(a, b), 1.0f, 1.0e-4f);
	}
	TEST(TestCosineDistance, parallel)
	{
		const Tensor a = toTensor( { { 1.0f, 2.0f }, { 8.0f, 9.0f }, { 3.0f, 3.0f } });
		const Tensor b = toTensor( { { 1.0f, 2.0f }, { 80.0f, 90.0f }, { 300.0f, 300.0f } });

		const Tensor gradient = CosineDistance().getGradient(a, b);
		EXPECT_LT(testing::maxAbsDiff(gradient, Tensor(a.shape())), 1.0e-4);
		EXPECT_NEAR(CosineDistance(false).getLoss(a, b), 0.0f, 1.0e-4f);
		EXPECT_NEAR(CosineDistance(true).getLoss(a, b), 0.0f, 1.0e-4f);
	}
	TEST(TestCosineDistance, normalize_does_not_scale_gradient)
	{
		Tensor a(Shape( { 3, 4 }));
		Tensor b(Shape( { 3, 4 }));
		testing::initForTest(a, 0.0);
		testing::initForTest(b, 2.0);

		EXPECT_EQ(testing::maxAbsDiff(CosineDistance(true).getGradient(a, b), CosineDistance(false).getGradient(a, b)), 0.0);
		EXPECT_NEAR(CosineDistance(true).getLoss(a, b) * 3.0f, CosineDistance(false).getLoss(a, b), 1.0e-5f);
	}
	TEST(TestCosineDistance, numerical_gradient)
	{
		Tensor guesses(Shape( { 3, 5 }));
		Tensor truths(Shape( { 3, 5 }));
		testing::initForTest(guesses, 0.0);
		testing::initForTest(truths, 1.7);

		const CosineDistance loss;
		const Tensor analytical = loss.getGradient(guesses, truths);
		const Tensor numerical = testing::numericalGradient(loss, guesses, truths, 1.0e-2);
		EXPECT_LT(testing::maxAbsDiff(analytical, numerical), 1.0e-3);
	}
	TEST(TestCosineDistance, identity)
	{
		Tensor x(Shape( { 4, 6 }));
		testing::initForTest(x, 0.7);
		x.set(0.0f, { 1, 0 });

		const CosineDistance loss(false, true);
		EXPECT_LT(testing::maxAbsDiff(loss.getGradient(x, x), Tensor(x.shape())), 1.0e-5);
		EXPECT_NEAR(loss.getLoss(x, x), 0.0f, 1.0e-5f);
	}
	TEST(TestCosineDistance, ignore_zeros)
	{
		const Tensor a = toTensor( { { 0.0f, 0.0f }, { 1.0f, 0.0f } });
		const Tensor b = toTensor( { { 1.0f, 1.0f }, { 0.0f, 1.0f } });

		const CosineDistance loss(false, true);
		const std::pair<float, Tensor> result = loss(a, b);
		EXPECT_EQ(result.second.get( { 0, 0 }), 0.0f);
		EXPECT_EQ(result.second.get( { 0, 1 }), 0.0f);
		EXPECT_LT(result.second.get( { 1, 1 }), -0.5f);
		EXPECT_NEAR(result.first, 1.0f, 1.0e-4f);

		const Tensor zero_truth = toTensor( { { 1.0f, 1.0f }, { 0.0f, 0.0f } });
		EXPECT_NEAR(loss.getLoss(b, zero_truth), 0.0f, 1.0e-4f);
	}
	TEST(TestCosineDistance, zero_rows_stay_finite)
	{
		const Tensor a = toTensor( { { 0.0f, 0.0f, 0.0f } });
		const Tensor b = toTensor( { { 1.0f, 2.0f, 3.0f } });

		const std::pair<float, Tensor> result = CosineDistance()(a, b);
		EXPECT_TRUE(std::isfinite(result.first));
		for (int i = 0; i < result.second.volume(); i++)
			EXPECT_TRUE(std::isfinite(result.second.data()[i]));
	}
	TEST(TestCosineDistance, combined_call)
	{
		Tensor a(Shape( { 4, 3 }));
		Tensor b(Shape( { 4, 3 }));
		testing::initForTest(a, 0.0);
		testing::initForTest(b, 0.4);

		const CosineDistance loss(true, false);
		const std::pair<float, Tensor> result = loss(a, b);
		EXPECT_EQ(result.first, loss.getLoss(a, b));
		EXPECT_EQ(testing::maxAbsDiff(result.second, loss.getGradient(a, b)), 0.0);
	}
	TEST(TestCosineDistance, sparse_labels)
	{
		const Tensor guesses = toTensor( { { 0.2f, 0.8f }, { 0.6f, 0.4f } });
		const Tensor dense = toTensor( { { 0.0f, 1.0f }, { 1.0f, 0.0f } });

		const CosineDistance loss;
		EXPECT_EQ(loss.getLoss(guesses, Labels( { 1, 0 })), loss.getLoss(guesses, dense));
	}
	TEST(TestCosineDistance, unmatched_width)
	{
		const Tensor a = toTensor( { { 1.0f, 2.0f, 3.0f } });
		const Tensor b = toTensor( { { 1.0f, 2.0f } });
		EXPECT_THROW(CosineDistance().getGradient(a, b), ShapeMismatch);
		EXPECT_THROW(CosineDistance().getLoss(a, b), ShapeMismatch);
	}

} /* namespace mls */
