/*
 * test_LossFunction.cpp
 *
 *  Created on: Mar 11, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/training/LossFunction.hpp>
#include <minloss/training/CategoricalCrossentropy.hpp>
#include <minloss/training/SequenceCategoricalCrossentropy.hpp>
#include <minloss/training/L2Distance.hpp>
#include <minloss/training/CosineDistance.hpp>
#include <minloss/utils/json.hpp>
#include <minloss/utils/testing_util.hpp>

#include <gtest/gtest.h>

#include <type_traits>

namespace mls
{
	TEST(TestLossFunction, no_implicit_conversion_from_bool)
	{
		EXPECT_FALSE((std::is_convertible<bool, CategoricalCrossentropy>::value));
		EXPECT_FALSE((std::is_convertible<bool, SequenceCategoricalCrossentropy>::value));
		EXPECT_FALSE((std::is_convertible<bool, L2Distance>::value));
		EXPECT_FALSE((std::is_convertible<bool, CosineDistance>::value));
	}
	TEST(TestLossFunction, get_config)
	{
		EXPECT_EQ(CategoricalCrossentropy().getConfig().dump(), "{\"name\":\"CategoricalCrossentropy.v1\",\"normalize\":true}");
		EXPECT_EQ(SequenceCategoricalCrossentropy(false).getConfig().dump(),
				"{\"name\":\"SequenceCategoricalCrossentropy.v1\",\"normalize\":false}");
		EXPECT_EQ(L2Distance().getConfig().dump(), "{\"name\":\"L2Distance.v1\",\"normalize\":false}");
		EXPECT_EQ(CosineDistance(true, true).getConfig().dump(), "{\"name\":\"CosineDistance.v1\",\"normalize\":true,\"ignore_zeros\":true}");
	}
	TEST(TestLossFunction, load_with_defaults)
	{
		std::unique_ptr<LossFunction> loss = loadLoss(Json( { { "name", "CategoricalCrossentropy.v1" } }));
		ASSERT_NE(dynamic_cast<CategoricalCrossentropy*>(loss.get()), nullptr);
		EXPECT_TRUE(dynamic_cast<CategoricalCrossentropy*>(loss.get())->isNormalized());

		loss = loadLoss(Json( { { "name", "L2Distance" } }));
		ASSERT_NE(dynamic_cast<L2Distance*>(loss.get()), nullptr);
		EXPECT_FALSE(dynamic_cast<L2Distance*>(loss.get())->isNormalized());

		loss = loadLoss(Json( { { "name", "SequenceCategoricalCrossentropy.v1" } }));
		ASSERT_NE(dynamic_cast<SequenceCategoricalCrossentropy*>(loss.get()), nullptr);
		EXPECT_TRUE(dynamic_cast<SequenceCategoricalCrossentropy*>(loss.get())->isNormalized());
	}
	TEST(TestLossFunction, load_with_options)
	{
		std::unique_ptr<Loss> loss = loadLoss<Loss>(Json::load("{\"name\": \"CosineDistance.v1\", \"normalize\": true, \"ignore_zeros\": true}"));
		const CosineDistance *cosine = dynamic_cast<const CosineDistance*>(loss.get());
		ASSERT_NE(cosine, nullptr);
		EXPECT_TRUE(cosine->isNormalized());
		EXPECT_TRUE(cosine->isIgnoringZeros());

		Tensor zeros(Shape( { 3, 3 }));
		EXPECT_EQ(loss->getLoss(zeros, zeros), 0.0f);
	}
	TEST(TestLossFunction, config_round_trip)
	{
		const CategoricalCrossentropy cce(false);
		const SequenceCategoricalCrossentropy scce(false);
		const L2Distance l2(true);
		const CosineDistance cosine(true, false);
		const LossFunction *losses[] = { &cce, &scce, &l2, &cosine };

		for (const LossFunction *original : losses)
		{
			const Json config = original->getConfig();
			std::unique_ptr<LossFunction> loaded = loadLoss(Json::load(config.dump()));
			EXPECT_EQ(loaded->name(), original->name());
			EXPECT_EQ(loaded->getConfig().dump(), config.dump());
		}
	}
	TEST(TestLossFunction, clone)
	{
		const L2Distance prototype;
		std::unique_ptr<LossFunction> copy = prototype.clone(Json( { { "normalize", true } }));
		ASSERT_NE(dynamic_cast<L2Distance*>(copy.get()), nullptr);
		EXPECT_TRUE(dynamic_cast<L2Distance*>(copy.get())->isNormalized());

		EXPECT_THROW(prototype.clone(Json( { { "name", "CosineDistance.v1" } })), InvalidConfiguration);
	}
	TEST(TestLossFunction, requested_interface)
	{
		EXPECT_NE(loadLoss<SequenceLoss>(Json( { { "name", "SequenceCategoricalCrossentropy" } })).get(), nullptr);
		EXPECT_THROW(loadLoss<Loss>(Json( { { "name", "SequenceCategoricalCrossentropy" } })), InvalidConfiguration);
		EXPECT_THROW(loadLoss<SequenceLoss>(Json( { { "name", "L2Distance" } })), InvalidConfiguration);
	}
	TEST(TestLossFunction, invalid_config)
	{
		EXPECT_THROW(loadLoss(Json()), InvalidConfiguration);
		EXPECT_THROW(loadLoss(Json( { 1, 2 })), InvalidConfiguration);
		EXPECT_THROW(loadLoss(Json( { { "normalize", true } })), InvalidConfiguration);
		EXPECT_THROW(loadLoss(Json( { { "name", 1 } })), InvalidConfiguration);
		EXPECT_THROW(loadLoss(Json( { { "name", "HingeLoss.v1" } })), InvalidConfiguration);
		EXPECT_THROW(loadLoss(Json( { { "name", "L2Distance.v2" } })), InvalidConfiguration);
		EXPECT_THROW(loadLoss(Json( { { "name", "L2Distance.v1.v1" } })), InvalidConfiguration);
		EXPECT_THROW(loadLoss(Json( { { "name", ".v1" } })), InvalidConfiguration);
	}
	TEST(TestLossFunction, invalid_options)
	{
		EXPECT_THROW(loadLoss(Json( { { "name", "L2Distance.v1" }, { "ignore_zeros", true } })), InvalidConfiguration);
		EXPECT_THROW(loadLoss(Json( { { "name", "CategoricalCrossentropy.v1" }, { "normalise", true } })), InvalidConfiguration);
		EXPECT_THROW(loadLoss(Json( { { "name", "CosineDistance.v1" }, { "normalize", 1 } })), InvalidConfiguration);
		EXPECT_THROW(loadLoss(Json( { { "name", "CosineDistance.v1" }, { "ignore_zeros", "yes" } })), InvalidConfiguration);
	}
	TEST(TestLossFunction, loaded_losses_compute)
	{
		const Tensor scores(Shape( { 3, 3 }));
		const Labels labels( { 0, 1, 1 });

		for (const char *name : { "CategoricalCrossentropy.v1", "L2Distance.v1", "CosineDistance.v1" })
		{
			std::unique_ptr<Loss> loss = loadLoss<Loss>(Json( { { "name", name } }));
			const Tensor gradient = loss->getGradient(scores, scores);
			EXPECT_EQ(gradient.shape(), scores.shape());
			EXPECT_EQ(loss->getLoss(scores, labels), (*loss)(scores, labels).first);
		}

		std::unique_ptr<SequenceLoss> sequence = loadLoss<SequenceLoss>(Json( { { "name", "SequenceCategoricalCrossentropy.v1" } }));
		const std::vector<Tensor> gradient = sequence->getGradient( { scores }, { labels });
		ASSERT_EQ(gradient.size(), 1u);
		EXPECT_EQ(gradient[0].shape(), scores.shape());
	}

} /* namespace mls */
