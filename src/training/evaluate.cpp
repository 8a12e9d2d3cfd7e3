/*
 * evaluate.cpp
 *
 *  Created on: Mar 12, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/training/evaluate.hpp>
#include <minloss/training/LossFunction.hpp>
#include <minloss/utils/json.hpp>

namespace
{
	using namespace mls;

	const Json& get_field(const Json &batch, const char *key)
	{
		if (not batch.isObject())
			throw InvalidConfiguration(METHOD_NAME, std::string("batch must be an object, got ") + batch.storedType());
		const Json *result = batch.find(key);
		if (result == nullptr)
			throw InvalidConfiguration(METHOD_NAME, key, "is required in batch");
		if (not result->isArray())
			throw InvalidConfiguration(METHOD_NAME, key, std::string("must be an array, got ") + result->storedType());
		return *result;
	}

	Json evaluate_batch(const Loss &loss, const Json &batch)
	{
		const Tensor guesses(get_field(batch, "guesses"));
		const Labels targets(get_field(batch, "targets"));
		const std::pair<float, Tensor> tmp = loss(guesses, targets);

		Json result(JsonType::Object);
		result["loss"] = tmp.first;
		result["gradient"] = tmp.second.serialize();
		return result;
	}
	Json evaluate_sequence(const SequenceLoss &loss, const Json &batch)
	{
		const Json &guesses_json = get_field(batch, "guesses");
		const Json &targets_json = get_field(batch, "targets");

		std::vector<Tensor> guesses;
		for (int i = 0; i < guesses_json.size(); i++)
			guesses.push_back(Tensor(guesses_json[i]));
		std::vector<Labels> targets;
		for (int i = 0; i < targets_json.size(); i++)
			targets.push_back(Labels(targets_json[i]));

		const std::pair<float, std::vector<Tensor>> tmp = loss(guesses, targets);

		Json result(JsonType::Object);
		result["loss"] = tmp.first;
		result["gradient"] = Json(JsonType::Array);
		for (size_t i = 0; i < tmp.second.size(); i++)
			result["gradient"][static_cast<int>(i)] = tmp.second[i].serialize();
		return result;
	}
}

namespace mls
{
	Json evaluateLoss(const LossFunction &loss, const Json &batch)
	{
		const Loss *batch_loss = dynamic_cast<const Loss*>(&loss);
		if (batch_loss != nullptr)
			return evaluate_batch(*batch_loss, batch);
		const SequenceLoss *sequence_loss = dynamic_cast<const SequenceLoss*>(&loss);
		if (sequence_loss != nullptr)
			return evaluate_sequence(*sequence_loss, batch);
		throw LogicError(METHOD_NAME, "'" + loss.name() + "' is neither a batch nor a sequence loss");
	}

} /* namespace mls */
