/*
 * LossFunction.cpp
 *
 *  Created on: Mar 7, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/training/LossFunction.hpp>
#include <minloss/training/CategoricalCrossentropy.hpp>
#include <minloss/training/SequenceCategoricalCrossentropy.hpp>
#include <minloss/training/L2Distance.hpp>
#include <minloss/training/CosineDistance.hpp>
#include <minloss/utils/json.hpp>
#include <minloss/utils/string_util.hpp>

#include <algorithm>

namespace
{
	const char *supported_version = "v1";

	std::string strip_version(const char *function, const std::string &registered_name)
	{
		const std::vector<std::string> tmp = split(registered_name, '.');
		if (tmp.size() > 2 or tmp[0].empty())
			throw mls::InvalidConfiguration(function, "name", "must have form 'Name' or 'Name.v1', got '" + registered_name + "'");
		if (tmp.size() == 2 and tmp[1] != supported_version)
			throw mls::InvalidConfiguration(function, "name", "has unsupported version '" + tmp[1] + "'");
		return tmp[0];
	}
}

namespace mls
{
	Json LossFunction::getConfig() const
	{
		Json result(JsonType::Object);
		result["name"] = name() + "." + supported_version;
		return result;
	}
	void LossFunction::check_config(const Json &config, std::initializer_list<const char*> options) const
	{
		if (not config.isObject())
			throw InvalidConfiguration(METHOD_NAME, std::string("configuration must be an object, got ") + config.storedType());
		for (int i = 0; i < config.size(); i++)
		{
			const std::string &key = config.entry(i).first;
			if (key == "name")
			{
				if (not config.entry(i).second.isString())
					throw InvalidConfiguration(METHOD_NAME, key, std::string("must be a string, got ") + config.entry(i).second.storedType());
				if (strip_version(METHOD_NAME, config.entry(i).second.getString()) != name())
					throw InvalidConfiguration(METHOD_NAME, key, "'" + config.entry(i).second.getString() + "' does not match '" + name() + "'");
				continue;
			}
			const bool is_known = std::any_of(options.begin(), options.end(), [&key](const char *option)
			{
				return key == option;
			});
			if (not is_known)
				throw InvalidConfiguration(METHOD_NAME, key, "is not recognized by " + name());
		}
	}
	bool LossFunction::get_option(const Json &config, const char *key, bool default_value)
	{
		const Json *value = config.find(key);
		if (value == nullptr)
			return default_value;
		if (not value->isBool())
			throw InvalidConfiguration(METHOD_NAME, key, std::string("must be a bool, got ") + value->storedType());
		return value->getBool();
	}

	std::unique_ptr<LossFunction> loadLoss(const Json &config)
	{
		static const CategoricalCrossentropy categorical_crossentropy;
		static const SequenceCategoricalCrossentropy sequence_categorical_crossentropy;
		static const L2Distance l2_distance;
		static const CosineDistance cosine_distance;

		if (not config.isObject())
			throw InvalidConfiguration(METHOD_NAME, std::string("configuration must be an object, got ") + config.storedType());
		const Json *registered_name = config.find("name");
		if (registered_name == nullptr)
			throw InvalidConfiguration(METHOD_NAME, "name", "is required");
		if (not registered_name->isString())
			throw InvalidConfiguration(METHOD_NAME, "name", std::string("must be a string, got ") + registered_name->storedType());

		const std::string name = strip_version(METHOD_NAME, registered_name->getString());
		if (name == categorical_crossentropy.name())
			return categorical_crossentropy.clone(config);
		if (name == sequence_categorical_crossentropy.name())
			return sequence_categorical_crossentropy.clone(config);
		if (name == l2_distance.name())
			return l2_distance.clone(config);
		if (name == cosine_distance.name())
			return cosine_distance.clone(config);

		throw InvalidConfiguration(METHOD_NAME, "name", "refers to unknown loss '" + name + "'");
	}

} /* namespace mls */
