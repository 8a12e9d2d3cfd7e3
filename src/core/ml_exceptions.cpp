/*
 * ml_exceptions.cpp
 *
 *  Created on: Mar 4, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/core/ml_exceptions.hpp>

namespace mls
{
	RuntimeError::RuntimeError(const char *function, const std::string &comment) :
			runtime_error(std::string(function) + " : " + comment)
	{
	}

	IndexOutOfBounds::IndexOutOfBounds(const char *function, const std::string &index_name, int index_value, int range) :
			out_of_range(std::string(function) + " : '" + index_name + "' = " + std::to_string(index_value) + " out of range [0, " + std::to_string(range) + ")")
	{
	}

	LogicError::LogicError(const char *function, const std::string &comment) :
			std::logic_error(std::string(function) + " : " + comment)
	{
	}

	InvalidConfiguration::InvalidConfiguration(const char *function, const std::string &comment) :
			invalid_argument(std::string(function) + " : " + comment)
	{
	}
	InvalidConfiguration::InvalidConfiguration(const char *function, const std::string &key, const std::string &comment) :
			invalid_argument(std::string(function) + " : option '" + key + "' " + comment)
	{
	}

} /* namespace mls */
