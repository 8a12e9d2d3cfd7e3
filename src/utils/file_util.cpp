/*
 * file_util.cpp
 *
 *  Created on: Mar 12, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/utils/file_util.hpp>
#include <minloss/utils/json.hpp>
#include <minloss/core/ml_exceptions.hpp>

#include <fstream>
#include <sstream>

namespace mls
{
	std::string loadTextFile(const std::string &path)
	{
		std::ifstream myFile(path.data(), std::ios::in);
		if (myFile.good() == false)
			throw RuntimeError(METHOD_NAME, "could not open file '" + path + "'");
		std::stringstream buffer;
		buffer << myFile.rdbuf();
		if (myFile.bad())
			throw RuntimeError(METHOD_NAME, "could not read file '" + path + "'");
		return buffer.str();
	}
	Json loadJsonFile(const std::string &path)
	{
		return Json::load(loadTextFile(path));
	}

} /* namespace mls */
