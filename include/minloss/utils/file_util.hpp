/*
 * file_util.hpp
 *
 *  Created on: Mar 12, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_UTILS_FILE_UTIL_HPP_
#define MINLOSS_UTILS_FILE_UTIL_HPP_

#include <string>

class Json;

namespace mls
{
	/*
	 * Both functions throw RuntimeError if the file cannot be opened or read.
	 */
	std::string loadTextFile(const std::string &path);
	Json loadJsonFile(const std::string &path);

} /* namespace mls */

#endif /* MINLOSS_UTILS_FILE_UTIL_HPP_ */
