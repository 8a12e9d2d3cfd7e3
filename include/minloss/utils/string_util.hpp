/*
 * string_util.hpp
 *
 *  Created on: Mar 5, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_UTILS_STRING_UTIL_HPP_
#define MINLOSS_UTILS_STRING_UTIL_HPP_

#include <string>
#include <vector>

int occurence(const std::string &str, char c);

std::vector<std::string> split(const std::string &str, char delimiter);

void println(const std::string &str);
void printerr(const std::string &str);

#endif /* MINLOSS_UTILS_STRING_UTIL_HPP_ */
