/*
 * string_util.cpp
 *
 *  Created on: Mar 5, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/utils/string_util.hpp>

#include <iostream>

int occurence(const std::string &str, char c)
{
	int result = 0;
	for (size_t i = 0; i < str.length(); i++)
		result += str[i] == c;
	return result;
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
	std::vector<std::string> result(occurence(str, delimiter) + 1);
	size_t start = 0, count = 0;
	for (size_t stop = 0; stop <= str.length(); stop++)
		if (stop == str.length() || str[stop] == delimiter)
		{
			result[count] = str.substr(start, stop - start);
			start = stop + 1;
			count++;
		}
	return result;
}

void println(const std::string &str)
{
	std::cout << str << std::endl;
}
void printerr(const std::string &str)
{
	std::cerr << str << std::endl;
}
