/*
 * ml_exceptions.hpp
 *
 *  Created on: Mar 4, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_CORE_ML_EXCEPTIONS_HPP_
#define MINLOSS_CORE_ML_EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>

namespace mls
{
#ifdef __GNUC__
#  define METHOD_NAME __PRETTY_FUNCTION__
#else
#  define METHOD_NAME __FUNCTION__
#endif

	//runtime errors
	class RuntimeError: public std::runtime_error
	{
		public:
			RuntimeError(const char *function, const std::string &comment);
	};

	//range errors
	class IndexOutOfBounds: public std::out_of_range
	{
		public:
			IndexOutOfBounds(const char *function, const std::string &index_name, int index_value, int range);
	};

	class LogicError: public std::logic_error
	{
		public:
			LogicError(const char *function, const std::string &comment);
	};

	//configuration errors
	class InvalidConfiguration: public std::invalid_argument
	{
		public:
			InvalidConfiguration(const char *function, const std::string &comment);
			InvalidConfiguration(const char *function, const std::string &key, const std::string &comment);
	};

} /* namespace mls */

#endif /* MINLOSS_CORE_ML_EXCEPTIONS_HPP_ */
