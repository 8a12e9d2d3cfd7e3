/*
 * version.hpp
 *
 *  Created on: Mar 12, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_UTILS_VERSION_HPP_
#define MINLOSS_UTILS_VERSION_HPP_

#include <string>

namespace mls
{
	struct Version
	{
			int major;
			int minor;
			int revision;

			std::string toString() const;
	};

	Version getVersion() noexcept;

} /* namespace mls */

#endif /* MINLOSS_UTILS_VERSION_HPP_ */
