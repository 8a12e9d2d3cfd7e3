/*
 * version.cpp
 *
 *  Created on: Mar 12, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/utils/version.hpp>

namespace mls
{
	std::string Version::toString() const
	{
		return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(revision);
	}

	Version getVersion() noexcept
	{
		return Version { 1, 0, 0 };
	}

} /* namespace mls */
