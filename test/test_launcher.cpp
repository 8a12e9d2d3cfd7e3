/*
 * test_launcher.cpp
 *
 *  Created on: Mar 11, 2024
 *      Author: Maciej Kozarzewski
 */

#include <gtest/gtest.h>

int main(int argc, char *argv[])
{
	::testing::InitGoogleTest(&argc, argv);
	return RUN_ALL_TESTS();
}
