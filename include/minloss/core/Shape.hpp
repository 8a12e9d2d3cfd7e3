/*
 * Shape.hpp
 *
 *  Created on: Mar 4, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_CORE_SHAPE_HPP_
#define MINLOSS_CORE_SHAPE_HPP_

#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mls
{
	class Shape
	{
		public:
			static const int max_dimension = 4;
		private:
			int m_dim[max_dimension];
			int m_rank = 0;
		public:
			Shape();
			Shape(std::initializer_list<int> dims);
			Shape(const std::vector<int> &dims);

			std::string toString() const;

			int rank() const noexcept;
			int dim(int index) const;
			int operator[](int index) const;

			int firstDim() const noexcept;
			int lastDim() const noexcept;
			int volume() const noexcept;

			friend bool operator==(const Shape &lhs, const Shape &rhs) noexcept;
			friend bool operator!=(const Shape &lhs, const Shape &rhs) noexcept;
	};

	std::ostream& operator<<(std::ostream &stream, const Shape &s);
	std::string operator+(const std::string &lhs, const Shape &rhs);
	std::string operator+(const Shape &lhs, const std::string &rhs);

	class ShapeMismatch: public std::logic_error
	{
		public:
			ShapeMismatch(const char *function, const std::string &what_arg);
			ShapeMismatch(const char *function, int expected_rank, int actual_rank);
			ShapeMismatch(const char *function, const Shape &expected, const Shape &got);
	};

} /* namespace mls */

#endif /* MINLOSS_CORE_SHAPE_HPP_ */
