/*
 * Tensor.hpp
 *
 *  Created on: Mar 4, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_CORE_TENSOR_HPP_
#define MINLOSS_CORE_TENSOR_HPP_

#include <minloss/core/Shape.hpp>

#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

class Json;

namespace mls
{

	/*
	 * Owning, row-major float32 array kept in host memory.
	 */
	class Tensor
	{
		private:
			std::vector<float> m_data;
			Shape m_shape;
			int m_stride[Shape::max_dimension];
		public:
			Tensor() noexcept;
			explicit Tensor(const Shape &shape);
			/*
			 * Loads a 1D (array of numbers) or 2D (array of equally sized arrays) tensor.
			 */
			explicit Tensor(const Json &json);

			int rank() const noexcept;
			int dim(int idx) const;
			int firstDim() const noexcept;
			int lastDim() const noexcept;
			int volume() const noexcept;
			const Shape& shape() const noexcept;

			const float* data() const noexcept;
			float* data() noexcept;

			float get(std::initializer_list<int> idx) const;
			void set(float value, std::initializer_list<int> idx);

			Json serialize() const;
		private:
			size_t get_index(const int *ptr, size_t size) const;
			void create_stride() noexcept;
	};

	Tensor toTensor(std::initializer_list<float> data);
	Tensor toTensor(std::initializer_list<std::initializer_list<float>> data);

	template<class T, class U>
	bool same_shape(const T &lhs, const U &rhs)
	{
		return lhs.shape() == rhs.shape();
	}
	template<class T, class U, class ... ARGS>
	bool same_shape(const T &lhs, const U &rhs, const ARGS &... args)
	{
		if (lhs.shape() == rhs.shape())
			return same_shape(lhs, args...);
		else
			return false;
	}

} /* namespace mls */

#endif /* MINLOSS_CORE_TENSOR_HPP_ */
