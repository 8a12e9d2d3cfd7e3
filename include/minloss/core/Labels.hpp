/*
 * Labels.hpp
 *
 *  Created on: Mar 6, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_CORE_LABELS_HPP_
#define MINLOSS_CORE_LABELS_HPP_

#include <minloss/core/Tensor.hpp>

#include <cinttypes>
#include <initializer_list>
#include <variant>
#include <vector>

class Json;

namespace mls
{

	/*
	 * Training targets, either sparse (one class index per row) or dense (full target distribution per row).
	 */
	class Labels
	{
		private:
			std::variant<std::vector<int32_t>, Tensor> m_data;
		public:
			Labels(const Tensor &dense);
			Labels(Tensor &&dense) noexcept;
			Labels(const std::vector<int32_t> &sparse);
			Labels(std::initializer_list<int32_t> sparse);
			/*
			 * A flat array of numbers is loaded as sparse labels, an array of arrays as dense ones.
			 */
			explicit Labels(const Json &json);

			bool isSparse() const noexcept;
			bool isDense() const noexcept;

			const std::vector<int32_t>& sparse() const;
			const Tensor& dense() const;

			/*
			 * Returns the dense form of these labels, checked against the shape of the guesses they are compared with.
			 * Sparse labels are expanded to one-hot rows.
			 */
			Tensor toDense(const Shape &guessShape) const;
	};

} /* namespace mls */

#endif /* MINLOSS_CORE_LABELS_HPP_ */
