/*
 * evaluate.hpp
 *
 *  Created on: Mar 12, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_TRAINING_EVALUATE_HPP_
#define MINLOSS_TRAINING_EVALUATE_HPP_

class Json;

namespace mls
{
	class LossFunction;

	/*
	 * Computes loss and gradient for a batch given as {"guesses": ..., "targets": ...}.
	 * For Loss the guesses are a 2D array and targets are either a 2D array or a flat array of class indices.
	 * For SequenceLoss both are lists of the above, one element per sequence position.
	 * Returns {"loss": number, "gradient": array}.
	 */
	Json evaluateLoss(const LossFunction &loss, const Json &batch);

} /* namespace mls */

#endif /* MINLOSS_TRAINING_EVALUATE_HPP_ */
