/*
 * LossFunction.hpp
 *
 *  Created on: Mar 7, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_TRAINING_LOSSFUNCTION_HPP_
#define MINLOSS_TRAINING_LOSSFUNCTION_HPP_

#include <minloss/core/Labels.hpp>
#include <minloss/core/Tensor.hpp>
#include <minloss/core/ml_exceptions.hpp>

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

class Json;

namespace mls
{

	/*
	 * Common part of every loss: identification and configuration.
	 * All loss objects are immutable, every computation is a const method without side effects.
	 */
	class LossFunction
	{
		public:
			virtual ~LossFunction() = default;
			/*
			 * Name under which the loss is registered, without version suffix.
			 */
			virtual std::string name() const = 0;
			/*
			 * Flat mapping from which loadLoss() rebuilds an identical loss.
			 */
			virtual Json getConfig() const;
			/*
			 * Creates new instance of the same type configured from 'config'.
			 * Throws InvalidConfiguration on unknown keys or options of wrong type.
			 */
			virtual std::unique_ptr<LossFunction> clone(const Json &config) const = 0;
		protected:
			void check_config(const Json &config, std::initializer_list<const char*> options) const;
			static bool get_option(const Json &config, const char *key, bool default_value);
	};

	/*
	 * Loss computed over a single batch of rows.
	 */
	class Loss: public LossFunction
	{
		public:
			virtual Tensor getGradient(const Tensor &guesses, const Labels &truths) const = 0;
			virtual float getLoss(const Tensor &guesses, const Labels &truths) const = 0;
			/*
			 * Returns (loss, gradient) computed in a single pass.
			 */
			virtual std::pair<float, Tensor> operator()(const Tensor &guesses, const Labels &truths) const = 0;
	};

	/*
	 * Loss computed over an ordered list of batches whose row counts may differ.
	 */
	class SequenceLoss: public LossFunction
	{
		public:
			virtual std::vector<Tensor> getGradient(const std::vector<Tensor> &guesses, const std::vector<Labels> &truths) const = 0;
			virtual float getLoss(const std::vector<Tensor> &guesses, const std::vector<Labels> &truths) const = 0;
			virtual std::pair<float, std::vector<Tensor>> operator()(const std::vector<Tensor> &guesses, const std::vector<Labels> &truths) const = 0;
	};

	/*
	 * Creates loss from configuration of the form {"name": "L2Distance.v1", "normalize": true}.
	 * The version suffix is optional.
	 */
	std::unique_ptr<LossFunction> loadLoss(const Json &config);

	/*
	 * Same as above but also checks that the loss provides interface T (Loss or SequenceLoss).
	 */
	template<class T>
	std::unique_ptr<T> loadLoss(const Json &config)
	{
		std::unique_ptr<LossFunction> tmp = loadLoss(config);
		T *result = dynamic_cast<T*>(tmp.get());
		if (result == nullptr)
			throw InvalidConfiguration(METHOD_NAME, "'" + tmp->name() + "' does not provide the requested interface");
		tmp.release();
		return std::unique_ptr<T>(result);
	}

} /* namespace mls */

#endif /* MINLOSS_TRAINING_LOSSFUNCTION_HPP_ */
