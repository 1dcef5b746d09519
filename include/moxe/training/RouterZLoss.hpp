/*
 * RouterZLoss.hpp
 *
 *  Created on: Sep 20, 2026
 */

#ifndef MOXE_TRAINING_ROUTERZLOSS_HPP_
#define MOXE_TRAINING_ROUTERZLOSS_HPP_

class Json;
namespace moxe /* forward declarations */
{
	class Context;
	class Tensor;
}

namespace moxe
{
	/*
	 * Mean over all tokens of the squared log-sum-exp of router logits.
	 */
	class RouterZLoss
	{
		public:
			RouterZLoss() = default;
			RouterZLoss(const Json &config);

			double getLoss(const Context &context, const Tensor &logits) const;

			Json getConfig() const;
	};

} /* namespace moxe */

#endif /* MOXE_TRAINING_ROUTERZLOSS_HPP_ */
