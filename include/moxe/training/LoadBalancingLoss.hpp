/*
 * LoadBalancingLoss.hpp
 *
 *  Created on: Sep 20, 2026
 */

#ifndef MOXE_TRAINING_LOADBALANCINGLOSS_HPP_
#define MOXE_TRAINING_LOADBALANCINGLOSS_HPP_

#include <moxe/core/Tensor.hpp>

class Json;
namespace moxe /* forward declarations */
{
	class Context;
}

namespace moxe
{
	struct LoadBalancingResult
	{
			double aux_loss = 0.0;
			Tensor expert_load; // sum of top-k routing weights per expert
			Tensor expert_token_counts; // INT32, number of top-k slots per expert
			Tensor expert_usage; // expert_load / (total_tokens * top_k)
			int total_tokens = 0;
	};

	/*
	 * Penalty on the deviation of per-expert top-k routing mass from the uniform share 1 / num_experts.
	 * Accepts router probabilities of shape [tokens, experts] or [batch, sequence, experts].
	 */
	class LoadBalancingLoss
	{
			int m_num_experts = 0;
			int m_top_k = 0;
		public:
			LoadBalancingLoss(int numExperts, int topK);
			LoadBalancingLoss(const Json &config);

			int numberOfExperts() const noexcept;
			int topK() const noexcept;

			LoadBalancingResult getLoss(const Context &context, const Tensor &routerProbs) const;

			Json getConfig() const;
	};

} /* namespace moxe */

#endif /* MOXE_TRAINING_LOADBALANCINGLOSS_HPP_ */
