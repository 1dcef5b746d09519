/*
 * LoadBalancingLoss.cpp
 *
 *  Created on: Sep 20, 2026
 */

#include <moxe/training/LoadBalancingLoss.hpp>
#include <moxe/core/Context.hpp>
#include <moxe/core/math.hpp>
#include <moxe/core/moxe_exceptions.hpp>
#include <moxe/utils/json.hpp>

namespace moxe
{
	LoadBalancingLoss::LoadBalancingLoss(int numExperts, int topK) :
			m_num_experts(numExperts),
			m_top_k(topK)
	{
		if (numExperts <= 0)
			throw IllegalArgument(METHOD_NAME, "numExperts", "must be positive", numExperts);
		if (topK <= 0)
			throw IllegalArgument(METHOD_NAME, "topK", "must be positive", topK);
		if (topK > numExperts)
			throw IllegalArgument(METHOD_NAME, "topK", "must not exceed number of experts (" + std::to_string(numExperts) + ")", topK);
	}
	LoadBalancingLoss::LoadBalancingLoss(const Json &config) :
			LoadBalancingLoss(config["num_experts"].getInt(), config.hasKey("top_k") ? config["top_k"].getInt() : 1)
	{
	}

	int LoadBalancingLoss::numberOfExperts() const noexcept
	{
		return m_num_experts;
	}
	int LoadBalancingLoss::topK() const noexcept
	{
		return m_top_k;
	}

	LoadBalancingResult LoadBalancingLoss::getLoss(const Context &context, const Tensor &routerProbs) const
	{
		if (not isFloatingPoint(routerProbs.dtype()))
			throw DataTypeNotSupported(METHOD_NAME, routerProbs.dtype());
		if (routerProbs.rank() != 2 and routerProbs.rank() != 3)
			throw ShapeMismatch(METHOD_NAME, "router probabilities must be [tokens, experts] or [batch, sequence, experts], got " + routerProbs.shape());
		if (routerProbs.lastDim() != m_num_experts)
			throw ShapeMismatch(METHOD_NAME, "expected " + std::to_string(m_num_experts) + " experts, got " + routerProbs.shape());

		LoadBalancingResult result;
		result.total_tokens = routerProbs.shape().rows();
		if (result.total_tokens == 0)
			throw ShapeMismatch(METHOD_NAME, "router probabilities contain no tokens " + routerProbs.shape());

		const int slots = result.total_tokens * m_top_k;
		const Tensor probs = routerProbs.view( { result.total_tokens, m_num_experts });
		Tensor topk_values( { result.total_tokens, m_top_k }, routerProbs.dtype());
		Tensor topk_indices( { result.total_tokens, m_top_k }, DataType::INT32);
		selectTopK(context, probs, topk_values, topk_indices);

		const Tensor flat_values = topk_values.view( { slots });
		const Tensor flat_indices = topk_indices.view( { slots });

		result.expert_load = Tensor( { m_num_experts }, routerProbs.dtype());
		result.expert_token_counts = Tensor( { m_num_experts }, DataType::INT32);
		result.expert_usage = Tensor( { m_num_experts }, routerProbs.dtype());
		scatterAdd(context, flat_indices, flat_values, result.expert_load);
		scatterAdd(context, flat_indices, Tensor(), result.expert_token_counts);

		result.aux_loss = loadBalancingLoss(context, result.expert_load, result.expert_usage, result.total_tokens, m_top_k);
		return result;
	}

	Json LoadBalancingLoss::getConfig() const
	{
		Json result;
		result["name"] = "load_balancing";
		result["num_experts"] = m_num_experts;
		result["top_k"] = m_top_k;
		return result;
	}

} /* namespace moxe */
