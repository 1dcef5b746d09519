/*
 * math.hpp
 *
 *  Created on: Sep 16, 2026
 */

#ifndef MOXE_CORE_MATH_HPP_
#define MOXE_CORE_MATH_HPP_

namespace moxe
{
	class Context;
	class Tensor;
	enum class GroupLossType;
}

namespace moxe
{
	/*
	 * Shannon entropy over the last axis of 'probs', written to 'entropy' (one value per row).
	 * Probabilities are clipped from below by 'eps' inside the logarithm.
	 * With 'normalize' the result is divided by log(n), n being the last dimension.
	 */
	void normalizedEntropy(const Context &context, const Tensor &probs, Tensor &entropy, double eps, bool normalize);
	double mean(const Context &context, const Tensor &input);

	/*
	 * Elementwise pairwise balance loss. Either 'pm' or 'ps' may hold a single element.
	 */
	void groupLoss(const Context &context, GroupLossType type, const Tensor &pm, const Tensor &ps, Tensor &loss, double eps);

	double routerZLoss(const Context &context, const Tensor &logits);

	/*
	 * Per row of 'input' selects the k largest values in descending order, k being the last dimension of 'values'.
	 * Equal values are ordered by lower index. NaN input is not supported.
	 */
	void selectTopK(const Context &context, const Tensor &input, Tensor &values, Tensor &indices);
	/*
	 * output[indices[i]] += values[i], or += 1 if 'values' is empty.
	 * Indices outside of the output are dropped.
	 */
	void scatterAdd(const Context &context, const Tensor &indices, const Tensor &values, Tensor &output);
	double loadBalancingLoss(const Context &context, const Tensor &expert_load, Tensor &expert_usage, int total_tokens, int top_k);

} /* namespace moxe */

#endif /* MOXE_CORE_MATH_HPP_ */
