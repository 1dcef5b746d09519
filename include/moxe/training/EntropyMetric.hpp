/*
 * EntropyMetric.hpp
 *
 *  Created on: Sep 19, 2026
 */

#ifndef MOXE_TRAINING_ENTROPYMETRIC_HPP_
#define MOXE_TRAINING_ENTROPYMETRIC_HPP_

#include <moxe/core/Tensor.hpp>

class Json;
namespace moxe /* forward declarations */
{
	class Context;
}

namespace moxe
{
	/*
	 * Shannon entropy of categorical distributions stored along the last axis.
	 * With normalization enabled a uniform distribution gives 1 and a one-hot distribution gives 0.
	 * Normalizing a distribution over a single outcome divides by log(1) = 0 and is left to the caller to avoid.
	 */
	class EntropyMetric
	{
			double m_eps = 1.0e-6;
			bool m_normalize = true;
		public:
			EntropyMetric(double eps = 1.0e-6, bool normalize = true);
			EntropyMetric(const Json &config);

			double getEpsilon() const noexcept;
			bool isNormalized() const noexcept;

			/*
			 * Returns tensor shaped as 'probs' without its last dimension ([1] for rank-1 input).
			 */
			Tensor getEntropy(const Context &context, const Tensor &probs) const;
			double getMeanEntropy(const Context &context, const Tensor &probs) const;

			Json getConfig() const;
	};

} /* namespace moxe */

#endif /* MOXE_TRAINING_ENTROPYMETRIC_HPP_ */
