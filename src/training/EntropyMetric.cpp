/*
 * EntropyMetric.cpp
 *
 *  Created on: Sep 19, 2026
 */

#include <moxe/training/EntropyMetric.hpp>
#include <moxe/core/Context.hpp>
#include <moxe/core/math.hpp>
#include <moxe/core/moxe_exceptions.hpp>
#include <moxe/utils/json.hpp>

#include <vector>

namespace
{
	moxe::Shape get_entropy_shape(const moxe::Shape &probs_shape)
	{
		if (probs_shape.rank() <= 1)
			return moxe::Shape( { 1 });
		std::vector<int> dims(probs_shape.data(), probs_shape.data() + probs_shape.rank() - 1);
		return moxe::Shape(dims);
	}
}

namespace moxe
{
	EntropyMetric::EntropyMetric(double eps, bool normalize) :
			m_eps(eps),
			m_normalize(normalize)
	{
		if (eps <= 0.0)
			throw IllegalArgument(METHOD_NAME, "eps", "must be positive", eps);
	}
	EntropyMetric::EntropyMetric(const Json &config) :
			EntropyMetric(config.hasKey("eps") ? config["eps"].getDouble() : 1.0e-6,
					config.hasKey("normalize") ? config["normalize"].getBool() : true)
	{
	}

	double EntropyMetric::getEpsilon() const noexcept
	{
		return m_eps;
	}
	bool EntropyMetric::isNormalized() const noexcept
	{
		return m_normalize;
	}

	Tensor EntropyMetric::getEntropy(const Context &context, const Tensor &probs) const
	{
		Tensor result(get_entropy_shape(probs.shape()), probs.dtype());
		normalizedEntropy(context, probs, result, m_eps, m_normalize);
		return result;
	}
	double EntropyMetric::getMeanEntropy(const Context &context, const Tensor &probs) const
	{
		const Tensor entropy = getEntropy(context, probs);
		return mean(context, entropy);
	}

	Json EntropyMetric::getConfig() const
	{
		Json result;
		result["name"] = "entropy";
		result["eps"] = m_eps;
		result["normalize"] = m_normalize;
		return result;
	}

} /* namespace moxe */
