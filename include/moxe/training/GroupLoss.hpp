/*
 * GroupLoss.hpp
 *
 *  Created on: Sep 19, 2026
 */

#ifndef MOXE_TRAINING_GROUPLOSS_HPP_
#define MOXE_TRAINING_GROUPLOSS_HPP_

#include <moxe/core/Tensor.hpp>

#include <memory>
#include <string>

class Json;
namespace moxe /* forward declarations */
{
	class Context;
}

namespace moxe
{
	/* must stay in the same order as mxGroupLossType_t */
	enum class GroupLossType
	{
		SELF_BALANCE,
		BOUNDED,
		KL,
		JS
	};

	std::string toString(GroupLossType type);
	GroupLossType groupLossFromString(const std::string &str);

	/*
	 * Balance penalty between the selection probabilities 'pm' and 'ps' of two expert groups.
	 */
	class GroupLoss
	{
		protected:
			double m_eps = 1.0e-8;
		public:
			GroupLoss(double eps);
			virtual ~GroupLoss() = default;

			virtual GroupLossType type() const noexcept = 0;
			virtual std::unique_ptr<GroupLoss> clone() const = 0;

			std::string name() const;
			double getEpsilon() const noexcept;

			double getLoss(const Context &context, double pm, double ps) const;
			/*
			 * Elementwise loss, shaped as the larger of the two inputs.
			 * A single-element input is broadcast against the other one.
			 */
			Tensor getLoss(const Context &context, const Tensor &pm, const Tensor &ps) const;
			double getMeanLoss(const Context &context, const Tensor &pm, const Tensor &ps) const;

			Json getConfig() const;
	};

	/*
	 * (pm - ps)^2
	 */
	class SelfBalanceLoss: public GroupLoss
	{
		public:
			SelfBalanceLoss();
			GroupLossType type() const noexcept;
			std::unique_ptr<GroupLoss> clone() const;
	};

	/*
	 * (pm - 0.5)^2 + (ps - 0.5)^2
	 */
	class BoundedLoss: public GroupLoss
	{
		public:
			BoundedLoss();
			GroupLossType type() const noexcept;
			std::unique_ptr<GroupLoss> clone() const;
	};

	/*
	 * pm * log(2 * pm + eps) + ps * log(2 * ps + eps)
	 * Equals KL([pm, ps] || [0.5, 0.5]) only when pm + ps = 1.
	 */
	class KLDivergenceLoss: public GroupLoss
	{
		public:
			KLDivergenceLoss(double eps = 1.0e-8);
			GroupLossType type() const noexcept;
			std::unique_ptr<GroupLoss> clone() const;
	};

	/*
	 * Jensen-Shannon divergence between [pm, ps] and [0.5, 0.5], bounded by log(2).
	 */
	class JSDivergenceLoss: public GroupLoss
	{
		public:
			JSDivergenceLoss(double eps = 1.0e-8);
			GroupLossType type() const noexcept;
			std::unique_ptr<GroupLoss> clone() const;
	};

	std::unique_ptr<GroupLoss> createGroupLoss(GroupLossType type, double eps = 1.0e-8);
	std::unique_ptr<GroupLoss> createGroupLoss(const Json &config);

} /* namespace moxe */

#endif /* MOXE_TRAINING_GROUPLOSS_HPP_ */
