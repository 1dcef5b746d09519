/*
 * GroupLoss.cpp
 *
 *  Created on: Sep 19, 2026
 */

#include <moxe/training/GroupLoss.hpp>
#include <moxe/core/Context.hpp>
#include <moxe/core/math.hpp>
#include <moxe/core/moxe_exceptions.hpp>
#include <moxe/utils/json.hpp>

namespace moxe
{
	std::string toString(GroupLossType type)
	{
		switch (type)
		{
			case GroupLossType::SELF_BALANCE:
				return "self_balance";
			case GroupLossType::BOUNDED:
				return "bounded";
			case GroupLossType::KL:
				return "kl";
			case GroupLossType::JS:
				return "js";
			default:
				return "unknown";
		}
	}
	GroupLossType groupLossFromString(const std::string &str)
	{
		if (str == "self_balance")
			return GroupLossType::SELF_BALANCE;
		if (str == "bounded")
			return GroupLossType::BOUNDED;
		if (str == "kl")
			return GroupLossType::KL;
		if (str == "js")
			return GroupLossType::JS;
		throw IllegalArgument(METHOD_NAME, "str", "is not a group loss name", str);
	}

	GroupLoss::GroupLoss(double eps) :
			m_eps(eps)
	{
		if (eps <= 0.0)
			throw IllegalArgument(METHOD_NAME, "eps", "must be positive", eps);
	}
	std::string GroupLoss::name() const
	{
		return toString(type());
	}
	double GroupLoss::getEpsilon() const noexcept
	{
		return m_eps;
	}
	double GroupLoss::getLoss(const Context &context, double pm, double ps) const
	{
		Tensor tmp_pm( { 1 }, DataType::FLOAT64);
		Tensor tmp_ps( { 1 }, DataType::FLOAT64);
		tmp_pm.set(pm, { 0 });
		tmp_ps.set(ps, { 0 });
		return getLoss(context, tmp_pm, tmp_ps).get( { 0 });
	}
	Tensor GroupLoss::getLoss(const Context &context, const Tensor &pm, const Tensor &ps) const
	{
		Tensor result((pm.volume() >= ps.volume()) ? pm.shape() : ps.shape(), pm.dtype());
		groupLoss(context, type(), pm, ps, result, m_eps);
		return result;
	}
	double GroupLoss::getMeanLoss(const Context &context, const Tensor &pm, const Tensor &ps) const
	{
		const Tensor loss = getLoss(context, pm, ps);
		return mean(context, loss);
	}
	Json GroupLoss::getConfig() const
	{
		Json result;
		result["name"] = name();
		result["eps"] = m_eps;
		return result;
	}

	SelfBalanceLoss::SelfBalanceLoss() :
			GroupLoss(1.0e-8)
	{
	}
	GroupLossType SelfBalanceLoss::type() const noexcept
	{
		return GroupLossType::SELF_BALANCE;
	}
	std::unique_ptr<GroupLoss> SelfBalanceLoss::clone() const
	{
		return std::make_unique<SelfBalanceLoss>();
	}

	BoundedLoss::BoundedLoss() :
			GroupLoss(1.0e-8)
	{
	}
	GroupLossType BoundedLoss::type() const noexcept
	{
		return GroupLossType::BOUNDED;
	}
	std::unique_ptr<GroupLoss> BoundedLoss::clone() const
	{
		return std::make_unique<BoundedLoss>();
	}

	KLDivergenceLoss::KLDivergenceLoss(double eps) :
			GroupLoss(eps)
	{
	}
	GroupLossType KLDivergenceLoss::type() const noexcept
	{
		return GroupLossType::KL;
	}
	std::unique_ptr<GroupLoss> KLDivergenceLoss::clone() const
	{
		return std::make_unique<KLDivergenceLoss>(m_eps);
	}

	JSDivergenceLoss::JSDivergenceLoss(double eps) :
			GroupLoss(eps)
	{
	}
	GroupLossType JSDivergenceLoss::type() const noexcept
	{
		return GroupLossType::JS;
	}
	std::unique_ptr<GroupLoss> JSDivergenceLoss::clone() const
	{
		return std::make_unique<JSDivergenceLoss>(m_eps);
	}

	std::unique_ptr<GroupLoss> createGroupLoss(GroupLossType type, double eps)
	{
		switch (type)
		{
			case GroupLossType::SELF_BALANCE:
				return std::make_unique<SelfBalanceLoss>();
			case GroupLossType::BOUNDED:
				return std::make_unique<BoundedLoss>();
			case GroupLossType::KL:
				return std::make_unique<KLDivergenceLoss>(eps);
			case GroupLossType::JS:
				return std::make_unique<JSDivergenceLoss>(eps);
			default:
				throw IllegalArgument(METHOD_NAME, "type", "is not a group loss type", static_cast<int>(type));
		}
	}
	std::unique_ptr<GroupLoss> createGroupLoss(const Json &config)
	{
		const GroupLossType type = groupLossFromString(config["name"].getString());
		const double eps = config.hasKey("eps") ? config["eps"].getDouble() : 1.0e-8;
		return createGroupLoss(type, eps);
	}

} /* namespace moxe */
