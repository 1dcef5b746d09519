/*
 * RouterZLoss.cpp
 *
 *  Created on: Sep 20, 2026
 */

#include <moxe/training/RouterZLoss.hpp>
#include <moxe/core/Context.hpp>
#include <moxe/core/Tensor.hpp>
#include <moxe/core/math.hpp>
#include <moxe/core/moxe_exceptions.hpp>
#include <moxe/utils/json.hpp>

namespace moxe
{
	RouterZLoss::RouterZLoss(const Json &config)
	{
		if (config.hasKey("name") and config["name"].getString() != "z_loss")
			throw IllegalArgument(METHOD_NAME, "name", "does not describe a z-loss", config["name"].getString());
	}
	double RouterZLoss::getLoss(const Context &context, const Tensor &logits) const
	{
		return routerZLoss(context, logits);
	}
	Json RouterZLoss::getConfig() const
	{
		Json result;
		result["name"] = "z_loss";
		return result;
	}

} /* namespace moxe */
