/*
 * AuxiliaryLosses.hpp
 *
 *  Created on: Sep 21, 2026
 */

#ifndef MOXE_TRAINING_AUXILIARYLOSSES_HPP_
#define MOXE_TRAINING_AUXILIARYLOSSES_HPP_

#include <moxe/core/Tensor.hpp>
#include <moxe/training/EntropyMetric.hpp>
#include <moxe/training/GroupLoss.hpp>
#include <moxe/training/LoadBalancingLoss.hpp>
#include <moxe/training/RouterZLoss.hpp>

#include <memory>
#include <string>
#include <vector>

class Json;
namespace moxe /* forward declarations */
{
	class Context;
}

namespace moxe
{
	struct AuxiliaryLossConfig
	{
			int num_experts = 0;
			int top_k = 1;

			double z_loss_coef = 0.001;
			double load_balancing_loss_coef = 0.01;
			double d_loss_coef = 0.01;
			double group_loss_coef = 0.01;

			bool compute_router_losses = true;
			bool compute_d_loss = true;
			bool compute_group_loss = true;

			std::string group_loss = "js";
			std::vector<int> monitored_layers; // empty means all layers

			AuxiliaryLossConfig() = default;
			AuxiliaryLossConfig(const Json &config);
			Json toJson() const;
	};

	/*
	 * Router outputs of a single MoE layer.
	 * 'pm' and 'ps' are the selection probabilities of the two expert groups.
	 */
	struct RouterOutputs
	{
			Tensor router_logits;
			Tensor router_probs;
			Tensor pm;
			Tensor ps;
	};

	struct AuxiliaryLossReport
	{
			double z_loss = 0.0;
			double load_balancing_loss = 0.0;
			double d_loss = 0.0;
			double group_loss = 0.0;
			double total = 0.0;
			int layers = 0;

			std::string toString() const;
	};

	class AuxiliaryLosses
	{
			AuxiliaryLossConfig m_config;
			RouterZLoss m_z_loss;
			LoadBalancingLoss m_load_balancing;
			EntropyMetric m_entropy;
			std::unique_ptr<GroupLoss> m_group_loss;
		public:
			AuxiliaryLosses(const AuxiliaryLossConfig &config);
			AuxiliaryLosses(const AuxiliaryLosses &other);
			AuxiliaryLosses(AuxiliaryLosses &&other) = default;
			AuxiliaryLosses& operator=(const AuxiliaryLosses &other);
			AuxiliaryLosses& operator=(AuxiliaryLosses &&other) = default;

			const AuxiliaryLossConfig& getConfig() const noexcept;

			AuxiliaryLossReport computeLayer(const Context &context, const RouterOutputs &outputs) const;
			/*
			 * Averages every term over the monitored layers.
			 */
			AuxiliaryLossReport compute(const Context &context, const std::vector<RouterOutputs> &outputs) const;
	};

} /* namespace moxe */

#endif /* MOXE_TRAINING_AUXILIARYLOSSES_HPP_ */
