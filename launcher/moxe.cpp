//============================================================================
// Name        : moxe.cpp
// Description : Auxiliary MoE losses on synthetic router outputs
//============================================================================

#include <moxe/core/Context.hpp>
#include <moxe/core/Tensor.hpp>
#include <moxe/training/AuxiliaryLosses.hpp>
#include <moxe/training/LoadBalancingLoss.hpp>
#include <moxe/utils/json.hpp>
#include <moxe/utils/random.hpp>
#include <moxe/utils/time_util.hpp>

#include <algorithm>
#include <iostream>
#include <vector>
#include <cmath>

using namespace moxe;

namespace
{
	/*
	 * Random logits of shape [batch, sequence, experts] with a per-expert bias, so that the router is skewed.
	 */
	RouterOutputs make_router_outputs(int batch, int sequence, int experts, double skew)
	{
		RouterOutputs result;
		result.router_logits = Tensor( { batch, sequence, experts }, DataType::FLOAT32);
		result.router_probs = Tensor( { batch, sequence, experts }, DataType::FLOAT32);
		result.pm = Tensor( { batch, sequence }, DataType::FLOAT32);
		result.ps = Tensor( { batch, sequence }, DataType::FLOAT32);

		std::vector<double> row(experts);
		for (int b = 0; b < batch; b++)
			for (int s = 0; s < sequence; s++)
			{
				double max_logit = -1.0e30;
				for (int e = 0; e < experts; e++)
				{
					row[e] = randGaussian(0.0f, 1.0f) + skew * (experts - e) / experts;
					result.router_logits.set(row[e], { b, s, e });
					max_logit = std::max(max_logit, row[e]);
				}
				double sum = 0.0;
				for (int e = 0; e < experts; e++)
				{
					row[e] = std::exp(row[e] - max_logit);
					sum += row[e];
				}
				// first half of the experts forms the 'm' group, second half the 's' group
				double pm = 0.0;
				for (int e = 0; e < experts; e++)
				{
					result.router_probs.set(row[e] / sum, { b, s, e });
					if (e < experts / 2)
						pm += row[e] / sum;
				}
				result.pm.set(pm, { b, s });
				result.ps.set(1.0 - pm, { b, s });
			}
		return result;
	}

	void print_usage(const LoadBalancingResult &lb)
	{
		std::cout << "  aux_loss = " << lb.aux_loss << ", tokens = " << lb.total_tokens << '\n';
		for (int e = 0; e < lb.expert_usage.volume(); e++)
			std::cout << "  expert " << e << " : count = " << static_cast<int>(lb.expert_token_counts.at( { e }))
					<< ", load = " << lb.expert_load.get( { e }) << ", usage = " << lb.expert_usage.get( { e }) << '\n';
	}
}

int main()
{
	std::cout << "BEGIN" << std::endl;
	std::cout << Context::hardwareInfo() << std::endl;
	try
	{
		const Json config = Json::load(
				R"({"num_experts": 8, "top_k": 2, "group_loss": "js", "monitored_layers": "all", "z_loss_coef": 0.001, "load_balancing_loss_coef": 0.01})");
		const AuxiliaryLossConfig aux_config(config);
		std::cout << "config = " << aux_config.toJson().dump(2) << '\n';

		Context context;
		AuxiliaryLosses losses(aux_config);

		std::vector<RouterOutputs> layers;
		layers.push_back(make_router_outputs(4, 32, aux_config.num_experts, 0.0));
		layers.push_back(make_router_outputs(4, 32, aux_config.num_experts, 3.0));

		const LoadBalancingLoss load_balancing(aux_config.num_experts, aux_config.top_k);
		for (size_t i = 0; i < layers.size(); i++)
		{
			std::cout << "layer " << i << " : " << losses.computeLayer(context, layers[i]).toString() << '\n';
			print_usage(load_balancing.getLoss(context, layers[i].router_probs));
		}

		const double start = getTime();
		const AuxiliaryLossReport report = losses.compute(context, layers);
		const double stop = getTime();
		std::cout << "average : " << report.toString() << '\n';
		std::cout << "computed in " << formatTime(stop - start, 3) << '\n';
	} catch (std::exception &e)
	{
		std::cerr << "error: " << e.what() << std::endl;
		return 1;
	}
	std::cout << "END" << std::endl;
	return 0;
}
