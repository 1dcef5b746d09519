/*
 * AuxiliaryLosses.cpp
 *
 *  Created on: Sep 21, 2026
 */

#include <moxe/training/AuxiliaryLosses.hpp>
#include <moxe/core/Context.hpp>
#include <moxe/core/moxe_exceptions.hpp>
#include <moxe/utils/json.hpp>

namespace
{
	template<typename T>
	T get_or_default(const Json &json, const std::string &key, T default_value);

	template<>
	int get_or_default<int>(const Json &json, const std::string &key, int default_value)
	{
		return json.hasKey(key) ? json[key].getInt() : default_value;
	}
	template<>
	double get_or_default<double>(const Json &json, const std::string &key, double default_value)
	{
		return json.hasKey(key) ? json[key].getDouble() : default_value;
	}
	template<>
	bool get_or_default<bool>(const Json &json, const std::string &key, bool default_value)
	{
		return json.hasKey(key) ? json[key].getBool() : default_value;
	}
	template<>
	std::string get_or_default<std::string>(const Json &json, const std::string &key, std::string default_value)
	{
		return json.hasKey(key) ? json[key].getString() : default_value;
	}

	std::vector<int> parse_monitored_layers(const Json &json)
	{
		std::vector<int> result;
		if (json.isString())
		{
			if (json.getString() != "all")
				throw moxe::IllegalArgument(METHOD_NAME, "monitored_layers", "must be 'all' or a list of layer indices", json.getString());
		}
		else
		{
			for (int i = 0; i < json.size(); i++)
				result.push_back(json[i].getInt());
		}
		return result;
	}

	void add_scaled(moxe::AuxiliaryLossReport &dst, const moxe::AuxiliaryLossReport &src, double scale) noexcept
	{
		dst.z_loss += scale * src.z_loss;
		dst.load_balancing_loss += scale * src.load_balancing_loss;
		dst.d_loss += scale * src.d_loss;
		dst.group_loss += scale * src.group_loss;
		dst.total += scale * src.total;
	}
}

namespace moxe
{
	AuxiliaryLossConfig::AuxiliaryLossConfig(const Json &config) :
			num_experts(config["num_experts"].getInt()),
			top_k(get_or_default<int>(config, "top_k", 1)),
			z_loss_coef(get_or_default<double>(config, "z_loss_coef", 0.001)),
			load_balancing_loss_coef(get_or_default<double>(config, "load_balancing_loss_coef", 0.01)),
			d_loss_coef(get_or_default<double>(config, "d_loss_coef", 0.01)),
			group_loss_coef(get_or_default<double>(config, "group_loss_coef", 0.01)),
			compute_router_losses(get_or_default<bool>(config, "compute_router_losses", true)),
			compute_d_loss(get_or_default<bool>(config, "compute_d_loss", true)),
			compute_group_loss(get_or_default<bool>(config, "compute_group_loss", true)),
			group_loss(get_or_default<std::string>(config, "group_loss", "js"))
	{
		if (config.hasKey("monitored_layers"))
			monitored_layers = parse_monitored_layers(config["monitored_layers"]);
	}
	Json AuxiliaryLossConfig::toJson() const
	{
		Json result;
		result["num_experts"] = num_experts;
		result["top_k"] = top_k;
		result["z_loss_coef"] = z_loss_coef;
		result["load_balancing_loss_coef"] = load_balancing_loss_coef;
		result["d_loss_coef"] = d_loss_coef;
		result["group_loss_coef"] = group_loss_coef;
		result["compute_router_losses"] = compute_router_losses;
		result["compute_d_loss"] = compute_d_loss;
		result["compute_group_loss"] = compute_group_loss;
		result["group_loss"] = group_loss;
		if (monitored_layers.empty())
			result["monitored_layers"] = "all";
		else
			result["monitored_layers"] = Json(monitored_layers.data(), monitored_layers.size());
		return result;
	}

	std::string AuxiliaryLossReport::toString() const
	{
		std::string result = "layers=" + std::to_string(layers);
		result += " z_loss=" + std::to_string(z_loss);
		result += " load_balancing_loss=" + std::to_string(load_balancing_loss);
		result += " d_loss=" + std::to_string(d_loss);
		result += " group_loss=" + std::to_string(group_loss);
		result += " total=" + std::to_string(total);
		return result;
	}

	AuxiliaryLosses::AuxiliaryLosses(const AuxiliaryLossConfig &config) :
			m_config(config),
			m_load_balancing(config.num_experts, config.top_k),
			m_group_loss(createGroupLoss(groupLossFromString(config.group_loss)))
	{
		for (size_t i = 0; i < config.monitored_layers.size(); i++)
			if (config.monitored_layers[i] < 0)
				throw IllegalArgument(METHOD_NAME, "monitored_layers", "must not contain negative indices", config.monitored_layers[i]);
	}
	AuxiliaryLosses::AuxiliaryLosses(const AuxiliaryLosses &other) :
			m_config(other.m_config),
			m_z_loss(other.m_z_loss),
			m_load_balancing(other.m_load_balancing),
			m_entropy(other.m_entropy),
			m_group_loss(other.m_group_loss ? other.m_group_loss->clone() : nullptr)
	{
	}
	AuxiliaryLosses& AuxiliaryLosses::operator=(const AuxiliaryLosses &other)
	{
		if (this != &other)
		{
			m_config = other.m_config;
			m_z_loss = other.m_z_loss;
			m_load_balancing = other.m_load_balancing;
			m_entropy = other.m_entropy;
			m_group_loss = other.m_group_loss ? other.m_group_loss->clone() : nullptr;
		}
		return *this;
	}

	const AuxiliaryLossConfig& AuxiliaryLosses::getConfig() const noexcept
	{
		return m_config;
	}

	AuxiliaryLossReport AuxiliaryLosses::computeLayer(const Context &context, const RouterOutputs &outputs) const
	{
		AuxiliaryLossReport result;
		result.layers = 1;
		if (m_config.compute_router_losses)
		{
			result.z_loss = m_z_loss.getLoss(context, outputs.router_logits);
			result.load_balancing_loss = m_load_balancing.getLoss(context, outputs.router_probs).aux_loss;
			result.total += m_config.z_loss_coef * result.z_loss + m_config.load_balancing_loss_coef * result.load_balancing_loss;
		}
		if (m_config.compute_d_loss)
		{
			result.d_loss = m_entropy.getMeanEntropy(context, outputs.router_probs);
			result.total += m_config.d_loss_coef * result.d_loss;
		}
		if (m_config.compute_group_loss)
		{
			result.group_loss = m_group_loss->getMeanLoss(context, outputs.pm, outputs.ps);
			result.total += m_config.group_loss_coef * result.group_loss;
		}
		return result;
	}
	AuxiliaryLossReport AuxiliaryLosses::compute(const Context &context, const std::vector<RouterOutputs> &outputs) const
	{
		std::vector<int> layers = m_config.monitored_layers;
		if (layers.empty())
			for (size_t i = 0; i < outputs.size(); i++)
				layers.push_back(static_cast<int>(i));
		if (layers.empty())
			throw IllegalArgument(METHOD_NAME, "no layers to compute auxiliary losses on");

		const double scale = 1.0 / layers.size();
		AuxiliaryLossReport result;
		for (size_t i = 0; i < layers.size(); i++)
		{
			const int idx = layers[i];
			if (idx < 0 or idx >= static_cast<int>(outputs.size()))
				throw IndexOutOfBounds(METHOD_NAME, "monitored_layers", idx, static_cast<int>(outputs.size()));
			add_scaled(result, computeLayer(context, outputs[idx]), scale);
		}
		result.layers = layers.size();
		return result;
	}

} /* namespace moxe */
