/*
 * test_AuxiliaryLosses.cpp
 *
 *  Created on: Sep 25, 2026
 */

#include <moxe/training/AuxiliaryLosses.hpp>
#include <moxe/core/Context.hpp>
#include <moxe/core/Tensor.hpp>
#include <moxe/core/moxe_exceptions.hpp>
#include <moxe/utils/json.hpp>

#include <cmath>
#include <vector>
#include <utility>
#include <gtest/gtest.h>

namespace
{
	using namespace moxe;

	/*
	 * 4 tokens routed uniformly over 4 experts, with constant group probabilities.
	 */
	RouterOutputs uniform_router(double pm, double ps)
	{
		RouterOutputs result;
		result.router_logits = Tensor( { 4, 4 }, DataType::FLOAT64);
		result.router_probs = Tensor( { 4, 4 }, DataType::FLOAT64);
		result.router_probs.setall(0.25);
		result.pm = Tensor( { 4 }, DataType::FLOAT64);
		result.pm.setall(pm);
		result.ps = Tensor( { 4 }, DataType::FLOAT64);
		result.ps.setall(ps);
		return result;
	}
	/*
	 * 4 tokens routed one-hot to distinct experts.
	 */
	RouterOutputs balanced_router()
	{
		RouterOutputs result = uniform_router(0.5, 0.5);
		result.router_probs.zeroall();
		for (int i = 0; i < 4; i++)
			result.router_probs.set(1.0, { i, i });
		return result;
	}

	AuxiliaryLossConfig make_config(const std::string &groupLoss)
	{
		AuxiliaryLossConfig result;
		result.num_experts = 4;
		result.top_k = 1;
		result.group_loss = groupLoss;
		return result;
	}

	const double z_loss_of_zeros = std::log(4.0) * std::log(4.0);
	// top-1 ties resolve to expert 0, which then carries a quarter of the routing mass
	const double uniform_load_balancing = 3 * 0.0625;
}

namespace moxe
{
	TEST(TestAuxiliaryLossConfig, defaults)
	{
		const AuxiliaryLossConfig config(Json( { { "num_experts", 8 } }));
		EXPECT_EQ(config.num_experts, 8);
		EXPECT_EQ(config.top_k, 1);
		EXPECT_EQ(config.z_loss_coef, 0.001);
		EXPECT_EQ(config.load_balancing_loss_coef, 0.01);
		EXPECT_EQ(config.d_loss_coef, 0.01);
		EXPECT_EQ(config.group_loss_coef, 0.01);
		EXPECT_TRUE(config.compute_router_losses);
		EXPECT_TRUE(config.compute_d_loss);
		EXPECT_TRUE(config.compute_group_loss);
		EXPECT_EQ(config.group_loss, "js");
		EXPECT_TRUE(config.monitored_layers.empty());

		EXPECT_THROW(AuxiliaryLossConfig(Json(JsonType::Object)), JsonKeyError);
	}
	TEST(TestAuxiliaryLossConfig, load)
	{
		const Json json = Json::load(
				R"({"num_experts": 16, "top_k": 2, "z_loss_coef": 0.1, "compute_d_loss": false, "group_loss": "kl", "monitored_layers": [0, 3]})");
		const AuxiliaryLossConfig config(json);
		EXPECT_EQ(config.num_experts, 16);
		EXPECT_EQ(config.top_k, 2);
		EXPECT_EQ(config.z_loss_coef, 0.1);
		EXPECT_FALSE(config.compute_d_loss);
		EXPECT_EQ(config.group_loss, "kl");
		EXPECT_EQ(config.monitored_layers, std::vector<int>( { 0, 3 }));

		EXPECT_THROW(AuxiliaryLossConfig(Json::load(R"({"num_experts": 4, "monitored_layers": "some"})")), IllegalArgument);
	}
	TEST(TestAuxiliaryLossConfig, round_trip)
	{
		AuxiliaryLossConfig config = make_config("bounded");
		config.d_loss_coef = 0.5;
		config.compute_group_loss = false;
		config.monitored_layers = { 1, 2 };

		const AuxiliaryLossConfig loaded(Json::load(config.toJson().dump()));
		EXPECT_EQ(loaded.num_experts, config.num_experts);
		EXPECT_EQ(loaded.d_loss_coef, 0.5);
		EXPECT_FALSE(loaded.compute_group_loss);
		EXPECT_EQ(loaded.group_loss, "bounded");
		EXPECT_EQ(loaded.monitored_layers, config.monitored_layers);

		EXPECT_EQ(make_config("js").toJson()["monitored_layers"].getString(), "all");
	}

	TEST(TestAuxiliaryLosses, single_layer)
	{
		Context context;
		const AuxiliaryLosses losses(make_config("self_balance"));

		const AuxiliaryLossReport report = losses.computeLayer(context, uniform_router(0.2, 0.6));
		EXPECT_EQ(report.layers, 1);
		EXPECT_NEAR(report.z_loss, z_loss_of_zeros, 1.0e-12);
		EXPECT_NEAR(report.load_balancing_loss, uniform_load_balancing, 1.0e-12);
		EXPECT_NEAR(report.d_loss, 1.0, 1.0e-9);
		EXPECT_NEAR(report.group_loss, 0.16, 1.0e-12);

		const double expected = 0.001 * z_loss_of_zeros + 0.01 * uniform_load_balancing + 0.01 * 1.0 + 0.01 * 0.16;
		EXPECT_NEAR(report.total, expected, 1.0e-9);
	}
	TEST(TestAuxiliaryLosses, balanced_layer)
	{
		Context context;
		const AuxiliaryLosses losses(make_config("js"));

		const AuxiliaryLossReport report = losses.computeLayer(context, balanced_router());
		EXPECT_NEAR(report.load_balancing_loss, 0.0, 1.0e-12);
		EXPECT_NEAR(report.d_loss, 0.0, 1.0e-9);
		EXPECT_NEAR(report.group_loss, 0.0, 1.0e-7);
		EXPECT_NEAR(report.total, 0.001 * z_loss_of_zeros, 1.0e-9);
	}
	TEST(TestAuxiliaryLosses, disabled_terms)
	{
		Context context;
		AuxiliaryLossConfig config = make_config("self_balance");
		config.compute_router_losses = false;
		config.compute_group_loss = false;
		const AuxiliaryLosses losses(config);

		const AuxiliaryLossReport report = losses.computeLayer(context, uniform_router(0.2, 0.6));
		EXPECT_EQ(report.z_loss, 0.0);
		EXPECT_EQ(report.load_balancing_loss, 0.0);
		EXPECT_EQ(report.group_loss, 0.0);
		EXPECT_NEAR(report.d_loss, 1.0, 1.0e-9);
		EXPECT_NEAR(report.total, 0.01, 1.0e-11);
	}
	TEST(TestAuxiliaryLosses, average_over_layers)
	{
		Context context;
		const AuxiliaryLosses losses(make_config("self_balance"));

		std::vector<RouterOutputs> layers;
		layers.push_back(uniform_router(0.2, 0.6));
		layers.push_back(balanced_router());

		const AuxiliaryLossReport first = losses.computeLayer(context, layers[0]);
		const AuxiliaryLossReport second = losses.computeLayer(context, layers[1]);
		const AuxiliaryLossReport report = losses.compute(context, layers);
		EXPECT_EQ(report.layers, 2);
		EXPECT_NEAR(report.z_loss, 0.5 * (first.z_loss + second.z_loss), 1.0e-12);
		EXPECT_NEAR(report.load_balancing_loss, 0.5 * (first.load_balancing_loss + second.load_balancing_loss), 1.0e-12);
		EXPECT_NEAR(report.d_loss, 0.5 * (first.d_loss + second.d_loss), 1.0e-12);
		EXPECT_NEAR(report.group_loss, 0.5 * (first.group_loss + second.group_loss), 1.0e-12);
		EXPECT_NEAR(report.total, 0.5 * (first.total + second.total), 1.0e-12);
		EXPECT_EQ(report.toString().substr(0, 8), "layers=2");
	}
	TEST(TestAuxiliaryLosses, monitored_layers)
	{
		Context context;
		AuxiliaryLossConfig config = make_config("self_balance");
		config.monitored_layers = { 1 };
		const AuxiliaryLosses losses(config);

		std::vector<RouterOutputs> layers;
		layers.push_back(uniform_router(0.2, 0.6));
		layers.push_back(balanced_router());

		const AuxiliaryLossReport report = losses.compute(context, layers);
		EXPECT_EQ(report.layers, 1);
		EXPECT_NEAR(report.total, losses.computeLayer(context, layers[1]).total, 1.0e-15);

		config.monitored_layers = { 0, 2 };
		const AuxiliaryLosses out_of_range(config);
		EXPECT_THROW(out_of_range.compute(context, layers), IndexOutOfBounds);
	}
	TEST(TestAuxiliaryLosses, invalid_configuration)
	{
		Context context;
		EXPECT_THROW(AuxiliaryLosses(make_config("mse")), IllegalArgument);

		AuxiliaryLossConfig config = make_config("js");
		config.top_k = 5;
		EXPECT_THROW(AuxiliaryLosses tmp(config), IllegalArgument);

		config.top_k = 1;
		config.monitored_layers = { -1 };
		EXPECT_THROW(AuxiliaryLosses tmp(config), IllegalArgument);

		const AuxiliaryLosses losses(make_config("js"));
		EXPECT_THROW(losses.compute(context, std::vector<RouterOutputs>()), IllegalArgument);
	}
	TEST(TestAuxiliaryLosses, copy)
	{
		Context context;
		const AuxiliaryLosses losses(make_config("kl"));
		const AuxiliaryLosses copy = losses;
		EXPECT_EQ(copy.getConfig().group_loss, "kl");

		const RouterOutputs outputs = uniform_router(0.3, 0.7);
		EXPECT_EQ(copy.computeLayer(context, outputs).total, losses.computeLayer(context, outputs).total);
	}
	TEST(TestAuxiliaryLosses, copy_after_move)
	{
		Context context;
		AuxiliaryLosses source(make_config("js"));
		const AuxiliaryLosses moved = std::move(source);

		EXPECT_NO_THROW(AuxiliaryLosses tmp(source));
		AuxiliaryLosses target(make_config("kl"));
		EXPECT_NO_THROW(target = source);

		target = moved;
		const RouterOutputs outputs = uniform_router(0.3, 0.7);
		EXPECT_EQ(target.computeLayer(context, outputs).total, moved.computeLayer(context, outputs).total);
	}

} /* namespace moxe */
