/*
 * test_router_losses.cpp
 *
 *  Created on: Sep 24, 2026
 */

#include <moxe/core/math.hpp>
#include <moxe/core/Context.hpp>
#include <moxe/core/Tensor.hpp>
#include <moxe/core/moxe_exceptions.hpp>
#include <moxe/training/RouterZLoss.hpp>
#include <moxe/utils/json.hpp>
#include <moxe/utils/random.hpp>
#include <moxe/utils/testing_util.hpp>

#include <algorithm>
#include <cmath>
#include <vector>
#include <gtest/gtest.h>

namespace
{
	using namespace moxe;

	double baseline_z_loss(const Tensor &logits)
	{
		const int rows = logits.shape().rows();
		const int columns = logits.lastDim();
		const Tensor flat = logits.view( { rows, columns });
		double result = 0.0;
		for (int i = 0; i < rows; i++)
		{
			double sum = 0.0;
			for (int j = 0; j < columns; j++)
				sum += std::exp(flat.get( { i, j }));
			result += std::log(sum) * std::log(sum);
		}
		return result / rows;
	}

	void baseline_scatter_add(Tensor &output, const Tensor &indices, const Tensor &values)
	{
		for (int i = 0; i < indices.volume(); i++)
		{
			const int idx = indices.get( { i });
			if (0 <= idx and idx < output.volume())
				output.set(output.get( { idx }) + (values.isEmpty() ? 1.0 : values.get( { i })), { idx });
		}
	}

	class ThreadCountGuard
	{
			int m_old;
		public:
			ThreadCountGuard(int t) :
					m_old(Context::numberOfThreads())
			{
				Context::setNumberOfThreads(t);
			}
			~ThreadCountGuard()
			{
				Context::setNumberOfThreads(m_old);
			}
	};
}

namespace moxe
{
	TEST(TestRouterZLoss, matches_baseline)
	{
		Context context;
		Tensor logits( { 3, 5, 8 }, DataType::FLOAT64);
		testing::initForTest(logits, 0.0, 3.0);

		EXPECT_NEAR(routerZLoss(context, logits), baseline_z_loss(logits), 1.0e-12);
		EXPECT_NEAR(RouterZLoss().getLoss(context, logits), baseline_z_loss(logits), 1.0e-12);
	}
	TEST(TestRouterZLoss, large_logits)
	{
		Context context;
		Tensor logits( { 2, 4 }, DataType::FLOAT32);
		logits.setall(100.0f);
		// log(4 * exp(100)) = 100 + log(4)
		const double expected = (100.0 + std::log(4.0)) * (100.0 + std::log(4.0));
		EXPECT_NEAR(routerZLoss(context, logits), expected, 1.0e-2);
	}
	TEST(TestRouterZLoss, increases_with_shift)
	{
		Context context;
		Tensor logits( { 6, 8 }, DataType::FLOAT32);
		testing::initForTest(logits, 0.0, 0.5);
		Tensor shifted = logits;
		for (int i = 0; i < 6; i++)
			for (int j = 0; j < 8; j++)
				shifted.set(logits.get( { i, j }) + 0.5, { i, j });

		const double original = routerZLoss(context, logits);
		EXPECT_GT(routerZLoss(context, shifted), original);
		EXPECT_GT(original, 0.0);
	}
	TEST(TestRouterZLoss, invalid_arguments)
	{
		Context context;
		EXPECT_THROW(routerZLoss(context, Tensor( { 4, 4 }, DataType::INT32)), DataTypeNotSupported);
		EXPECT_THROW(routerZLoss(context, Tensor()), DataTypeNotSupported);
		EXPECT_THROW(RouterZLoss(Json( { { "name", "load_balancing" } })), IllegalArgument);
		EXPECT_EQ(RouterZLoss().getConfig()["name"].getString(), "z_loss");
	}

	TEST(TestSelectTopK, descending_order)
	{
		Context context;
		const Tensor input = toTensor( { { 0.1f, 0.4f, 0.2f, 0.3f }, { 0.7f, 0.05f, 0.05f, 0.2f } });
		Tensor values( { 2, 2 }, DataType::FLOAT32);
		Tensor indices( { 2, 2 }, DataType::INT32);

		selectTopK(context, input, values, indices);
		EXPECT_EQ(indices.get( { 0, 0 }), 1);
		EXPECT_EQ(indices.get( { 0, 1 }), 3);
		EXPECT_EQ(indices.get( { 1, 0 }), 0);
		EXPECT_EQ(indices.get( { 1, 1 }), 3);
		EXPECT_FLOAT_EQ(values.get( { 0, 0 }), 0.4f);
		EXPECT_FLOAT_EQ(values.get( { 0, 1 }), 0.3f);
		EXPECT_FLOAT_EQ(values.get( { 1, 0 }), 0.7f);
		EXPECT_FLOAT_EQ(values.get( { 1, 1 }), 0.2f);
	}
	TEST(TestSelectTopK, ties_prefer_lower_index)
	{
		Context context;
		const Tensor input = toTensor( { { 0.25f, 0.25f, 0.25f, 0.25f } }, DataType::FLOAT64);
		Tensor values( { 1, 3 }, DataType::FLOAT64);
		Tensor indices( { 1, 3 }, DataType::INT32);

		selectTopK(context, input, values, indices);
		EXPECT_EQ(indices.get( { 0, 0 }), 0);
		EXPECT_EQ(indices.get( { 0, 1 }), 1);
		EXPECT_EQ(indices.get( { 0, 2 }), 2);
	}
	TEST(TestSelectTopK, matches_sorting)
	{
		Context context;
		Tensor input( { 64, 16 }, DataType::FLOAT32);
		testing::initRandom(input);
		Tensor values( { 64, 4 }, DataType::FLOAT32);
		Tensor indices( { 64, 4 }, DataType::INT32);

		selectTopK(context, input, values, indices);
		for (int i = 0; i < 64; i++)
		{
			std::vector<float> row(16);
			for (int j = 0; j < 16; j++)
				row[j] = input.get( { i, j });
			std::sort(row.begin(), row.end(), [](float a, float b)
			{	return a > b;});
			for (int j = 0; j < 4; j++)
			{
				EXPECT_EQ(static_cast<float>(values.get( { i, j })), row[j]);
				EXPECT_EQ(input.get( { i, static_cast<int>(indices.get( { i, j })) }), values.get( { i, j }));
			}
		}
	}
	TEST(TestSelectTopK, invalid_arguments)
	{
		Context context;
		const Tensor input( { 4, 3 }, DataType::FLOAT32);
		Tensor values( { 4, 4 }, DataType::FLOAT32);
		Tensor indices( { 4, 4 }, DataType::INT32);
		EXPECT_THROW(selectTopK(context, input, values, indices), ShapeMismatch);

		Tensor values2( { 4, 2 }, DataType::FLOAT32);
		Tensor float_indices( { 4, 2 }, DataType::FLOAT32);
		EXPECT_THROW(selectTopK(context, input, values2, float_indices), DataTypeMismatch);

		Tensor indices3( { 3, 2 }, DataType::INT32);
		Tensor values3( { 3, 2 }, DataType::FLOAT32);
		EXPECT_THROW(selectTopK(context, input, values3, indices3), ShapeMismatch);
	}

	TEST(TestScatterAdd, duplicate_indices)
	{
		Context context;
		const Tensor indices = toTensor( { 0.0f, 2.0f, 2.0f, 2.0f, 1.0f, 0.0f }, DataType::INT32);
		const Tensor values = toTensor( { 0.5f, 0.25f, 0.25f, 0.25f, 1.0f, 0.5f });
		Tensor output( { 3 }, DataType::FLOAT32);

		scatterAdd(context, indices, values, output);
		EXPECT_FLOAT_EQ(output.get( { 0 }), 1.0f);
		EXPECT_FLOAT_EQ(output.get( { 1 }), 1.0f);
		EXPECT_FLOAT_EQ(output.get( { 2 }), 0.75f);

		Tensor counts( { 3 }, DataType::INT32);
		scatterAdd(context, indices, Tensor(), counts);
		EXPECT_EQ(counts.get( { 0 }), 2);
		EXPECT_EQ(counts.get( { 1 }), 1);
		EXPECT_EQ(counts.get( { 2 }), 3);
	}
	TEST(TestScatterAdd, out_of_range_indices_are_dropped)
	{
		Context context;
		const Tensor indices = toTensor( { -1.0f, 0.0f, 4.0f, 3.0f, 100.0f }, DataType::INT32);
		Tensor counts( { 4 }, DataType::INT32);

		scatterAdd(context, indices, Tensor(), counts);
		EXPECT_EQ(counts.toVector(), std::vector<double>( { 1.0, 0.0, 0.0, 1.0 }));
	}
	TEST(TestScatterAdd, accumulates_into_existing_values)
	{
		Context context;
		const Tensor indices = toTensor( { 1.0f }, DataType::INT32);
		Tensor output = toTensor( { 1.0f, 2.0f }, DataType::FLOAT64);
		scatterAdd(context, indices, toTensor( { 0.5f }, DataType::FLOAT64), output);
		EXPECT_EQ(output.get( { 1 }), 2.5);
	}
	TEST(TestScatterAdd, matches_sequential_with_many_threads)
	{
		const ThreadCountGuard guard(4);
		Context context;

		const int elements = 10000;
		Tensor indices( { elements }, DataType::INT32);
		Tensor values( { elements }, DataType::FLOAT64);
		for (int i = 0; i < elements; i++)
		{
			indices.set(randInt(8), { i });
			values.set(0.125 * randInt(8), { i });
		}

		Tensor correct( { 8 }, DataType::FLOAT64);
		Tensor output( { 8 }, DataType::FLOAT64);
		baseline_scatter_add(correct, indices, values);
		scatterAdd(context, indices, values, output);
		EXPECT_EQ(testing::maxAbsDiff(correct, output), 0.0);

		Tensor correct_counts( { 8 }, DataType::INT32);
		Tensor counts( { 8 }, DataType::INT32);
		baseline_scatter_add(correct_counts, indices, Tensor());
		scatterAdd(context, indices, Tensor(), counts);
		EXPECT_EQ(counts.toVector(), correct_counts.toVector());
		EXPECT_EQ(testing::sumForTest(counts), elements);
	}
	TEST(TestScatterAdd, invalid_arguments)
	{
		Context context;
		const Tensor indices( { 4 }, DataType::INT32);
		Tensor output( { 4 }, DataType::FLOAT32);

		EXPECT_THROW(scatterAdd(context, Tensor( { 4 }, DataType::FLOAT32), Tensor(), output), DataTypeMismatch);
		EXPECT_THROW(scatterAdd(context, indices, Tensor( { 3 }, DataType::FLOAT32), output), ShapeMismatch);
		EXPECT_THROW(scatterAdd(context, indices, Tensor( { 4 }, DataType::FLOAT64), output), DataTypeMismatch);
		Tensor matrix( { 2, 2 }, DataType::FLOAT32);
		EXPECT_THROW(scatterAdd(context, indices, Tensor(), matrix), ShapeMismatch);
	}

	TEST(TestLoadBalancingKernel, usage_and_loss)
	{
		Context context;
		const Tensor load = toTensor( { 4.0f, 0.0f, 0.0f, 0.0f }, DataType::FLOAT64);
		Tensor usage( { 4 }, DataType::FLOAT64);

		const double loss = loadBalancingLoss(context, load, usage, 4, 1);
		EXPECT_EQ(usage.toVector(), std::vector<double>( { 1.0, 0.0, 0.0, 0.0 }));
		EXPECT_NEAR(loss, 0.75, 1.0e-12);

		EXPECT_THROW(loadBalancingLoss(context, load, usage, 0, 1), IllegalArgument);
		EXPECT_THROW(loadBalancingLoss(context, load, usage, 4, 0), IllegalArgument);
	}

} /* namespace moxe */
