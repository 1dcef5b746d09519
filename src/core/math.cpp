/*
 * math.cpp
 *
 *  Created on: Sep 16, 2026
 */

#include <moxe/core/math.hpp>
#include <moxe/core/Context.hpp>
#include <moxe/core/moxe_exceptions.hpp>
#include <moxe/core/Shape.hpp>
#include <moxe/core/Tensor.hpp>
#include <moxe/training/GroupLoss.hpp>
#include <moxe/utils/time_util.hpp>

#include <moxe/backend/cpu_backend.h>

#include <iostream>
#include <algorithm>

namespace
{
	using namespace moxe;
//#define USE_TIMING

#ifdef USE_TIMING
	struct Timer
	{
			std::string m_name;
			double m_start = 0.0;
			double m_total_time = 0.0;
			int m_count = 0;

			Timer(const std::string &name) :
					m_name(name)
			{
			}
			~Timer()
			{
				if (m_count > 0)
				{
					double time = m_total_time / m_count;
					char unit = ' ';
					if (time < 1.0e-3)
					{
						time *= 1.0e6;
						unit = 'u';
					}
					else
					{
						if (time < 1.0)
						{
							time *= 1.0e3;
							unit = 'm';
						}
					}
					std::cout << m_name << " : " << m_total_time << "s : " << time << " " << unit << "s (" << m_count << ")\n";
				}
			}
			void start() noexcept
			{
				m_start = getTime();
			}
			void stop() noexcept
			{
				m_total_time += getTime() - m_start;
				m_count++;
			}
	};
#else
	struct Timer
	{
			Timer(const std::string &name)
			{
			}
			void start() noexcept
			{
			}
			void stop() noexcept
			{
			}
	};
#endif

	struct TimerGuard
	{
			Timer &t;
			TimerGuard(Timer &timer) :
					t(timer)
			{
				t.start();
			}
			~TimerGuard()
			{
				t.stop();
			}
	};

	mxDataType_t get(DataType dtype) noexcept
	{
		return static_cast<mxDataType_t>(dtype);
	}
	mxGroupLossType_t get(GroupLossType type) noexcept
	{
		return static_cast<mxGroupLossType_t>(type);
	}
	mxContext_t get(const Context &context) noexcept
	{
		return context.backend();
	}
	mxTensor_t get(const Tensor &tensor) noexcept
	{
		mxTensor_t result;
		result.data = const_cast<void*>(tensor.data());
		result.dtype = get(tensor.dtype());
		result.rank = tensor.rank();
		for (int i = 0; i < Shape::max_dimension; i++)
			result.dim[i] = (i < tensor.rank()) ? tensor.shape().data()[i] : 0;
		return result;
	}

	void check_floating_point(const char *function, const Tensor &t)
	{
		if (not isFloatingPoint(t.dtype()))
			throw DataTypeNotSupported(function, t.dtype());
	}
	void check_positive_eps(const char *function, double eps)
	{
		if (eps <= 0.0)
			throw IllegalArgument(function, "eps", "must be positive", eps);
	}
}

namespace moxe
{
	void normalizedEntropy(const Context &context, const Tensor &probs, Tensor &entropy, double eps, bool normalize)
	{
		static Timer timer("normalizedEntropy");
		TimerGuard tg(timer);

		check_floating_point(METHOD_NAME, probs);
		check_positive_eps(METHOD_NAME, eps);
		if (probs.isEmpty())
			throw ShapeMismatch(METHOD_NAME, "probabilities must have at least one dimension");
		if (not same_type(probs, entropy))
			throw DataTypeMismatch(METHOD_NAME, probs.dtype(), entropy.dtype());
		if (entropy.volume() != probs.shape().rows())
			throw ShapeMismatch(METHOD_NAME, "expected " + std::to_string(probs.shape().rows()) + " output elements, got " + entropy.shape());

		cpu_normalized_entropy(get(context), get(probs), get(entropy), eps, normalize);
	}
	double mean(const Context &context, const Tensor &input)
	{
		if (not cpu_supports_type(get(input.dtype())))
			throw DataTypeNotSupported(METHOD_NAME, input.dtype());
		return cpu_mean(get(context), get(input));
	}

	void groupLoss(const Context &context, GroupLossType type, const Tensor &pm, const Tensor &ps, Tensor &loss, double eps)
	{
		static Timer timer("groupLoss");
		TimerGuard tg(timer);

		check_floating_point(METHOD_NAME, pm);
		check_positive_eps(METHOD_NAME, eps);
		if (not same_type(pm, ps, loss))
			throw DataTypeMismatch(METHOD_NAME, "pm, ps and loss must have the same type");
		if (pm.isEmpty() or ps.isEmpty())
			throw ShapeMismatch(METHOD_NAME, "pm and ps must not be empty");
		if (pm.shape() != ps.shape() and pm.volume() != 1 and ps.volume() != 1)
			throw ShapeMismatch(METHOD_NAME, pm.shape(), ps.shape());

		const Shape &expected = (pm.volume() >= ps.volume()) ? pm.shape() : ps.shape();
		if (loss.shape() != expected)
			throw ShapeMismatch(METHOD_NAME, expected, loss.shape());

		cpu_group_loss(get(context), get(type), get(pm), get(ps), get(loss), eps);
	}

	double routerZLoss(const Context &context, const Tensor &logits)
	{
		static Timer timer("routerZLoss");
		TimerGuard tg(timer);

		check_floating_point(METHOD_NAME, logits);
		if (logits.volume() == 0)
			throw ShapeMismatch(METHOD_NAME, "logits must not be empty");

		return cpu_router_z_loss(get(context), get(logits));
	}

	void selectTopK(const Context &context, const Tensor &input, Tensor &values, Tensor &indices)
	{
		static Timer timer("selectTopK");
		TimerGuard tg(timer);

		check_floating_point(METHOD_NAME, input);
		if (not same_type(input, values))
			throw DataTypeMismatch(METHOD_NAME, input.dtype(), values.dtype());
		if (indices.dtype() != DataType::INT32)
			throw DataTypeMismatch(METHOD_NAME, DataType::INT32, indices.dtype());
		if (not same_shape(values, indices))
			throw ShapeMismatch(METHOD_NAME, values.shape(), indices.shape());
		if (values.shape().rows() != input.shape().rows())
			throw ShapeMismatch(METHOD_NAME, "input has " + std::to_string(input.shape().rows()) + " rows, output has " + values.shape());
		if (values.lastDim() <= 0 or values.lastDim() > input.lastDim())
			throw ShapeMismatch(METHOD_NAME, "cannot select top " + std::to_string(values.lastDim()) + " out of " + std::to_string(input.lastDim()));

		cpu_select_top_k(get(context), get(input), get(values), get(indices));
	}
	void scatterAdd(const Context &context, const Tensor &indices, const Tensor &values, Tensor &output)
	{
		static Timer timer("scatterAdd");
		TimerGuard tg(timer);

		if (indices.dtype() != DataType::INT32)
			throw DataTypeMismatch(METHOD_NAME, DataType::INT32, indices.dtype());
		if (output.rank() != 1)
			throw ShapeMismatch(METHOD_NAME, 1, output.rank());
		if (not values.isEmpty())
		{
			if (not same_type(values, output))
				throw DataTypeMismatch(METHOD_NAME, output.dtype(), values.dtype());
			if (values.volume() != indices.volume())
				throw ShapeMismatch(METHOD_NAME, "values and indices must have the same number of elements");
		}

		cpu_scatter_add(get(context), get(indices), get(values), get(output));
	}
	double loadBalancingLoss(const Context &context, const Tensor &expert_load, Tensor &expert_usage, int total_tokens, int top_k)
	{
		static Timer timer("loadBalancingLoss");
		TimerGuard tg(timer);

		check_floating_point(METHOD_NAME, expert_load);
		if (not same_type(expert_load, expert_usage))
			throw DataTypeMismatch(METHOD_NAME, expert_load.dtype(), expert_usage.dtype());
		if (not same_shape(expert_load, expert_usage))
			throw ShapeMismatch(METHOD_NAME, expert_load.shape(), expert_usage.shape());
		if (expert_load.rank() != 1)
			throw ShapeMismatch(METHOD_NAME, 1, expert_load.rank());
		if (total_tokens <= 0)
			throw IllegalArgument(METHOD_NAME, "total_tokens", "must be positive", total_tokens);
		if (top_k <= 0)
			throw IllegalArgument(METHOD_NAME, "top_k", "must be positive", top_k);

		return cpu_load_balancing_loss(get(context), get(expert_load), get(expert_usage), total_tokens, top_k);
	}

} /* namespace moxe */
