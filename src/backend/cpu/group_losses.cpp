/*
 * group_losses.cpp
 *
 *  Created on: Sep 16, 2026
 */

#include <moxe/backend/cpu_backend.h>
#include <moxe/backend/backend_utils.hpp>

#include "common_math.hpp"

#include <algorithm>
#include <cmath>
#include <cassert>

namespace
{
	using namespace moxe;
	using namespace moxe::cpu;

	template<typename T>
	struct SelfBalance
	{
			T operator()(T pm, T ps, T eps) const noexcept
			{
				return square(pm - ps);
			}
	};
	template<typename T>
	struct BoundedDeviation
	{
			T operator()(T pm, T ps, T eps) const noexcept
			{
				return square(pm - static_cast<T>(0.5)) + square(ps - static_cast<T>(0.5));
			}
	};
	/*
	 * KL([pm, ps] || [0.5, 0.5]), meaningful only when pm + ps is close to 1.
	 */
	template<typename T>
	struct KLToUniform
	{
			T operator()(T pm, T ps, T eps) const noexcept
			{
				return pm * std::log(static_cast<T>(2) * pm + eps) + ps * std::log(static_cast<T>(2) * ps + eps);
			}
	};
	template<typename T>
	struct JSToUniform
	{
			T operator()(T pm, T ps, T eps) const noexcept
			{
				const T half = static_cast<T>(0.5);
				const T m_pm = half * (pm + half);
				const T m_ps = half * (ps + half);
				const T kl_pm = pm * std::log((pm + eps) / (m_pm + eps)) + ps * std::log((ps + eps) / (m_ps + eps));
				const T kl_qm = half * std::log(half / (m_pm + eps)) + half * std::log(half / (m_ps + eps));
				return half * (kl_pm + kl_qm);
			}
	};

	/*
	 * Either input may hold a single element, which is then broadcast against the other.
	 */
	template<typename T, class Op>
	void group_loss_kernel(T *dst, const T *pm, int pm_elements, const T *ps, int ps_elements, T eps)
	{
		Op op;
		const int elements = std::max(pm_elements, ps_elements);
		const int pm_stride = (pm_elements == 1) ? 0 : 1;
		const int ps_stride = (ps_elements == 1) ? 0 : 1;
#pragma omp parallel for
		for (int i = 0; i < elements; i++)
			dst[i] = op(pm[i * pm_stride], ps[i * ps_stride], eps);
	}

	template<typename T>
	void dispatch_group_loss(mxGroupLossType_t type, mxTensor_t &loss, const mxTensor_t &pm, const mxTensor_t &ps, T eps)
	{
		switch (type)
		{
			case GROUP_LOSS_SELF_BALANCE:
				group_loss_kernel<T, SelfBalance<T>>(data<T>(loss), data<T>(pm), volume(pm), data<T>(ps), volume(ps), eps);
				break;
			case GROUP_LOSS_BOUNDED:
				group_loss_kernel<T, BoundedDeviation<T>>(data<T>(loss), data<T>(pm), volume(pm), data<T>(ps), volume(ps), eps);
				break;
			case GROUP_LOSS_KL:
				group_loss_kernel<T, KLToUniform<T>>(data<T>(loss), data<T>(pm), volume(pm), data<T>(ps), volume(ps), eps);
				break;
			case GROUP_LOSS_JS:
				group_loss_kernel<T, JSToUniform<T>>(data<T>(loss), data<T>(pm), volume(pm), data<T>(ps), volume(ps), eps);
				break;
		}
	}
}

namespace moxe
{
	void cpu_group_loss(mxContext_t context, mxGroupLossType_t type, const mxTensor_t pm, const mxTensor_t ps, mxTensor_t loss, double eps)
	{
		assert(pm.dtype == ps.dtype && pm.dtype == loss.dtype);
		assert(volume(loss) == std::max(volume(pm), volume(ps)));

		switch (loss.dtype)
		{
			case DTYPE_FLOAT32:
				dispatch_group_loss(type, loss, pm, ps, static_cast<float>(eps));
				break;
			case DTYPE_FLOAT64:
				dispatch_group_loss(type, loss, pm, ps, eps);
				break;
			default:
				break;
		}
	}

} /* namespace moxe */
