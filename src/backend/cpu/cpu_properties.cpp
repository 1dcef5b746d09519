/*
 * cpu_properties.cpp
 *
 *  Created on: Sep 15, 2026
 */

#include <moxe/backend/cpu_backend.h>

#include <string>
#include <omp.h>

namespace
{
	std::string get_device_info()
	{
		return "CPU : " + std::to_string(moxe::cpu_get_number_of_cores()) + " cores, OpenMP " + std::to_string(_OPENMP);
	}
}

namespace moxe
{
	void cpu_set_number_of_threads(int number)
	{
		omp_set_num_threads(number);
	}
	int cpu_get_number_of_threads()
	{
		return omp_get_max_threads();
	}
	int cpu_get_number_of_cores()
	{
		return omp_get_num_procs();
	}
	bool cpu_supports_type(mxDataType_t dtype)
	{
		switch (dtype)
		{
			case DTYPE_FLOAT32:
			case DTYPE_FLOAT64:
			case DTYPE_INT32:
				return true;
			default:
				return false;
		}
	}
	const char* cpu_get_device_info()
	{
		static const std::string info = get_device_info();
		return info.data();
	}

} /* namespace moxe */
