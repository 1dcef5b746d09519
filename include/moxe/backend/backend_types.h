/*
 * backend_types.h
 *
 *  Created on: Sep 14, 2026
 */

#ifndef MOXE_BACKEND_BACKEND_TYPES_H_
#define MOXE_BACKEND_BACKEND_TYPES_H_

namespace moxe
{
#ifdef __cplusplus
	extern "C"
	{
#endif

		typedef struct
		{
				int rank;
				int dim[6];
		} mxShape_t;

		/* must stay in the same order as moxe::DataType */
		typedef enum
		{
			DTYPE_UNKNOWN,
			DTYPE_FLOAT32,
			DTYPE_FLOAT64,
			DTYPE_INT32
		} mxDataType_t;

		typedef enum
		{
			GROUP_LOSS_SELF_BALANCE,
			GROUP_LOSS_BOUNDED,
			GROUP_LOSS_KL,
			GROUP_LOSS_JS
		} mxGroupLossType_t;

		typedef struct
		{
				void *data;
				mxDataType_t dtype;
				int rank;
				int dim[6];
		} mxTensor_t;

		typedef void *mxContext_t;

#ifdef __cplusplus
	}
#endif
} /* namespace moxe */

#endif /* MOXE_BACKEND_BACKEND_TYPES_H_ */
