// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  C interface to the math library.
 * @ingroup aux_math
 */

#pragma once

#include "lp/lp_defines.h"
#include "m_mathinclude.h"

#ifdef __cplusplus
extern "C" {
#endif


/*!
 * @defgroup aux_math Math
 * @ingroup aux
 *
 * @brief The few rotation and vector helpers the projection needs from C.
 */


/*
 *
 * Vector functions
 *
 */

//! True if every component is finite.
bool
math_vec3_validate(const struct lp_vec3 *vec3);


/*
 *
 * Quat functions.
 *
 */

/*!
 * Create a rotation from three Euler angles in radians, roll about X, pitch
 * about Y and yaw about Z, applied in that order: `Rz(yaw) * Ry(pitch) * Rx(roll)`.
 *
 * @relates lp_quat
 * @see lp_vec3
 * @ingroup aux_math
 */
void
math_quat_from_euler_angles(const struct lp_vec3 *roll_pitch_yaw, struct lp_quat *result);


#ifdef __cplusplus
}
#endif
