// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Base implementations for math library.
 * @ingroup aux_math
 */

#include "math/m_api.h"
#include "math/m_eigen_interop.hpp"

#include <Eigen/Core>
#include <Eigen/Geometry>

#include <assert.h>

using namespace lp::auxiliary::math;


/*
 *
 * Exported vector functions.
 *
 */

extern "C" bool
math_vec3_validate(const struct lp_vec3 *vec3)
{
	assert(vec3 != NULL);

	return map_vec3(*vec3).allFinite();
}


/*
 *
 * Exported quaternion functions.
 *
 */

extern "C" void
math_quat_from_euler_angles(const struct lp_vec3 *roll_pitch_yaw, struct lp_quat *result)
{
	assert(roll_pitch_yaw != NULL);
	assert(result != NULL);

	Eigen::AngleAxisf roll(roll_pitch_yaw->x, Eigen::Vector3f::UnitX());
	Eigen::AngleAxisf pitch(roll_pitch_yaw->y, Eigen::Vector3f::UnitY());
	Eigen::AngleAxisf yaw(roll_pitch_yaw->z, Eigen::Vector3f::UnitZ());

	map_quat(*result) = (yaw * pitch * roll).normalized();
}
