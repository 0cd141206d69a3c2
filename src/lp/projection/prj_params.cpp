// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Projection parameters value type.
 * @ingroup projection
 */

#include "math/m_api.h"
#include "math/m_eigen_interop.hpp"

#include "projection/prj_params.hpp"


namespace lp::projection {

using lp::auxiliary::math::map_quat;
using lp::auxiliary::math::map_vec2;


Parameters
Parameters::defaults()
{
	return fromEulerAngles({kDefaultOffsetX, kDefaultOffsetY},
	                       {kDefaultRotationX, kDefaultRotationY, kDefaultRotationZ}, kDefaultScale);
}

Parameters
Parameters::fromEulerAngles(const Eigen::Vector2f &offset, const Eigen::Vector3f &roll_pitch_yaw, float scale)
{
	lp_projection_params params = {};
	map_vec2(params.offset) = offset;
	params.rotation = {roll_pitch_yaw.x(), roll_pitch_yaw.y(), roll_pitch_yaw.z()};
	params.scale = scale;

	return fromC(params);
}

Parameters
Parameters::fromC(const lp_projection_params &params)
{
	struct lp_quat q = {0, 0, 0, 1};
	math_quat_from_euler_angles(&params.rotation, &q);

	Parameters ret;
	ret.offset = map_vec2(params.offset);
	ret.rotation = map_quat(q);
	ret.scale = params.scale;

	return ret;
}

} // namespace lp::projection
