// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Projection parameters value type.
 * @ingroup projection
 */

#pragma once

#include "projection/prj_interface.h"

#include <Eigen/Core>
#include <Eigen/Geometry>


namespace lp::projection {

//! Offset used by the interactive front end at start up.
constexpr float kDefaultOffsetX = 0.0f;
constexpr float kDefaultOffsetY = 0.4f;

//! Euler angles used by the interactive front end at start up.
constexpr float kDefaultRotationX = 0.0f;
constexpr float kDefaultRotationY = 0.09f;
constexpr float kDefaultRotationZ = 0.0f;

constexpr float kDefaultScale = 1.5f;

constexpr uint32_t kDefaultCanvasSize = 600;

/*!
 * Immutable set of user controlled values for one render pass.
 *
 * Build a fresh one from the current input before every pass.
 */
struct Parameters
{
	Eigen::Vector2f offset = {kDefaultOffsetX, kDefaultOffsetY};

	//! Unit quaternion, rotates sphere directions.
	Eigen::Quaternionf rotation = Eigen::Quaternionf::Identity();

	float scale = kDefaultScale;


	/*!
	 * The start up values, including the start up rotation.
	 */
	static Parameters
	defaults();

	/*!
	 * Build from Euler angles, see @ref math_quat_from_euler_angles for the order.
	 */
	static Parameters
	fromEulerAngles(const Eigen::Vector2f &offset, const Eigen::Vector3f &roll_pitch_yaw, float scale);

	//! Convert from the C interface struct.
	static Parameters
	fromC(const lp_projection_params &params);

	EIGEN_MAKE_ALIGNED_OPERATOR_NEW
};

} // namespace lp::projection
