// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Eigen views of the C math structs, plus small Eigen helpers.
 * @ingroup aux_math
 */

#pragma once

#ifndef __cplusplus
#error "This header only usable from C++"
#endif

#include "math/m_api.h"

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace lp::auxiliary::math {

/*
 * The maps alias the struct memory, no copies are made. lp_quat is laid out
 * x, y, z, w like Eigen's coefficients.
 */

static inline Eigen::Map<const Eigen::Quaternionf>
map_quat(const struct lp_quat &q)
{
	return Eigen::Map<const Eigen::Quaternionf>{&q.x};
}

static inline Eigen::Map<Eigen::Quaternionf>
map_quat(struct lp_quat &q)
{
	return Eigen::Map<Eigen::Quaternionf>{&q.x};
}

static inline Eigen::Map<const Eigen::Vector3f>
map_vec3(const struct lp_vec3 &v)
{
	return Eigen::Map<const Eigen::Vector3f>{&v.x};
}

static inline Eigen::Map<const Eigen::Vector2f>
map_vec2(const struct lp_vec2 &v)
{
	return Eigen::Map<const Eigen::Vector2f>{&v.x};
}

static inline Eigen::Map<Eigen::Vector2f>
map_vec2(struct lp_vec2 &v)
{
	return Eigen::Map<Eigen::Vector2f>{&v.x};
}

/*!
 * Pull a vector that is already close to unit length back onto the unit
 * sphere, `v *= (3 - |v|^2) / 2`. Only accurate when |v| is near one.
 */
template <typename Derived>
static inline void
renormalize_fast(Eigen::MatrixBase<Derived> &v)
{
	using Scalar = typename Derived::Scalar;
	v *= Scalar(0.5) * (Scalar(3) - v.squaredNorm());
}

} // namespace lp::auxiliary::math
