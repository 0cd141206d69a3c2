// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Stereographic unprojection onto a sphere of a given radius.
 * @ingroup projection
 */

#pragma once

#include <Eigen/Core>


namespace lp::projection {

/*!
 * Map a point on the plane to a unit direction, the plane touches a sphere of
 * @p radius at its south pole and is projected from the north pole.
 *
 * The plane origin maps to (0, 0, 1).
 */
static inline Eigen::Vector3f
stereographic_unprojection(const Eigen::Vector2f &p, float radius)
{
	const float r2 = radius * radius;
	const float k = (2.0f * r2) / (p.squaredNorm() + r2);

	Eigen::Vector3f v{k * p.x(), k * p.y(), (k - 1.0f) * radius};

	return v.normalized();
}

} // namespace lp::projection
