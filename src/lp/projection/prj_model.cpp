// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Canvas to source image projection model.
 * @ingroup projection
 */

#include "math/m_mathinclude.h"
#include "math/m_eigen_interop.hpp"

#include "projection/prj_model.hpp"
#include "projection/prj_interface.h"
#include "projection/prj_stereographic_unprojection.hpp"

#include <new>
#include <cmath>
#include <algorithm>
#include <stdexcept>


namespace lp::projection {

using lp::auxiliary::math::renormalize_fast;


static float
compute_radius(const lp_size &canvas_size, float scale)
{
	const float min_side = static_cast<float>(std::min(canvas_size.w, canvas_size.h));
	return min_side / 10.0f * scale;
}

void
throwOnError(lp_result_t ret, const std::string &what)
{
	switch (ret) {
	case LP_SUCCESS: return;
	case LP_ERROR_DEGENERATE_RADIUS: throw std::domain_error(what + ": " + lp_result_str(ret));
	case LP_ERROR_ALLOCATION: throw std::bad_alloc();
	default: throw std::invalid_argument(what + ": " + lp_result_str(ret));
	}
}

lp_result_t
ProjectionModel::check(const lp_size &image_size,
                       const lp_size &canvas_size,
                       const Eigen::Vector2f &offset,
                       const Eigen::Quaternionf &rotation,
                       float scale) noexcept
{
	if (image_size.w == 0 || image_size.h == 0 || canvas_size.w == 0 || canvas_size.h == 0) {
		return LP_ERROR_INVALID_DIMENSIONS;
	}

	if (!offset.allFinite() || !rotation.coeffs().allFinite() || rotation.squaredNorm() <= 0.0f) {
		return LP_ERROR_INVALID_PARAMETERS;
	}

	const float radius = compute_radius(canvas_size, scale);
	if (!std::isfinite(radius) || !(radius > 0.0f)) {
		return LP_ERROR_DEGENERATE_RADIUS;
	}

	return LP_SUCCESS;
}

lp_result_t
ProjectionModel::check(const lp_size &image_size, const lp_size &canvas_size, const Parameters &params) noexcept
{
	return check(image_size, canvas_size, params.offset, params.rotation, params.scale);
}

ProjectionModel::ProjectionModel(const lp_size &image_size,
                                 const lp_size &canvas_size,
                                 const Eigen::Vector2f &offset,
                                 const Eigen::Quaternionf &rotation,
                                 float scale)
    : image_size_(image_size), canvas_size_(canvas_size)
{
	throwOnError(check(image_size, canvas_size, offset, rotation, scale), "ProjectionModel");

	const Eigen::Vector2f canvas{static_cast<float>(canvas_size.w), static_cast<float>(canvas_size.h)};
	shift_ = (offset - Eigen::Vector2f::Constant(0.5f)).cwiseProduct(canvas);
	rotation_ = rotation.normalized();
	radius_ = compute_radius(canvas_size, scale);
}

ProjectionModel::ProjectionModel(const lp_size &image_size, const lp_size &canvas_size, const Parameters &params)
    : ProjectionModel(image_size, canvas_size, params.offset, params.rotation, params.scale)
{}

Eigen::Vector3f
ProjectionModel::unproject(const Eigen::Vector2f &p) const
{
	return stereographic_unprojection(p + shift_, radius_);
}

Eigen::Vector2f
ProjectionModel::sphereToImage(Eigen::Vector3f v) const
{
	// Rotation drifts off the unit sphere a little, pull it back.
	renormalize_fast(v);

	const float row = std::acos(v.z()) / static_cast<float>(M_PI);
	const float col = std::atan2(v.x(), v.y()) / static_cast<float>(2.0 * M_PI) + 0.5f;

	return {col * static_cast<float>(image_size_.w), row * static_cast<float>(image_size_.h)};
}

Eigen::Vector2f
ProjectionModel::project(const Eigen::Vector2f &p) const
{
	return sphereToImage(rotation_ * unproject(p));
}

} // namespace lp::projection
