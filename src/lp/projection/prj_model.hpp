// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Canvas to source image projection model.
 * @ingroup projection
 */

#pragma once

#include "lp/lp_results.h"
#include "lp/lp_defines.h"

#include "projection/prj_params.hpp"

#include <string>


namespace lp::projection {

/*!
 * Throw the exception matching @p ret, does nothing for @ref LP_SUCCESS.
 *
 * @throws std::domain_error    for @ref LP_ERROR_DEGENERATE_RADIUS.
 * @throws std::bad_alloc       for @ref LP_ERROR_ALLOCATION.
 * @throws std::invalid_argument for every other error.
 */
void
throwOnError(lp_result_t ret, const std::string &what);

/*!
 * Maps canvas pixel coordinates to fractional source image coordinates.
 *
 * A canvas pixel is shifted by the offset, unprojected onto a sphere whose
 * radius is a tenth of the smaller canvas dimension times the scale, rotated
 * and then converted to equirectangular coordinates.
 *
 * Immutable once built, safe to share between threads.
 */
class ProjectionModel
{
public:
	/*!
	 * Validate the values without building a model.
	 */
	static lp_result_t
	check(const lp_size &image_size,
	      const lp_size &canvas_size,
	      const Eigen::Vector2f &offset,
	      const Eigen::Quaternionf &rotation,
	      float scale) noexcept;

	static lp_result_t
	check(const lp_size &image_size, const lp_size &canvas_size, const Parameters &params) noexcept;

	/*!
	 * @throws std::invalid_argument on zero sizes or non-finite offset or rotation.
	 * @throws std::domain_error if the scale gives no usable radius.
	 */
	ProjectionModel(const lp_size &image_size,
	                const lp_size &canvas_size,
	                const Eigen::Vector2f &offset,
	                const Eigen::Quaternionf &rotation,
	                float scale);

	ProjectionModel(const lp_size &image_size, const lp_size &canvas_size, const Parameters &params);

	/*!
	 * Project the canvas coordinate @p p, the result is (column, row) and may
	 * be outside of the image or NaN close to the poles.
	 */
	Eigen::Vector2f
	project(const Eigen::Vector2f &p) const;

	//! The point on the unit sphere that @p p unprojects to, before rotation.
	Eigen::Vector3f
	unproject(const Eigen::Vector2f &p) const;

	//! Equirectangular coordinates of the direction @p v.
	Eigen::Vector2f
	sphereToImage(Eigen::Vector3f v) const;

	float
	radius() const
	{
		return radius_;
	}

	const lp_size &
	imageSize() const
	{
		return image_size_;
	}

	const lp_size &
	canvasSize() const
	{
		return canvas_size_;
	}

	EIGEN_MAKE_ALIGNED_OPERATOR_NEW


private:
	lp_size image_size_;
	lp_size canvas_size_;

	//! Precomputed (offset - 0.5) * canvas size.
	Eigen::Vector2f shift_;
	Eigen::Quaternionf rotation_;
	float radius_;
};

} // namespace lp::projection
