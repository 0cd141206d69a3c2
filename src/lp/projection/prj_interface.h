// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Public C interface to the stereographic projection renderer.
 * @ingroup projection
 */

#pragma once

#include "lp/lp_defines.h"
#include "lp/lp_frame.h"

#ifdef __cplusplus
extern "C" {
#endif


/*!
 * @defgroup projection Stereographic projection
 *
 * @brief Remaps an equirectangular source image into a "little planet" canvas.
 */

/*!
 * Parameters for one render pass, a plain value.
 *
 * @ingroup projection
 */
struct lp_projection_params
{
	//! Fractional shift of the canvas within the sampling plane, (0.5, 0.5) is no shift.
	struct lp_vec2 offset;

	//! Euler angles in radians, roll about X, pitch about Y and yaw about Z.
	struct lp_vec3 rotation;

	//! Scales the projection sphere radius, must be positive.
	float scale;
};

/*!
 * Fill out @p out_params with the built in defaults.
 *
 * @ingroup projection
 */
void
lp_projection_params_default(struct lp_projection_params *out_params);

/*!
 * Fill out @p out_params with the defaults, overridden by the `PRJ_OFFSET_X`,
 * `PRJ_OFFSET_Y`, `PRJ_ROTATION_X`, `PRJ_ROTATION_Y`, `PRJ_ROTATION_Z` and
 * `PRJ_SCALE` environment variables.
 *
 * @ingroup projection
 */
void
lp_projection_params_from_env(struct lp_projection_params *out_params);

/*!
 * The canvas size used when the caller has no opinion, `PRJ_CANVAS_SIZE`
 * squared, 600x600 by default.
 *
 * @ingroup projection
 */
struct lp_size
lp_projection_default_canvas_size(void);

/*!
 * Render @p src into a newly allocated R8G8B8 frame of @p canvas_size.
 *
 * Runs on a process wide worker pool, created on first use.
 *
 * @param      src         Source frame, only read.
 * @param      params      Projection parameters.
 * @param      canvas_size Size of the output canvas.
 * @param[out] out_frame   Receives a reference to the rendered canvas.
 *
 * @ingroup projection
 */
lp_result_t
lp_projection_render(struct lp_frame *src,
                     const struct lp_projection_params *params,
                     struct lp_size canvas_size,
                     struct lp_frame **out_frame);

/*!
 * Project a single canvas coordinate into fractional source image coordinates.
 *
 * @ingroup projection
 */
lp_result_t
lp_projection_project_point(struct lp_size image_size,
                            struct lp_size canvas_size,
                            const struct lp_projection_params *params,
                            struct lp_vec2 canvas_point,
                            struct lp_vec2 *out_image_point);

/*!
 * Returns a string for the result, the name of the enum value.
 *
 * @ingroup projection
 */
const char *
lp_result_str(lp_result_t ret);


#ifdef __cplusplus
}
#endif
