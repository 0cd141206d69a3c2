// Copyright 2020-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Internal result type for littleplanet.
 * @ingroup lp_iface
 */

#pragma once

/*!
 * Result type used across littleplanet.
 *
 * 0 is @ref LP_SUCCESS, negative values are errors.
 *
 * @see lp_result_str
 * @ingroup lp_iface
 */
typedef enum lp_result
{
	/*!
	 * The operation succeeded
	 */
	LP_SUCCESS = 0,

	/*!
	 * A source image or output canvas with a zero width or height, or a destination frame whose size does not
	 * match the canvas.
	 */
	LP_ERROR_INVALID_DIMENSIONS = -1,

	/*!
	 * The scale yields a projection sphere radius that is zero, negative or not finite.
	 */
	LP_ERROR_DEGENERATE_RADIUS = -2,

	/*!
	 * Offset or rotation values that are not finite.
	 */
	LP_ERROR_INVALID_PARAMETERS = -3,

	/*!
	 * The frame format can not be sampled, or written to, by the rasterizer.
	 */
	LP_ERROR_UNSUPPORTED_FORMAT = -4,

	/*!
	 * Could not allocate a frame or a worker pool.
	 */
	LP_ERROR_ALLOCATION = -5,
} lp_result_t;
