// Copyright 2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Edge clamped bilinear sampling of frames.
 * @ingroup projection
 */

#pragma once

#include "lp/lp_frame.h"


namespace lp::projection {

/*!
 * Read the pixel at @p x, @p y as RGB, L8 is expanded to grey.
 *
 * The coordinates must be inside the frame and the format must be one that
 * @ref u_format_is_rgb_readable accepts.
 */
lp_colour_rgb_u8
read_pixel(const lp_frame &frame, uint32_t x, uint32_t y);

/*!
 * Bilinearly sample @p frame at the fractional coordinate @p x, @p y.
 *
 * Coordinates are clamped to the frame, NaN clamps to zero. Integer
 * coordinates return the pixel unchanged.
 */
lp_colour_rgb_u8
sample_bilinear(const lp_frame &frame, float x, float y);

} // namespace lp::projection
