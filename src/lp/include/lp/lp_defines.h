// Copyright 2019-2024, Collabora, Ltd.
// SPDX-License-Identifier: BSL-1.0
/*!
 * @file
 * @brief  Plain value types shared by the C interface and the C++ code.
 * @ingroup lp_iface
 */

#pragma once

#include "lp/lp_compiler.h"
#include "lp/lp_results.h"

#ifdef __cplusplus
extern "C" {
#endif


//! First member of every reference counted object, see @ref lp_frame.
struct lp_reference
{
	lp_atomic_s32_t count;
};

static inline void
lp_reference_inc(struct lp_reference *lref)
{
	lp_atomic_s32_inc_return(&lref->count);
}

//! True when the last reference went away.
static inline bool
lp_reference_dec(struct lp_reference *lref)
{
	return lp_atomic_s32_dec_return(&lref->count) == 0;
}

/*!
 * Pixel layouts a source frame may have, canvases are always
 * @ref LP_FORMAT_R8G8B8. Alpha and padding bytes are ignored when sampling.
 */
enum lp_format
{
	LP_FORMAT_R8G8B8X8,
	LP_FORMAT_R8G8B8A8,
	LP_FORMAT_R8G8B8,
	//! Grey, sampled as R = G = B = L.
	LP_FORMAT_L8,
};

//! Canvas offset, fraction of the canvas size.
struct lp_vec2
{
	float x;
	float y;
};

//! Euler angles in radians: roll about X, pitch about Y, yaw about Z.
struct lp_vec3
{
	float x;
	float y;
	float z;
};

//! Sphere rotation, same layout as Eigen::Quaternionf coefficients.
struct lp_quat
{
	float x;
	float y;
	float z;
	float w;
};

struct lp_colour_rgb_u8
{
	uint8_t r;
	uint8_t g;
	uint8_t b;
};

//! Width and height in pixels, of a source image or a canvas.
struct lp_size
{
	uint32_t w;
	uint32_t h;
};


#ifdef __cplusplus
}
#endif
